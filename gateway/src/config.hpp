#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

struct DispatchTargetConfig {
    std::string url;
    int timeout_ms = 1000;
};

class Config {
public:
    // Service info
    std::string service_name = "solrelay";
    std::string log_level = "info";
    std::string listen_addr = "0.0.0.0";
    int listen_port = 8090;

    // Providers and routing
    RoutingPolicy routing_policy = RoutingPolicy::CostOptimized;
    std::vector<Provider> providers;

    // Ingress rate limiting
    int rate_limit_per_minute = 100;
    int rate_limit_window_seconds = 60;

    // Cache TTLs per volatility tier
    int cache_ttl_hot_seconds = 5;
    int cache_ttl_warm_seconds = 30;
    int cache_ttl_cold_seconds = 300;
    int cache_ttl_frozen_seconds = 3600;
    int cache_max_entries = 10000;
    int cache_sweep_seconds = 30;

    // Circuit breaker
    int circuit_failure_threshold = 5;
    int circuit_cooldown_ms = 30000;

    // Retry / backoff
    int retry_max = 3;
    int retry_base_ms = 100;
    int retry_max_delay_ms = 5000;
    double retry_jitter = 0.25;

    // Executor
    int provider_timeout_ms = 10000;
    int cascade_provider_stages = 2;

    // Usage accounting
    std::string quota_reset_mode = "calendar_month_utc";
    double usage_alert_fraction = 0.8;
    std::string usage_state_file;

    // Webhook ingestion
    std::string webhook_secret;
    int dedup_window_seconds = 300;
    std::string redis_url;

    // Dispatch
    std::vector<DispatchTargetConfig> dispatch_targets;
    int dispatch_global_timeout_ms = 2000;

    // Signal extraction
    double large_volume_usd = 1000.0;
    double volume_ceiling_usd = 100000.0;
    double sol_price_usd = 150.0;
    std::map<std::string, double> token_prices_usd = {
        {"EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v", 1.0},   // USDC
        {"Es9vMFrzaCERmJfrF4H2FYD4KCoNkY11McCe8BenwNYB", 1.0}    // USDT
    };
    std::vector<std::string> new_listing_programs = {
        "6EF8rrecthR5Dkzon8Nwu78hRvfCKubJ14M5uBEwF6P",           // pump.fun
        "675kPX9MHTjS2zt1qfr1NYHuzeLXfQM9H24wFSUt1Mp8"            // Raydium AMM v4
    };
    uint64_t high_fee_lamports = 100000;

    // Background maintenance
    int health_probe_seconds = 300;

    static Config from_env();

    // Overlays keys from a JSON document (same names as the env vars, lower case)
    void apply_json(const nlohmann::json& j);

    // Throws GatewayError(ValidationFailed) on the first invalid setting
    void validate() const;

    static std::vector<Provider> parse_providers(const nlohmann::json& j);
    static std::vector<DispatchTargetConfig> parse_dispatch_targets(const std::string& list);
};
