#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>
#include <set>

using util::get_env_var;
using util::get_env_int;
using util::get_env_double;

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = get_env_var("SERVICE_NAME", "solrelay");
    config.log_level = get_env_var("LOG_LEVEL", "info");
    config.listen_addr = get_env_var("LISTEN_ADDR", "0.0.0.0");
    config.listen_port = get_env_int("LISTEN_PORT", 8090);

    // Providers
    config.routing_policy = parse_routing_policy(get_env_var("ROUTING_STRATEGY", "cost_optimized"));
    std::string providers_json = get_env_var("PROVIDERS_JSON");
    if (!providers_json.empty()) {
        try {
            config.providers = parse_providers(nlohmann::json::parse(providers_json));
        } catch (const nlohmann::json::exception& e) {
            throw GatewayError(ErrorCode::ValidationFailed,
                               fmt::format("PROVIDERS_JSON is not valid: {}", e.what()));
        }
    }

    // Rate limiting
    config.rate_limit_per_minute = get_env_int("RATE_LIMIT_PER_MINUTE", 100);
    config.rate_limit_window_seconds = get_env_int("RATE_LIMIT_WINDOW_SECONDS", 60);

    // Cache
    config.cache_ttl_hot_seconds = get_env_int("CACHE_TTL_HOT_SECONDS", 5);
    config.cache_ttl_warm_seconds = get_env_int("CACHE_TTL_WARM_SECONDS", 30);
    config.cache_ttl_cold_seconds = get_env_int("CACHE_TTL_COLD_SECONDS", 300);
    config.cache_ttl_frozen_seconds = get_env_int("CACHE_TTL_FROZEN_SECONDS", 3600);
    config.cache_max_entries = get_env_int("CACHE_MAX_ENTRIES", 10000);
    config.cache_sweep_seconds = get_env_int("CACHE_SWEEP_SECONDS", 30);

    // Circuit breaker and retries
    config.circuit_failure_threshold = get_env_int("CIRCUIT_FAILURE_THRESHOLD", 5);
    config.circuit_cooldown_ms = get_env_int("CIRCUIT_COOLDOWN_MS", 30000);
    config.retry_max = get_env_int("RETRY_MAX", 3);
    config.retry_base_ms = get_env_int("RETRY_BASE_MS", 100);
    config.retry_max_delay_ms = get_env_int("RETRY_MAX_DELAY_MS", 5000);
    config.retry_jitter = get_env_double("RETRY_JITTER", 0.25);
    config.provider_timeout_ms = get_env_int("PROVIDER_TIMEOUT_MS", 10000);
    config.cascade_provider_stages = get_env_int("CASCADE_PROVIDER_STAGES", 2);

    // Usage
    config.quota_reset_mode = get_env_var("QUOTA_RESET_MODE", "calendar_month_utc");
    config.usage_alert_fraction = get_env_double("USAGE_ALERT_FRACTION", 0.8);
    config.usage_state_file = get_env_var("USAGE_STATE_FILE");

    // Ingestion
    config.webhook_secret = get_env_var("WEBHOOK_SECRET");
    config.dedup_window_seconds = get_env_int("DEDUP_WINDOW_SECONDS", 300);
    config.redis_url = get_env_var("REDIS_URL");

    // Dispatch targets: "url|timeout_ms,url|timeout_ms"
    config.dispatch_targets = parse_dispatch_targets(get_env_var("DISPATCH_TARGETS"));
    config.dispatch_global_timeout_ms = get_env_int("DISPATCH_GLOBAL_TIMEOUT_MS", 2000);

    // Extraction
    config.large_volume_usd = get_env_double("LARGE_VOLUME_USD", 1000.0);
    config.volume_ceiling_usd = get_env_double("VOLUME_CEILING_USD", 100000.0);
    config.sol_price_usd = get_env_double("SOL_PRICE_USD", 150.0);
    std::string prices_json = get_env_var("TOKEN_PRICES_JSON");
    if (!prices_json.empty()) {
        try {
            for (const auto& [mint, price] : nlohmann::json::parse(prices_json).items()) {
                config.token_prices_usd[mint] = price.get<double>();
            }
        } catch (const nlohmann::json::exception& e) {
            throw GatewayError(ErrorCode::ValidationFailed,
                               fmt::format("TOKEN_PRICES_JSON is not valid: {}", e.what()));
        }
    }
    std::string programs = get_env_var("NEW_LISTING_PROGRAMS");
    if (!programs.empty()) {
        config.new_listing_programs = util::split_string(programs, ',');
    }
    config.high_fee_lamports = static_cast<uint64_t>(get_env_double("HIGH_FEE_LAMPORTS", 100000));

    config.health_probe_seconds = get_env_int("HEALTH_PROBE_SECONDS", 300);

    std::string config_file = get_env_var("CONFIG_FILE");
    if (!config_file.empty()) {
        std::ifstream in(config_file);
        if (!in) {
            throw GatewayError(ErrorCode::ValidationFailed,
                               "Cannot open CONFIG_FILE " + config_file);
        }
        try {
            config.apply_json(nlohmann::json::parse(in));
        } catch (const nlohmann::json::exception& e) {
            throw GatewayError(ErrorCode::ValidationFailed,
                               fmt::format("CONFIG_FILE {} is not valid: {}", config_file, e.what()));
        }
        spdlog::info("Loaded configuration overlay from {}", config_file);
    }

    return config;
}

void Config::apply_json(const nlohmann::json& j) {
    service_name = j.value("service_name", service_name);
    log_level = j.value("log_level", log_level);
    listen_addr = j.value("listen_addr", listen_addr);
    listen_port = j.value("listen_port", listen_port);

    if (j.contains("routing_strategy")) {
        routing_policy = parse_routing_policy(j["routing_strategy"].get<std::string>());
    }
    if (j.contains("providers")) {
        providers = parse_providers(j["providers"]);
    }

    rate_limit_per_minute = j.value("rate_limit_per_minute", rate_limit_per_minute);
    rate_limit_window_seconds = j.value("rate_limit_window_seconds", rate_limit_window_seconds);

    cache_ttl_hot_seconds = j.value("cache_ttl_hot_seconds", cache_ttl_hot_seconds);
    cache_ttl_warm_seconds = j.value("cache_ttl_warm_seconds", cache_ttl_warm_seconds);
    cache_ttl_cold_seconds = j.value("cache_ttl_cold_seconds", cache_ttl_cold_seconds);
    cache_ttl_frozen_seconds = j.value("cache_ttl_frozen_seconds", cache_ttl_frozen_seconds);
    cache_max_entries = j.value("cache_max_entries", cache_max_entries);
    cache_sweep_seconds = j.value("cache_sweep_seconds", cache_sweep_seconds);

    circuit_failure_threshold = j.value("circuit_failure_threshold", circuit_failure_threshold);
    circuit_cooldown_ms = j.value("circuit_cooldown_ms", circuit_cooldown_ms);
    retry_max = j.value("retry_max", retry_max);
    retry_base_ms = j.value("retry_base_ms", retry_base_ms);
    retry_max_delay_ms = j.value("retry_max_delay_ms", retry_max_delay_ms);
    retry_jitter = j.value("retry_jitter", retry_jitter);
    provider_timeout_ms = j.value("provider_timeout_ms", provider_timeout_ms);
    cascade_provider_stages = j.value("cascade_provider_stages", cascade_provider_stages);

    quota_reset_mode = j.value("quota_reset_mode", quota_reset_mode);
    usage_alert_fraction = j.value("usage_alert_fraction", usage_alert_fraction);
    usage_state_file = j.value("usage_state_file", usage_state_file);

    webhook_secret = j.value("webhook_secret", webhook_secret);
    dedup_window_seconds = j.value("dedup_window_seconds", dedup_window_seconds);
    redis_url = j.value("redis_url", redis_url);

    if (j.contains("dispatch_targets")) {
        dispatch_targets.clear();
        for (const auto& t : j["dispatch_targets"]) {
            if (t.is_string()) {
                auto parsed = parse_dispatch_targets(t.get<std::string>());
                dispatch_targets.insert(dispatch_targets.end(), parsed.begin(), parsed.end());
            } else {
                DispatchTargetConfig target;
                target.url = t.at("url").get<std::string>();
                target.timeout_ms = t.value("timeout_ms", target.timeout_ms);
                dispatch_targets.push_back(target);
            }
        }
    }
    dispatch_global_timeout_ms = j.value("dispatch_global_timeout_ms", dispatch_global_timeout_ms);

    large_volume_usd = j.value("large_volume_usd", large_volume_usd);
    volume_ceiling_usd = j.value("volume_ceiling_usd", volume_ceiling_usd);
    sol_price_usd = j.value("sol_price_usd", sol_price_usd);
    if (j.contains("token_prices")) {
        for (const auto& [mint, price] : j["token_prices"].items()) {
            token_prices_usd[mint] = price.get<double>();
        }
    }
    if (j.contains("new_listing_programs")) {
        new_listing_programs = j["new_listing_programs"].get<std::vector<std::string>>();
    }
    high_fee_lamports = j.value("high_fee_lamports", high_fee_lamports);

    health_probe_seconds = j.value("health_probe_seconds", health_probe_seconds);
}

void Config::validate() const {
    auto fail = [](const std::string& message) {
        throw GatewayError(ErrorCode::ValidationFailed, message);
    };

    if (webhook_secret.empty()) {
        fail("WEBHOOK_SECRET is required");
    }

    if (providers.empty()) {
        fail("At least one provider must be configured (PROVIDERS_JSON or config file)");
    }

    std::set<std::string> ids;
    for (const auto& p : providers) {
        if (p.id.empty() || p.endpoint.empty()) {
            fail("Provider entries need a non-empty id and endpoint");
        }
        if (!ids.insert(p.id).second) {
            fail("Duplicate provider id: " + p.id);
        }
        if (p.monthly_quota == 0) {
            fail("Provider " + p.id + " needs a positive monthly_quota");
        }
        if (p.priority < 1 || p.priority > 10) {
            fail("Provider " + p.id + " priority must be between 1 and 10");
        }
        if (p.cost_per_request < 0.0 || p.rpm_limit < 0) {
            fail("Provider " + p.id + " has a negative cost or rpm limit");
        }
    }

    if (listen_port <= 0 || listen_port > 65535) {
        fail("LISTEN_PORT must be between 1 and 65535");
    }

    if (rate_limit_per_minute <= 0 || rate_limit_window_seconds <= 0) {
        fail("Rate limit settings must be positive");
    }

    if (cache_ttl_hot_seconds <= 0 ||
        !(cache_ttl_hot_seconds < cache_ttl_warm_seconds &&
          cache_ttl_warm_seconds < cache_ttl_cold_seconds &&
          cache_ttl_cold_seconds < cache_ttl_frozen_seconds)) {
        fail("Cache TTLs must be positive and strictly increasing hot < warm < cold < frozen");
    }

    if (cache_max_entries <= 0 || cache_sweep_seconds <= 0) {
        fail("CACHE_MAX_ENTRIES and CACHE_SWEEP_SECONDS must be positive");
    }

    if (circuit_failure_threshold <= 0 || circuit_cooldown_ms <= 0) {
        fail("Circuit breaker threshold and cooldown must be positive");
    }

    if (retry_max < 0 || retry_base_ms <= 0 || retry_max_delay_ms < retry_base_ms) {
        fail("Retry settings are invalid (RETRY_MAX >= 0, 0 < RETRY_BASE_MS <= RETRY_MAX_DELAY_MS)");
    }

    if (retry_jitter < 0.0 || retry_jitter >= 1.0) {
        fail("RETRY_JITTER must be in [0, 1)");
    }

    if (provider_timeout_ms <= 0 || cascade_provider_stages <= 0) {
        fail("PROVIDER_TIMEOUT_MS and CASCADE_PROVIDER_STAGES must be positive");
    }

    if (quota_reset_mode != "calendar_month_utc" && quota_reset_mode != "rolling_30d") {
        fail("QUOTA_RESET_MODE must be calendar_month_utc or rolling_30d");
    }

    if (usage_alert_fraction <= 0.0 || usage_alert_fraction > 1.0) {
        fail("USAGE_ALERT_FRACTION must be in (0, 1]");
    }

    if (dedup_window_seconds <= 0) {
        fail("DEDUP_WINDOW_SECONDS must be positive");
    }

    for (const auto& t : dispatch_targets) {
        if (!util::starts_with(t.url, "http://") && !util::starts_with(t.url, "https://") &&
            !util::starts_with(t.url, "redis://")) {
            fail("Unsupported dispatch target scheme: " + t.url);
        }
        if (t.timeout_ms <= 0) {
            fail("Dispatch target timeout must be positive: " + t.url);
        }
    }

    if (dispatch_global_timeout_ms <= 0) {
        fail("DISPATCH_GLOBAL_TIMEOUT_MS must be positive");
    }

    if (large_volume_usd <= 0.0 || volume_ceiling_usd <= 0.0 || sol_price_usd <= 0.0 ||
        high_fee_lamports == 0) {
        fail("Extraction thresholds must be positive");
    }

    if (health_probe_seconds < 0) {
        fail("HEALTH_PROBE_SECONDS must not be negative");
    }

    spdlog::info("Configuration validated successfully");
}

std::vector<Provider> Config::parse_providers(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw GatewayError(ErrorCode::ValidationFailed, "Provider list must be a JSON array");
    }

    std::vector<Provider> providers;
    for (const auto& entry : j) {
        providers.push_back(Provider::from_json(entry));
    }
    return providers;
}

std::vector<DispatchTargetConfig> Config::parse_dispatch_targets(const std::string& list) {
    std::vector<DispatchTargetConfig> targets;

    for (const auto& item : util::split_string(list, ',')) {
        DispatchTargetConfig target;
        auto bar = item.rfind('|');
        if (bar == std::string::npos) {
            target.url = item;
        } else {
            target.url = util::trim(item.substr(0, bar));
            try {
                target.timeout_ms = std::stoi(item.substr(bar + 1));
            } catch (const std::exception&) {
                throw GatewayError(ErrorCode::ValidationFailed,
                                   "Invalid dispatch target timeout: " + item);
            }
        }
        targets.push_back(target);
    }

    return targets;
}
