#include "gateway_service.hpp"
#include "util.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <thread>

namespace {

constexpr auto kStateSaveInterval = std::chrono::seconds(60);
constexpr auto kProbeTimeout = std::chrono::milliseconds(5000);

CacheTtls cache_ttls(const Config& config) {
    CacheTtls ttls;
    ttls.hot = std::chrono::seconds(config.cache_ttl_hot_seconds);
    ttls.warm = std::chrono::seconds(config.cache_ttl_warm_seconds);
    ttls.cold = std::chrono::seconds(config.cache_ttl_cold_seconds);
    ttls.frozen = std::chrono::seconds(config.cache_ttl_frozen_seconds);
    return ttls;
}

CircuitBreakerSettings breaker_settings(const Config& config) {
    CircuitBreakerSettings settings;
    settings.failure_threshold = config.circuit_failure_threshold;
    settings.cooldown = std::chrono::milliseconds(config.circuit_cooldown_ms);
    return settings;
}

ExecutorSettings executor_settings(const Config& config) {
    ExecutorSettings settings;
    settings.retry.max_retries = config.retry_max;
    settings.retry.base_delay = std::chrono::milliseconds(config.retry_base_ms);
    settings.retry.max_delay = std::chrono::milliseconds(config.retry_max_delay_ms);
    settings.retry.jitter_factor = config.retry_jitter;
    settings.call_timeout = std::chrono::milliseconds(config.provider_timeout_ms);
    settings.provider_stages = config.cascade_provider_stages;
    return settings;
}

ExtractionSettings extraction_settings(const Config& config) {
    ExtractionSettings settings;
    settings.large_volume_usd = config.large_volume_usd;
    settings.volume_ceiling_usd = config.volume_ceiling_usd;
    settings.sol_price_usd = config.sol_price_usd;
    settings.token_prices_usd = config.token_prices_usd;
    settings.new_listing_programs.insert(config.new_listing_programs.begin(),
                                         config.new_listing_programs.end());
    settings.high_fee_lamports = config.high_fee_lamports;
    return settings;
}

std::unique_ptr<DedupStore> make_dedup_store(const Config& config, const Clock& clock) {
    const auto window = std::chrono::seconds(config.dedup_window_seconds);
    if (config.redis_url.empty()) {
        spdlog::info("Using in-process dedup window of {}s", config.dedup_window_seconds);
        return std::make_unique<InMemoryDedupStore>(window, clock);
    }

    // redis++ expects tcp:// URIs
    std::string uri = config.redis_url;
    if (util::starts_with(uri, "redis://")) {
        uri = "tcp://" + uri.substr(std::string("redis://").size());
    }
    auto redis = std::make_shared<sw::redis::Redis>(uri);
    spdlog::info("Using Redis dedup window of {}s at {}", config.dedup_window_seconds, config.redis_url);
    return std::make_unique<RedisDedupStore>(std::move(redis), window);
}

}

GatewayService::GatewayService(const Config& config)
    : config_(config),
      registry_(config.providers),
      usage_(registry_, clock_, parse_quota_reset_mode(config.quota_reset_mode), config.usage_alert_fraction),
      breakers_(config.providers, breaker_settings(config), clock_),
      cache_(cache_ttls(config), static_cast<size_t>(config.cache_max_entries), clock_),
      router_(registry_, usage_, breakers_, config.routing_policy),
      limiter_(config.rate_limit_per_minute, std::chrono::seconds(config.rate_limit_window_seconds), clock_),
      extractor_(extraction_settings(config)),
      last_sweep_(std::chrono::steady_clock::now()),
      last_probe_(std::chrono::steady_clock::now()),
      last_state_save_(std::chrono::steady_clock::now()) {

    if (!config_.usage_state_file.empty()) {
        usage_.load_state(config_.usage_state_file);
    }

    transport_ = std::make_unique<HttpProviderTransport>();
    executor_ = std::make_unique<ResilientExecutor>(router_, registry_, usage_, breakers_, *transport_,
                                                    clock_, metrics_, executor_settings(config));
    provider_gateway_ = std::make_unique<ProviderGateway>(cache_, *executor_, metrics_);

    dedup_ = make_dedup_store(config, clock_);

    std::vector<std::shared_ptr<DispatchTarget>> targets;
    for (const auto& target : config.dispatch_targets) {
        targets.push_back(make_dispatch_target(target));
    }
    dispatcher_ = std::make_unique<EventDispatcher>(
        std::move(targets), std::chrono::milliseconds(config.dispatch_global_timeout_ms), &metrics_);

    ingestor_ = std::make_unique<WebhookIngestor>(config.webhook_secret, limiter_, *dedup_, extractor_,
                                                  *dispatcher_, metrics_, clock_);

    server_ = std::make_unique<WebhookServer>(
        config_, *ingestor_,
        [this]() { return metrics_json(); },
        [this]() { return health_json(); });

    auto stages = executor_->stage_names();
    spdlog::info("Gateway ready: {} providers, routing {}, cascade of {} stages",
                 registry_.size(), to_string(config.routing_policy), stages.size());
}

GatewayService::~GatewayService() {
    stop();
    if (server_) {
        server_->stop();
    }
}

void GatewayService::run() {
    running_ = true;
    server_->start();
    spdlog::info("{} service started", config_.service_name);

    while (running_) {
        try {
            maintenance_tick();
        } catch (const std::exception& e) {
            spdlog::error("Error in maintenance tick: {}", e.what());
        }

        auto wake_up_time = std::chrono::steady_clock::now() + std::chrono::seconds(1);
        while (running_ && std::chrono::steady_clock::now() < wake_up_time) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    server_->stop();
    save_usage_state();
    spdlog::info("{} service run loop finished", config_.service_name);
}

void GatewayService::stop() {
    running_ = false;
}

void GatewayService::maintenance_tick() {
    auto now = std::chrono::steady_clock::now();

    if (now - last_sweep_ >= std::chrono::seconds(config_.cache_sweep_seconds)) {
        size_t expired = cache_.sweep_expired();
        limiter_.cleanup_old_entries();
        dedup_->cleanup();
        last_sweep_ = now;
        spdlog::debug("Maintenance sweep: {} cache entries expired, {} sources tracked",
                      expired, limiter_.tracked_sources());
    }

    usage_.reset_expired_periods();

    if (now - last_state_save_ >= kStateSaveInterval) {
        save_usage_state();
        last_state_save_ = now;
    }

    if (config_.health_probe_seconds > 0 &&
        now - last_probe_ >= std::chrono::seconds(config_.health_probe_seconds)) {
        probe_provider_health();
        last_probe_ = now;
    }
}

void GatewayService::probe_provider_health() {
    for (const auto& provider : registry_.list_providers()) {
        if (breakers_.state(provider.id) == CircuitState::Open) {
            continue;
        }
        UsageReservation reservation;
        if (usage_.record_usage(provider.id, provider.cost_per_request, &reservation) != UsageResult::Accepted) {
            continue;
        }

        auto body = build_rpc_request(ResilientExecutor::next_request_id(), "getHealth", nullptr).dump();
        auto response = transport_->post(provider, body, kProbeTimeout);
        auto outcome = interpret_rpc_response(response);
        if (!response.reached) {
            usage_.release_usage(reservation);
        }

        bool healthy = outcome.success && outcome.result.is_string() && outcome.result.get<std::string>() == "ok";
        registry_.record_outcome(provider.id, healthy, static_cast<double>(response.latency.count()));
        if (!healthy) {
            spdlog::warn("Health probe for {} failed: {}", provider.id,
                         outcome.error.empty() ? outcome.result.dump() : outcome.error);
        }
    }
}

void GatewayService::save_usage_state() {
    if (!config_.usage_state_file.empty()) {
        usage_.save_state(config_.usage_state_file);
    }
}

nlohmann::json GatewayService::metrics_json() {
    auto j = metrics_.to_json();

    nlohmann::json usage = nlohmann::json::object();
    for (const auto& snap : usage_.snapshots()) {
        usage[snap.provider_id] = snap.to_json();
    }
    j["usage"] = usage;
    j["circuits"] = breakers_.to_json();

    auto cache_stats = cache_.stats().to_json();
    for (const auto& [key, value] : cache_stats.items()) {
        if (!j["cache"].contains(key)) {
            j["cache"][key] = value;
        }
    }

    j["routing_strategy"] = to_string(router_.default_policy());
    j["timestamp"] = util::current_iso8601();
    return j;
}

nlohmann::json GatewayService::health_json() {
    nlohmann::json providers = nlohmann::json::object();
    for (const auto& p : registry_.list_providers()) {
        providers[p.id] = {
            {"health", to_string(p.health)},
            {"circuit", to_string(breakers_.state(p.id))},
            {"success_rate", p.success_rate},
            {"avg_latency_ms", p.avg_latency_ms},
            {"remaining_quota", usage_.remaining_fraction(p.id)}
        };
    }

    return nlohmann::json{
        {"status", "ok"},
        {"service", config_.service_name},
        {"timestamp", util::current_iso8601()},
        {"providers", providers},
        {"dedup", dedup_->kind()},
        {"dispatch_targets", dispatcher_->target_count()}
    };
}
