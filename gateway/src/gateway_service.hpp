#pragma once
#include "cache_layer.hpp"
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "dedup_store.hpp"
#include "event_dispatcher.hpp"
#include "metrics_collector.hpp"
#include "provider_gateway.hpp"
#include "provider_registry.hpp"
#include "provider_transport.hpp"
#include "rate_limiter.hpp"
#include "request_router.hpp"
#include "resilient_executor.hpp"
#include "signal_extractor.hpp"
#include "usage_tracker.hpp"
#include "webhook_ingestor.hpp"
#include "webhook_server.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>

class GatewayService {
public:
    explicit GatewayService(const Config& config);
    ~GatewayService();

    // Serves webhooks and runs maintenance until stop() is called
    void run();
    void stop();

    ProviderGateway& provider_gateway() { return *provider_gateway_; }

    nlohmann::json metrics_json();
    nlohmann::json health_json();

private:
    void maintenance_tick();
    void probe_provider_health();
    void save_usage_state();

    const Config config_;
    SystemClock clock_;
    MetricsCollector metrics_;

    // Outbound side
    ProviderRegistry registry_;
    UsageTracker usage_;
    CircuitBreakerBank breakers_;
    CacheLayer cache_;
    RequestRouter router_;
    std::unique_ptr<ProviderTransport> transport_;
    std::unique_ptr<ResilientExecutor> executor_;
    std::unique_ptr<ProviderGateway> provider_gateway_;

    // Inbound side
    RateLimiter limiter_;
    std::unique_ptr<DedupStore> dedup_;
    SignalExtractor extractor_;
    std::unique_ptr<EventDispatcher> dispatcher_;
    std::unique_ptr<WebhookIngestor> ingestor_;
    std::unique_ptr<WebhookServer> server_;

    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point last_sweep_;
    std::chrono::steady_clock::time_point last_probe_;
    std::chrono::steady_clock::time_point last_state_save_;
};
