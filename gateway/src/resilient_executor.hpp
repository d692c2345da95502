#pragma once
#include "circuit_breaker.hpp"
#include "clock.hpp"
#include "metrics_collector.hpp"
#include "provider_registry.hpp"
#include "provider_transport.hpp"
#include "request_router.hpp"
#include "retry_schedule.hpp"
#include "usage_tracker.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ExecutorSettings {
    RetryPolicy retry;
    std::chrono::milliseconds call_timeout{10000};
    int provider_stages = 2;
};

// Mutable state threaded through the cascade for one logical call
struct ExecutionContext {
    OperationDescriptor descriptor;
    int attempts = 0;
    std::string last_error;
    std::optional<ErrorCode> last_error_code;
};

class CallStrategy {
public:
    virtual ~CallStrategy() = default;

    virtual const std::string& name() const = 0;

    // A result ends the cascade; nullopt hands over to the next strategy
    virtual std::optional<CallResult> attempt(const RpcRequest& request, ExecutionContext& ctx) = 0;
};

class RoutedProviderStrategy : public CallStrategy {
public:
    RoutedProviderStrategy(std::string name, RequestRouter& router, ProviderRegistry& registry,
                           UsageTracker& usage, CircuitBreakerBank& breakers,
                           ProviderTransport& transport, Clock& clock, MetricsCollector& metrics,
                           const ExecutorSettings& settings);

    const std::string& name() const override { return name_; }

    std::optional<CallResult> attempt(const RpcRequest& request, ExecutionContext& ctx) override;

private:
    const std::string name_;
    RequestRouter& router_;
    ProviderRegistry& registry_;
    UsageTracker& usage_;
    CircuitBreakerBank& breakers_;
    ProviderTransport& transport_;
    Clock& clock_;
    MetricsCollector& metrics_;
    const ExecutorSettings settings_;
};

// Last stage: answers with a flagged synthetic payload instead of failing
class MockResponderStrategy : public CallStrategy {
public:
    explicit MockResponderStrategy(MetricsCollector& metrics);

    const std::string& name() const override { return name_; }

    std::optional<CallResult> attempt(const RpcRequest& request, ExecutionContext& ctx) override;

private:
    const std::string name_ = "mock";
    MetricsCollector& metrics_;
};

class ResilientExecutor {
public:
    // Builds the default cascade: provider_stages routed stages, then the mock responder
    ResilientExecutor(RequestRouter& router, ProviderRegistry& registry, UsageTracker& usage,
                      CircuitBreakerBank& breakers, ProviderTransport& transport, Clock& clock,
                      MetricsCollector& metrics, const ExecutorSettings& settings);

    explicit ResilientExecutor(std::vector<std::unique_ptr<CallStrategy>> strategies);

    // Always returns a result; degraded when every provider stage failed
    CallResult execute(const RpcRequest& request);

    std::vector<std::string> stage_names() const;

    static uint64_t next_request_id();

private:
    std::vector<std::unique_ptr<CallStrategy>> strategies_;
};
