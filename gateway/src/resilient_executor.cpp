#include "resilient_executor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

std::atomic<uint64_t> g_request_id{1};

std::string stage_name(int index) {
    if (index == 0) return "primary";
    if (index == 1) return "fallback";
    return fmt::format("fallback_{}", index);
}

}

RoutedProviderStrategy::RoutedProviderStrategy(std::string name, RequestRouter& router,
                                               ProviderRegistry& registry, UsageTracker& usage,
                                               CircuitBreakerBank& breakers,
                                               ProviderTransport& transport, Clock& clock,
                                               MetricsCollector& metrics,
                                               const ExecutorSettings& settings)
    : name_(std::move(name)),
      router_(router),
      registry_(registry),
      usage_(usage),
      breakers_(breakers),
      transport_(transport),
      clock_(clock),
      metrics_(metrics),
      settings_(settings) {
}

std::optional<CallResult> RoutedProviderStrategy::attempt(const RpcRequest& request,
                                                          ExecutionContext& ctx) {
    auto provider = router_.select(ctx.descriptor, request.policy);
    if (!provider) {
        ctx.last_error = fmt::format("no eligible provider for {}", request.method);
        ctx.last_error_code = ErrorCode::ProviderUnavailable;
        return std::nullopt;
    }

    CircuitBreaker* breaker = breakers_.get(provider->id);
    RetrySchedule schedule(settings_.retry);
    const std::string body = build_rpc_request(ResilientExecutor::next_request_id(),
                                               request.method, request.params).dump();

    while (true) {
        UsageReservation reservation;
        auto usage_result = usage_.record_usage(provider->id, provider->cost_per_request, &reservation);
        if (usage_result != UsageResult::Accepted) {
            ctx.last_error = fmt::format("{} usage rejected: {}", provider->id, to_string(usage_result));
            ctx.last_error_code = ErrorCode::QuotaExceeded;
            break;
        }

        if (!breaker || !breaker->try_acquire()) {
            usage_.release_usage(reservation);
            ctx.last_error = fmt::format("{} circuit open", provider->id);
            ctx.last_error_code = ErrorCode::CircuitOpen;
            break;
        }

        ctx.attempts++;
        auto response = transport_.post(*provider, body, settings_.call_timeout);
        auto outcome = interpret_rpc_response(response);
        const double latency_ms = static_cast<double>(response.latency.count());

        registry_.record_outcome(provider->id, outcome.success, latency_ms);
        metrics_.record_provider_call(provider->id, outcome.success, latency_ms);

        if (outcome.success) {
            breaker->record_success();

            CallResult result;
            result.status = CallStatus::Success;
            result.payload = std::move(outcome.result);
            result.provider_id = provider->id;
            result.stage = name_;
            result.attempts = ctx.attempts;
            return result;
        }

        breaker->record_failure();
        if (!response.reached) {
            usage_.release_usage(reservation);
        }

        ctx.last_error = fmt::format("{}: {}", provider->id, outcome.error);
        ctx.last_error_code = response.timed_out ? ErrorCode::DownstreamTimeout
                                                 : ErrorCode::ProviderUnavailable;
        spdlog::warn("{} call {} via {} failed (retry {}/{}): {}", name_, request.method,
                     provider->id, schedule.retries(), settings_.retry.max_retries, outcome.error);

        if (!schedule.can_retry()) {
            break;
        }
        if (breaker->state() == CircuitState::Open) {
            spdlog::warn("Circuit for {} opened, abandoning retries", provider->id);
            break;
        }

        clock_.sleep_for(schedule.next_delay());
    }

    ctx.descriptor.excluded.insert(provider->id);
    metrics_.record_failover(provider->id);
    return std::nullopt;
}

MockResponderStrategy::MockResponderStrategy(MetricsCollector& metrics)
    : metrics_(metrics) {
}

std::optional<CallResult> MockResponderStrategy::attempt(const RpcRequest& request,
                                                         ExecutionContext& ctx) {
    const std::string reason = ctx.last_error.empty() ? "no provider stage succeeded" : ctx.last_error;

    CallResult result;
    result.status = CallStatus::Degraded;
    result.payload = {
        {"degraded", true},
        {"method", request.method},
        {"reason", reason},
        {"result", nullptr},
        {"generated_at", util::current_iso8601()}
    };
    result.provider_id = name_;
    result.stage = name_;
    result.attempts = ctx.attempts;
    result.error = reason;
    result.error_code = ErrorCode::DegradedResult;

    metrics_.record_degraded_result();
    spdlog::warn("Serving degraded result for {} after {} attempts: {}",
                 request.method, ctx.attempts, reason);
    return result;
}

ResilientExecutor::ResilientExecutor(RequestRouter& router, ProviderRegistry& registry,
                                     UsageTracker& usage, CircuitBreakerBank& breakers,
                                     ProviderTransport& transport, Clock& clock,
                                     MetricsCollector& metrics, const ExecutorSettings& settings) {
    for (int i = 0; i < settings.provider_stages; ++i) {
        strategies_.push_back(std::make_unique<RoutedProviderStrategy>(
            stage_name(i), router, registry, usage, breakers, transport, clock, metrics, settings));
    }
    strategies_.push_back(std::make_unique<MockResponderStrategy>(metrics));
}

ResilientExecutor::ResilientExecutor(std::vector<std::unique_ptr<CallStrategy>> strategies)
    : strategies_(std::move(strategies)) {
}

CallResult ResilientExecutor::execute(const RpcRequest& request) {
    ExecutionContext ctx;
    ctx.descriptor = OperationDescriptor::from_request(request);

    for (auto& strategy : strategies_) {
        try {
            if (auto result = strategy->attempt(request, ctx)) {
                return *result;
            }
        } catch (const std::exception& e) {
            ctx.last_error = fmt::format("{} stage raised: {}", strategy->name(), e.what());
            ctx.last_error_code = ErrorCode::ProviderUnavailable;
            spdlog::error("Cascade stage {} failed for {}: {}", strategy->name(), request.method, e.what());
        }
    }

    CallResult result;
    result.status = CallStatus::Error;
    result.attempts = ctx.attempts;
    result.error = ctx.last_error.empty() ? "cascade exhausted" : ctx.last_error;
    result.error_code = ctx.last_error_code.value_or(ErrorCode::ProviderUnavailable);
    return result;
}

std::vector<std::string> ResilientExecutor::stage_names() const {
    std::vector<std::string> names;
    for (const auto& s : strategies_) {
        names.push_back(s->name());
    }
    return names;
}

uint64_t ResilientExecutor::next_request_id() {
    return g_request_id++;
}
