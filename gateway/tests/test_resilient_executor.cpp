#include "test_support.hpp"
#include "../src/cache_layer.hpp"
#include "../src/provider_gateway.hpp"
#include "../src/resilient_executor.hpp"

namespace {

using Reply = ScriptedTransport::Reply;

struct ExecutorFixture {
    ManualClock clock;
    ProviderRegistry registry;
    UsageTracker usage;
    CircuitBreakerBank breakers;
    RequestRouter router;
    ScriptedTransport transport;
    MetricsCollector metrics;
    ResilientExecutor executor;

    ExecutorFixture(const std::vector<Provider>& providers, int failure_threshold, int max_retries)
        : registry(providers),
          usage(registry, clock),
          breakers(providers, CircuitBreakerSettings{failure_threshold, std::chrono::milliseconds(30000)}, clock),
          router(registry, usage, breakers, RoutingPolicy::CostOptimized),
          executor(router, registry, usage, breakers, transport, clock, metrics, settings(max_retries)) {}

    static ExecutorSettings settings(int max_retries) {
        ExecutorSettings s;
        s.retry.max_retries = max_retries;
        s.retry.base_delay = std::chrono::milliseconds(100);
        s.retry.max_delay = std::chrono::milliseconds(5000);
        s.retry.jitter_factor = 0.25;
        s.provider_stages = 2;
        return s;
    }
};

RpcRequest request(const std::string& method, nlohmann::json params = nlohmann::json::array()) {
    RpcRequest r;
    r.method = method;
    r.params = std::move(params);
    return r;
}

// Fails every call with a runtime error
class ThrowingStrategy : public CallStrategy {
public:
    const std::string& name() const override { return name_; }
    std::optional<CallResult> attempt(const RpcRequest&, ExecutionContext&) override {
        throw std::runtime_error("stage blew up");
    }

private:
    const std::string name_ = "throwing";
};

}

void test_all_circuits_open_degrades() {
    ExecutorFixture f({make_provider("free", 0.0), make_provider("paid", 1.0)}, 1, 3);
    f.breakers.get("free")->record_failure();
    f.breakers.get("paid")->record_failure();

    CallResult result;
    bool threw = false;
    try {
        result = f.executor.execute(request("getSlot"));
    } catch (const std::exception&) {
        threw = true;
    }

    assert(!threw && "Executor never throws");
    assert(result.degraded() && "Flagged degraded result");
    assert(result.payload["degraded"] == true);
    assert(result.payload["method"] == "getSlot");
    assert(result.stage == "mock");
    assert(result.error_code == ErrorCode::DegradedResult);
    assert(f.transport.total_calls() == 0 && "No real call while circuits are open");
    assert(f.metrics.degraded_results() == 1);
}

void test_retries_back_off_exponentially() {
    ExecutorFixture f({make_provider("flaky", 0.0)}, 10, 3);
    f.transport.always("flaky", Reply::HttpError);

    auto result = f.executor.execute(request("getBalance"));

    assert(result.degraded());
    assert(f.transport.calls("flaky") == 4 && "Initial attempt plus three retries");
    assert(result.attempts == 4);

    auto sleeps = f.clock.sleeps();
    assert(sleeps.size() == 3);
    const double nominal[] = {100.0, 200.0, 400.0};
    for (size_t i = 0; i < sleeps.size(); ++i) {
        double ms = static_cast<double>(sleeps[i].count());
        assert(ms >= nominal[i] * 0.75 - 1.0 && "Delay below jitter band");
        assert(ms <= nominal[i] * 1.25 + 1.0 && "Delay above jitter band");
    }
}

void test_failover_to_next_provider() {
    ExecutorFixture f({make_provider("free", 0.0), make_provider("paid", 1.0)}, 10, 1);
    f.transport.always("free", Reply::RpcError);

    auto result = f.executor.execute(request("getAccountInfo", nlohmann::json::array({"Vote111111111111111111111111111111111111111"})));

    assert(result.ok());
    assert(result.provider_id == "paid");
    assert(result.stage == "fallback");
    assert(result.payload["served_by"] == "paid");
    assert(f.transport.calls("free") == 2);
    assert(f.transport.calls("paid") == 1);

    auto j = f.metrics.to_json();
    assert(j["providers"]["free"]["failovers"] == 1);
}

void test_cheapest_provider_kept_through_intermittent_failures() {
    ExecutorFixture f({make_provider("free", 0.0), make_provider("paid", 1.0)}, 5, 0);

    std::vector<Reply> replies;
    for (int round = 0; round < 4; ++round) {
        for (int i = 0; i < 4; ++i) replies.push_back(Reply::HttpError);
        replies.push_back(Reply::Ok);
    }
    f.transport.script("free", replies);

    for (size_t call = 0; call < replies.size(); ++call) {
        f.executor.execute(request("getBalance"));
        assert(f.transport.calls("free") == static_cast<int>(call + 1) && "Cost-0 provider tried first on every call");
    }

    assert(f.breakers.state("free") == CircuitState::Closed);
    assert(f.registry.find("free")->health == ProviderHealth::Down && "Health alone does not reorder");
    assert(f.transport.calls("paid") == 16 && "Paid provider only absorbs the failovers");
}

void test_open_circuit_stops_retries() {
    ExecutorFixture f({make_provider("free", 0.0), make_provider("paid", 1.0)}, 2, 5);
    f.transport.always("free", Reply::Garbage);

    auto result = f.executor.execute(request("getBalance"));

    assert(f.transport.calls("free") == 2 && "Retries stop once the breaker opens");
    assert(f.breakers.state("free") == CircuitState::Open);
    assert(result.ok() && result.provider_id == "paid");
}

void test_recovers_after_transient_failure() {
    ExecutorFixture f({make_provider("free", 0.0)}, 5, 3);
    f.transport.script("free", {Reply::HttpError, Reply::Ok});

    auto result = f.executor.execute(request("getSlot"));

    assert(result.ok());
    assert(result.stage == "primary");
    assert(result.attempts == 2);
    assert(f.breakers.get("free")->consecutive_failures() == 0);
    assert(f.clock.sleeps().size() == 1);
}

void test_timeouts_do_not_consume_quota() {
    ExecutorFixture f({make_provider("free", 0.0, 100)}, 10, 2);
    f.transport.always("free", Reply::Timeout);

    auto result = f.executor.execute(request("getSlot"));

    assert(result.degraded());
    assert(f.transport.calls("free") == 3);
    assert(f.usage.snapshot("free")->requests == 0 && "Unreached calls are released");
}

void test_failed_responses_consume_quota() {
    ExecutorFixture f({make_provider("free", 0.0, 100)}, 10, 1);
    f.transport.always("free", Reply::HttpError);

    f.executor.execute(request("getSlot"));
    assert(f.usage.snapshot("free")->requests == 2 && "Provider saw both requests");
}

void test_json_rpc_body() {
    ExecutorFixture f({make_provider("free", 0.0)}, 5, 0);
    f.executor.execute(request("getBalance", nlohmann::json::array({"So11111111111111111111111111111111111111112"})));

    auto body = nlohmann::json::parse(f.transport.last_body());
    assert(body["jsonrpc"] == "2.0");
    assert(body["method"] == "getBalance");
    assert(body["params"][0] == "So11111111111111111111111111111111111111112");
    assert(body["id"].is_number_unsigned());
}

void test_throwing_stage_is_contained() {
    MetricsCollector metrics;
    std::vector<std::unique_ptr<CallStrategy>> stages;
    stages.push_back(std::make_unique<ThrowingStrategy>());
    stages.push_back(std::make_unique<MockResponderStrategy>(metrics));
    ResilientExecutor executor(std::move(stages));

    auto result = executor.execute(request("getSlot"));
    assert(result.degraded());
    assert(result.payload["reason"].get<std::string>().find("stage blew up") != std::string::npos);
    assert((executor.stage_names() == std::vector<std::string>{"throwing", "mock"}));
}

void test_gateway_caches_success_only() {
    ExecutorFixture f({make_provider("free", 0.0)}, 1, 0);
    CacheLayer cache(CacheTtls{}, 100, f.clock);
    ProviderGateway gateway(cache, f.executor, f.metrics);

    auto first = gateway.call(request("getSlot"));
    auto second = gateway.call(request("getSlot"));
    assert(first.ok() && !first.from_cache);
    assert(second.ok() && second.from_cache && second.stage == "cache");
    assert(f.transport.calls("free") == 1 && "Second call served from cache");

    // Hot tier expires after five seconds
    f.clock.advance(std::chrono::seconds(5));
    gateway.call(request("getSlot"));
    assert(f.transport.calls("free") == 2);

    // Uncached call bypasses the cache
    gateway.call(request("getSlot"), std::nullopt);
    assert(f.transport.calls("free") == 3);
}

void test_gateway_keys_by_routing_constraints() {
    ExecutorFixture f({make_provider("public", 0.0), make_provider("helius", 1.0, 1000000, true)}, 5, 0);
    CacheLayer cache(CacheTtls{}, 100, f.clock);
    ProviderGateway gateway(cache, f.executor, f.metrics);

    auto plain = gateway.call(request("getBalance"));
    assert(plain.ok() && plain.payload["served_by"] == "public");

    auto enhanced_request = request("getBalance");
    enhanced_request.requires_enhanced_data = true;
    auto enhanced = gateway.call(enhanced_request);
    assert(!enhanced.from_cache && "Plain answer must not satisfy an enhanced request");
    assert(enhanced.payload["served_by"] == "helius");

    auto pinned_request = request("getBalance");
    pinned_request.preferred_provider = "helius";
    assert(!gateway.call(pinned_request).from_cache);
    assert(gateway.call(pinned_request).from_cache);

    assert(ProviderGateway::cache_key(request("getBalance")) != ProviderGateway::cache_key(enhanced_request));
    assert(ProviderGateway::cache_key(enhanced_request).rfind("getBalance:", 0) == 0 && "Method prefix kept for invalidation");
}

void test_gateway_never_caches_degraded() {
    ExecutorFixture f({make_provider("free", 0.0)}, 1, 0);
    CacheLayer cache(CacheTtls{}, 100, f.clock);
    ProviderGateway gateway(cache, f.executor, f.metrics);
    f.breakers.get("free")->record_failure();

    auto first = gateway.call(request("getAsset"));
    auto second = gateway.call(request("getAsset"));
    assert(first.degraded() && second.degraded());
    assert(!second.from_cache && "Degraded result must not be served from cache");
    assert(cache.size() == 0);
}

void test_default_tiers() {
    assert(ProviderGateway::default_tier_for("getSlot") == VolatilityTier::Hot);
    assert(ProviderGateway::default_tier_for("getBalance") == VolatilityTier::Warm);
    assert(ProviderGateway::default_tier_for("getAccountInfo") == VolatilityTier::Cold);
    assert(ProviderGateway::default_tier_for("getAsset") == VolatilityTier::Frozen);
    assert(ProviderGateway::default_tier_for("someCustomMethod") == VolatilityTier::Warm);
}

int main() {
    quiet_logging();
    std::cout << "\n=== Resilient Executor Test Suite ===\n" << std::endl;

    TestReporter reporter;
    reporter.test("All circuits open degrades", test_all_circuits_open_degrades);
    reporter.test("Retries back off exponentially", test_retries_back_off_exponentially);
    reporter.test("Failover to next provider", test_failover_to_next_provider);
    reporter.test("Cheapest provider kept through intermittent failures", test_cheapest_provider_kept_through_intermittent_failures);
    reporter.test("Open circuit stops retries", test_open_circuit_stops_retries);
    reporter.test("Recovers after transient failure", test_recovers_after_transient_failure);
    reporter.test("Timeouts do not consume quota", test_timeouts_do_not_consume_quota);
    reporter.test("Failed responses consume quota", test_failed_responses_consume_quota);
    reporter.test("JSON-RPC request body", test_json_rpc_body);
    reporter.test("Throwing stage is contained", test_throwing_stage_is_contained);
    reporter.test("Gateway caches success only", test_gateway_caches_success_only);
    reporter.test("Gateway keys by routing constraints", test_gateway_keys_by_routing_constraints);
    reporter.test("Gateway never caches degraded", test_gateway_never_caches_degraded);
    reporter.test("Default cache tiers", test_default_tiers);

    return reporter.report();
}
