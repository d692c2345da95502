#include "test_support.hpp"
#include "../src/request_router.hpp"

namespace {

// Registry, usage and breakers wired together the way the service does it
struct RouterFixture {
    ManualClock clock;
    ProviderRegistry registry;
    UsageTracker usage;
    CircuitBreakerBank breakers;
    RequestRouter router;

    RouterFixture(const std::vector<Provider>& providers, RoutingPolicy policy)
        : registry(providers),
          usage(registry, clock),
          breakers(providers, CircuitBreakerSettings{1, std::chrono::milliseconds(30000)}, clock),
          router(registry, usage, breakers, policy) {}
};

OperationDescriptor op(const std::string& method = "getBalance") {
    OperationDescriptor d;
    d.method = method;
    return d;
}

std::vector<std::string> ids(const std::vector<Provider>& providers) {
    std::vector<std::string> out;
    for (const auto& p : providers) out.push_back(p.id);
    return out;
}

}

void test_cost_optimized_prefers_cheapest() {
    RouterFixture f({make_provider("paid", 1.0), make_provider("free", 0.0)},
                    RoutingPolicy::CostOptimized);

    auto chosen = f.router.select(op());
    assert(chosen && chosen->id == "free" && "Zero-cost provider wins");

    auto ranked = ids(f.router.rank(op()));
    assert((ranked == std::vector<std::string>{"free", "paid"}));
}

void test_cost_ties_broken_by_latency() {
    Provider slow = make_provider("slow", 0.5);
    slow.avg_latency_ms = 400.0;
    Provider fast = make_provider("fast", 0.5);
    fast.avg_latency_ms = 80.0;
    RouterFixture f({slow, fast}, RoutingPolicy::CostOptimized);

    assert(f.router.select(op())->id == "fast");
}

void test_excluded_providers_skipped() {
    RouterFixture f({make_provider("free", 0.0), make_provider("paid", 1.0)},
                    RoutingPolicy::CostOptimized);

    auto d = op();
    d.excluded.insert("free");
    assert(f.router.select(d)->id == "paid");

    d.excluded.insert("paid");
    assert(!f.router.select(d) && "Everything excluded means unavailable");
}

void test_capabilities_filter() {
    Provider push = make_provider("push", 1.0);
    push.supports_push = true;
    RouterFixture f({make_provider("plain", 0.0, 1000, false), make_provider("enhanced", 0.5, 1000, true), push},
                    RoutingPolicy::CostOptimized);

    auto d = op("getAsset");
    d.requires_enhanced_data = true;
    assert((ids(f.router.rank(d)) == std::vector<std::string>{"enhanced"}));

    auto p = op("subscribe");
    p.requires_push = true;
    assert((ids(f.router.rank(p)) == std::vector<std::string>{"push"}));
}

void test_over_quota_excluded() {
    RouterFixture f({make_provider("free", 0.0, 1), make_provider("paid", 1.0)},
                    RoutingPolicy::CostOptimized);

    assert(f.usage.record_usage("free", 0.0) == UsageResult::Accepted);
    assert(f.router.select(op())->id == "paid" && "Exhausted quota is not eligible");
}

void test_open_circuit_excluded() {
    RouterFixture f({make_provider("free", 0.0), make_provider("paid", 1.0)},
                    RoutingPolicy::CostOptimized);

    f.breakers.get("free")->record_failure();
    assert(f.breakers.state("free") == CircuitState::Open);
    assert(f.router.select(op())->id == "paid");

    f.clock.advance(std::chrono::milliseconds(30000));
    assert(f.router.select(op())->id == "free" && "Cooled-down provider is eligible for a probe");
}

void test_down_providers_ranked_last() {
    Provider fast = make_provider("fast", 0.0);
    fast.avg_latency_ms = 50.0;
    Provider slow = make_provider("slow", 1.0);
    slow.avg_latency_ms = 400.0;
    RouterFixture f({fast, slow}, RoutingPolicy::PerformanceFirst);

    f.registry.set_health("fast", ProviderHealth::Down);
    assert((ids(f.router.rank(op())) == std::vector<std::string>{"slow", "fast"}));
}

void test_cost_order_ignores_health() {
    RouterFixture f({make_provider("free", 0.0), make_provider("paid", 1.0)},
                    RoutingPolicy::CostOptimized);

    f.registry.set_health("free", ProviderHealth::Down);
    assert(f.router.select(op())->id == "free" && "Cheapest stays first until it becomes ineligible");
}

void test_preferred_provider_first() {
    RouterFixture f({make_provider("free", 0.0), make_provider("paid", 1.0)},
                    RoutingPolicy::CostOptimized);

    auto d = op();
    d.preferred_provider = "paid";
    assert(f.router.select(d)->id == "paid");

    d.preferred_provider = "unknown";
    assert(f.router.select(d)->id == "free" && "Unknown preference is ignored");
}

void test_performance_first() {
    Provider a = make_provider("a", 0.0);
    a.avg_latency_ms = 300.0;
    Provider b = make_provider("b", 1.0);
    b.avg_latency_ms = 50.0;
    RouterFixture f({a, b}, RoutingPolicy::PerformanceFirst);

    assert(f.router.select(op())->id == "b");
    // Policy override per request
    assert(f.router.select(op(), RoutingPolicy::CostOptimized)->id == "a");
}

void test_round_robin_rotates() {
    RouterFixture f({make_provider("a", 0.0), make_provider("b", 0.0), make_provider("c", 0.0)},
                    RoutingPolicy::RoundRobin);

    std::vector<std::string> picks;
    for (int i = 0; i < 6; ++i) {
        picks.push_back(f.router.select(op())->id);
    }
    assert((picks == std::vector<std::string>{"a", "b", "c", "a", "b", "c"}));
}

void test_weighted_round_robin_share() {
    RouterFixture f({make_provider("heavy", 0.0, 1000000, false, 3), make_provider("light", 0.0, 1000000, false, 1)},
                    RoutingPolicy::WeightedRoundRobin);

    std::map<std::string, int> counts;
    for (int i = 0; i < 40; ++i) {
        counts[f.router.select(op())->id]++;
    }
    assert(counts["heavy"] == 30 && "Share proportional to priority");
    assert(counts["light"] == 10);
}

void test_enhanced_data_first() {
    RouterFixture f({make_provider("cheap", 0.0, 1000, false), make_provider("rich", 2.0, 1000, true)},
                    RoutingPolicy::EnhancedDataFirst);

    assert((ids(f.router.rank(op())) == std::vector<std::string>{"rich", "cheap"}));
}

int main() {
    quiet_logging();
    std::cout << "\n=== Request Router Test Suite ===\n" << std::endl;

    TestReporter reporter;
    reporter.test("Cost optimized prefers cheapest", test_cost_optimized_prefers_cheapest);
    reporter.test("Cost ties broken by latency", test_cost_ties_broken_by_latency);
    reporter.test("Excluded providers skipped", test_excluded_providers_skipped);
    reporter.test("Capabilities filter", test_capabilities_filter);
    reporter.test("Over quota excluded", test_over_quota_excluded);
    reporter.test("Open circuit excluded", test_open_circuit_excluded);
    reporter.test("Down providers ranked last", test_down_providers_ranked_last);
    reporter.test("Cost order ignores health", test_cost_order_ignores_health);
    reporter.test("Preferred provider first", test_preferred_provider_first);
    reporter.test("Performance first", test_performance_first);
    reporter.test("Round robin rotates", test_round_robin_rotates);
    reporter.test("Weighted round robin share", test_weighted_round_robin_share);
    reporter.test("Enhanced data first", test_enhanced_data_first);

    return reporter.report();
}
