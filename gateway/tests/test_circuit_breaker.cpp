#include "test_support.hpp"
#include "../src/circuit_breaker.hpp"
#include "../src/retry_schedule.hpp"

namespace {

CircuitBreakerSettings settings(int threshold, int cooldown_ms) {
    CircuitBreakerSettings s;
    s.failure_threshold = threshold;
    s.cooldown = std::chrono::milliseconds(cooldown_ms);
    return s;
}

}

void test_opens_after_threshold() {
    ManualClock clock;
    CircuitBreaker breaker("helius", settings(3, 1000), clock);

    for (int i = 0; i < 2; ++i) {
        assert(breaker.try_acquire() && "Closed breaker should permit calls");
        breaker.record_failure();
    }
    assert(breaker.state() == CircuitState::Closed && "Below threshold stays closed");

    assert(breaker.try_acquire());
    breaker.record_failure();
    assert(breaker.state() == CircuitState::Open && "Third consecutive failure opens");
    assert(!breaker.is_call_permitted() && "Open breaker rejects before cooldown");
    assert(!breaker.try_acquire() && "No real call while open");
    assert(breaker.time_until_retry().count() == 1000);
}

void test_success_resets_failure_count() {
    ManualClock clock;
    CircuitBreaker breaker("quicknode", settings(3, 1000), clock);

    breaker.record_failure();
    breaker.record_failure();
    breaker.record_success();
    breaker.record_failure();
    breaker.record_failure();
    assert(breaker.state() == CircuitState::Closed && "Failures must be consecutive");
    assert(breaker.consecutive_failures() == 2);
}

void test_half_open_probe_closes_on_success() {
    ManualClock clock;
    CircuitBreaker breaker("alchemy", settings(1, 500), clock);

    breaker.record_failure();
    assert(breaker.state() == CircuitState::Open);

    clock.advance(std::chrono::milliseconds(499));
    assert(!breaker.try_acquire() && "Still cooling down");

    clock.advance(std::chrono::milliseconds(1));
    assert(breaker.is_call_permitted() && "Cooldown elapsed, probe allowed");
    assert(breaker.try_acquire() && "First probe admitted");
    assert(breaker.state() == CircuitState::HalfOpen);
    assert(!breaker.try_acquire() && "Only one probe in flight");

    breaker.record_success();
    assert(breaker.state() == CircuitState::Closed);
    assert(breaker.try_acquire());
}

void test_half_open_failure_restarts_cooldown() {
    ManualClock clock;
    CircuitBreaker breaker("public", settings(2, 1000), clock);

    breaker.record_failure();
    breaker.record_failure();
    clock.advance(std::chrono::milliseconds(1000));
    assert(breaker.try_acquire());
    assert(breaker.state() == CircuitState::HalfOpen);

    clock.advance(std::chrono::milliseconds(300));
    breaker.record_failure();
    assert(breaker.state() == CircuitState::Open && "Failed probe re-opens");
    assert(breaker.time_until_retry().count() == 1000 && "Cooldown restarts from the probe failure");

    clock.advance(std::chrono::milliseconds(999));
    assert(!breaker.try_acquire());
    clock.advance(std::chrono::milliseconds(1));
    assert(breaker.try_acquire());
}

void test_late_success_does_not_close_open_circuit() {
    ManualClock clock;
    CircuitBreaker breaker("triton", settings(1, 30000), clock);

    // Two calls admitted while closed
    assert(breaker.try_acquire());
    assert(breaker.try_acquire());

    breaker.record_failure();
    assert(breaker.state() == CircuitState::Open);

    // The slower call answers after its sibling opened the circuit
    breaker.record_success();
    assert(breaker.state() == CircuitState::Open && "Only a half-open probe may close the circuit");
    assert(!breaker.try_acquire() && "Cooldown still applies");
    assert(breaker.time_until_retry().count() == 30000);

    clock.advance(std::chrono::milliseconds(30000));
    assert(breaker.try_acquire());
    assert(breaker.state() == CircuitState::HalfOpen);
    breaker.record_success();
    assert(breaker.state() == CircuitState::Closed);
}

void test_bank_lookup() {
    ManualClock clock;
    std::vector<Provider> providers = {make_provider("a", 0.0), make_provider("b", 1.0)};
    CircuitBreakerBank bank(providers, settings(1, 1000), clock);

    assert(bank.get("a") != nullptr);
    assert(bank.get("missing") == nullptr);
    bank.get("b")->record_failure();
    assert(bank.state("b") == CircuitState::Open);
    assert(bank.state("a") == CircuitState::Closed);

    auto j = bank.to_json();
    assert(j["b"]["state"] == "open");
    assert(j["a"]["consecutive_failures"] == 0);
}

void test_retry_delays_grow_within_jitter() {
    RetryPolicy policy;
    policy.max_retries = 5;
    policy.base_delay = std::chrono::milliseconds(100);
    policy.max_delay = std::chrono::milliseconds(1000);
    policy.jitter_factor = 0.25;

    assert(policy.nominal_delay(0).count() == 100);
    assert(policy.nominal_delay(1).count() == 200);
    assert(policy.nominal_delay(3).count() == 800);
    assert(policy.nominal_delay(4).count() == 1000 && "Capped at max delay");

    RetrySchedule schedule(policy);
    for (int attempt = 0; attempt < 5; ++attempt) {
        assert(schedule.can_retry());
        double nominal = static_cast<double>(policy.nominal_delay(attempt).count());
        auto delay = schedule.next_delay().count();
        assert(delay >= static_cast<long long>(nominal * 0.75) - 1 && "Jitter lower bound");
        assert(delay <= static_cast<long long>(nominal * 1.25) + 1 && "Jitter upper bound");
    }
    assert(!schedule.can_retry() && "Retries exhausted");
    assert(schedule.retries() == 5);
}

int main() {
    quiet_logging();
    std::cout << "\n=== Circuit Breaker & Retry Test Suite ===\n" << std::endl;

    TestReporter reporter;
    reporter.test("Opens after consecutive failures", test_opens_after_threshold);
    reporter.test("Success resets failure count", test_success_resets_failure_count);
    reporter.test("Half-open probe closes on success", test_half_open_probe_closes_on_success);
    reporter.test("Half-open failure restarts cooldown", test_half_open_failure_restarts_cooldown);
    reporter.test("Late success does not close open circuit", test_late_success_does_not_close_open_circuit);
    reporter.test("Breaker bank lookup", test_bank_lookup);
    reporter.test("Retry delays grow within jitter", test_retry_delays_grow_within_jitter);

    return reporter.report();
}
