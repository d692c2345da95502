#pragma once
#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct CircuitBreakerSettings {
    int failure_threshold = 5;
    std::chrono::milliseconds cooldown{30000};
};

class CircuitBreaker {
public:
    CircuitBreaker(std::string name, const CircuitBreakerSettings& settings, const Clock& clock);

    // True if a call would be let through now; does not change state
    bool is_call_permitted() const;

    // Claims permission for one call. Moves Open -> HalfOpen once the cooldown
    // has elapsed and allows a single probe while HalfOpen.
    bool try_acquire();

    void record_success();
    void record_failure();

    CircuitState state() const;
    int consecutive_failures() const;
    std::chrono::milliseconds time_until_retry() const;

    nlohmann::json to_json() const;

private:
    bool cooldown_elapsed_locked() const;
    void open_locked();

    const std::string name_;
    const CircuitBreakerSettings settings_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    int consecutive_failures_ = 0;
    std::chrono::steady_clock::time_point opened_at_;
    bool probe_in_flight_ = false;
};

// One breaker per provider id, created up front
class CircuitBreakerBank {
public:
    CircuitBreakerBank(const std::vector<Provider>& providers,
                       const CircuitBreakerSettings& settings, const Clock& clock);

    // nullptr for unknown ids
    CircuitBreaker* get(const std::string& provider_id) const;

    CircuitState state(const std::string& provider_id) const;

    nlohmann::json to_json() const;

private:
    std::unordered_map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
    std::vector<std::string> order_;
};
