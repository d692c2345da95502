#include "circuit_breaker.hpp"
#include <spdlog/spdlog.h>

CircuitBreaker::CircuitBreaker(std::string name, const CircuitBreakerSettings& settings,
                               const Clock& clock)
    : name_(std::move(name)), settings_(settings), clock_(clock) {
}

bool CircuitBreaker::is_call_permitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case CircuitState::Closed:
            return true;
        case CircuitState::Open:
            return cooldown_elapsed_locked();
        case CircuitState::HalfOpen:
            return !probe_in_flight_;
    }
    return false;
}

bool CircuitBreaker::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == CircuitState::Closed) {
        return true;
    }

    if (state_ == CircuitState::Open) {
        if (!cooldown_elapsed_locked()) {
            return false;
        }
        state_ = CircuitState::HalfOpen;
        probe_in_flight_ = false;
        spdlog::info("Circuit {} half-open, probing", name_);
    }

    // HalfOpen: a single probe at a time
    if (probe_in_flight_) {
        return false;
    }
    probe_in_flight_ = true;
    return true;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);

    // A call admitted before the circuit opened cannot close it; only the probe can
    if (state_ == CircuitState::Open) {
        spdlog::debug("Circuit {} ignoring late success while open", name_);
        return;
    }

    if (state_ == CircuitState::HalfOpen) {
        spdlog::info("Circuit {} closed after successful probe", name_);
    }
    state_ = CircuitState::Closed;
    consecutive_failures_ = 0;
    probe_in_flight_ = false;
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);

    consecutive_failures_++;

    if (state_ == CircuitState::HalfOpen) {
        spdlog::warn("Circuit {} probe failed, re-opening", name_);
        open_locked();
        return;
    }

    if (state_ == CircuitState::Closed && consecutive_failures_ >= settings_.failure_threshold) {
        spdlog::warn("Circuit {} opened after {} consecutive failures", name_, consecutive_failures_);
        open_locked();
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int CircuitBreaker::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

std::chrono::milliseconds CircuitBreaker::time_until_retry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CircuitState::Open) {
        return std::chrono::milliseconds(0);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_.steady_now() - opened_at_);
    if (elapsed >= settings_.cooldown) {
        return std::chrono::milliseconds(0);
    }
    return settings_.cooldown - elapsed;
}

nlohmann::json CircuitBreaker::to_json() const {
    auto retry_in = time_until_retry();
    std::lock_guard<std::mutex> lock(mutex_);
    return nlohmann::json{
        {"state", to_string(state_)},
        {"consecutive_failures", consecutive_failures_},
        {"retry_in_ms", retry_in.count()}
    };
}

bool CircuitBreaker::cooldown_elapsed_locked() const {
    return clock_.steady_now() - opened_at_ >= settings_.cooldown;
}

void CircuitBreaker::open_locked() {
    state_ = CircuitState::Open;
    opened_at_ = clock_.steady_now();
    probe_in_flight_ = false;
}

CircuitBreakerBank::CircuitBreakerBank(const std::vector<Provider>& providers,
                                       const CircuitBreakerSettings& settings,
                                       const Clock& clock) {
    for (const auto& p : providers) {
        if (breakers_.count(p.id)) {
            continue;
        }
        breakers_[p.id] = std::make_unique<CircuitBreaker>(p.id, settings, clock);
        order_.push_back(p.id);
    }
}

CircuitBreaker* CircuitBreakerBank::get(const std::string& provider_id) const {
    auto it = breakers_.find(provider_id);
    return it == breakers_.end() ? nullptr : it->second.get();
}

CircuitState CircuitBreakerBank::state(const std::string& provider_id) const {
    auto* breaker = get(provider_id);
    return breaker ? breaker->state() : CircuitState::Open;
}

nlohmann::json CircuitBreakerBank::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& id : order_) {
        j[id] = breakers_.at(id)->to_json();
    }
    return j;
}
