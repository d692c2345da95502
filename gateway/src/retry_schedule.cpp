#include "retry_schedule.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

std::chrono::milliseconds RetryPolicy::nominal_delay(int attempt) const {
    if (attempt < 0) {
        return std::chrono::milliseconds(0);
    }

    double delay_ms = static_cast<double>(base_delay.count()) * std::pow(2.0, attempt);
    delay_ms = std::min(delay_ms, static_cast<double>(max_delay.count()));

    return std::chrono::milliseconds(static_cast<long long>(delay_ms));
}

RetrySchedule::RetrySchedule(const RetryPolicy& policy)
    : policy_(policy) {
}

std::chrono::milliseconds RetrySchedule::next_delay() {
    double delay_ms = static_cast<double>(policy_.nominal_delay(retries_).count());
    retries_++;

    if (policy_.jitter_factor > 0.0) {
        delay_ms = util::random_jitter(delay_ms, policy_.jitter_factor);
    }

    return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, delay_ms)));
}
