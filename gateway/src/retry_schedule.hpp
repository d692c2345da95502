#pragma once
#include <chrono>

struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds base_delay{100};
    std::chrono::milliseconds max_delay{5000};
    double jitter_factor = 0.25;

    // Un-jittered delay before retry number `attempt` (0-based): base * 2^attempt, capped
    std::chrono::milliseconds nominal_delay(int attempt) const;
};

// Per-call retry state: how many retries were spent and how long to wait next
class RetrySchedule {
public:
    explicit RetrySchedule(const RetryPolicy& policy);

    bool can_retry() const { return retries_ < policy_.max_retries; }

    // Consumes one retry and returns the jittered delay to wait before it
    std::chrono::milliseconds next_delay();

    int retries() const { return retries_; }

    void reset() { retries_ = 0; }

private:
    const RetryPolicy policy_;
    int retries_ = 0;
};
