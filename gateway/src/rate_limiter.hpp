#pragma once
#include "clock.hpp"
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

struct RateLimitDecision {
    bool allowed = true;
    int remaining = 0;
    std::chrono::seconds retry_after{0};
};

// Sliding-window limiter keyed by request source
class RateLimiter {
public:
    RateLimiter(int max_requests, std::chrono::seconds window, const Clock& clock);

    // Records the request when allowed
    RateLimitDecision check(const std::string& source);

    // Drops sources whose window has fully drained
    void cleanup_old_entries();

    size_t tracked_sources() const;

private:
    void prune(std::deque<std::chrono::steady_clock::time_point>& requests,
               std::chrono::steady_clock::time_point now) const;

    const int max_requests_;
    const std::chrono::seconds window_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<std::chrono::steady_clock::time_point>> sources_;
};
