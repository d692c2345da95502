#include "rate_limiter.hpp"
#include <algorithm>

RateLimiter::RateLimiter(int max_requests, std::chrono::seconds window, const Clock& clock)
    : max_requests_(max_requests), window_(window), clock_(clock) {}

RateLimitDecision RateLimiter::check(const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_.steady_now();
    auto& requests = sources_[source];

    prune(requests, now);

    RateLimitDecision decision;
    if (requests.size() >= static_cast<size_t>(max_requests_)) {
        decision.allowed = false;
        decision.remaining = 0;

        // Round up so clients never retry before the oldest slot frees
        auto wait = requests.front() + window_ - now;
        auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(wait).count();
        decision.retry_after = std::chrono::seconds(std::max<long long>(1, (wait_ms + 999) / 1000));
        return decision;
    }

    requests.push_back(now);
    decision.remaining = max_requests_ - static_cast<int>(requests.size());
    return decision;
}

void RateLimiter::cleanup_old_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_.steady_now();

    auto it = sources_.begin();
    while (it != sources_.end()) {
        prune(it->second, now);
        if (it->second.empty()) {
            it = sources_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t RateLimiter::tracked_sources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_.size();
}

void RateLimiter::prune(std::deque<std::chrono::steady_clock::time_point>& requests,
                        std::chrono::steady_clock::time_point now) const {
    while (!requests.empty() && now - requests.front() >= window_) {
        requests.pop_front();
    }
}
