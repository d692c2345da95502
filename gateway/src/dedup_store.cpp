#include "dedup_store.hpp"
#include <spdlog/spdlog.h>

InMemoryDedupStore::InMemoryDedupStore(std::chrono::seconds window, const Clock& clock)
    : window_(window), clock_(clock) {}

bool InMemoryDedupStore::mark_if_new(const std::string& signature) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_.steady_now();

    auto it = seen_.find(signature);
    if (it != seen_.end() && it->second > now) {
        return false;
    }

    seen_[signature] = now + window_;
    return true;
}

void InMemoryDedupStore::forget(const std::string& signature) {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_.erase(signature);
}

void InMemoryDedupStore::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_.steady_now();

    auto it = seen_.begin();
    while (it != seen_.end()) {
        if (it->second <= now) {
            it = seen_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t InMemoryDedupStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

RedisDedupStore::RedisDedupStore(std::shared_ptr<sw::redis::Redis> redis,
                                 std::chrono::seconds window, std::string key_prefix)
    : redis_(std::move(redis)), window_(window), key_prefix_(std::move(key_prefix)) {}

bool RedisDedupStore::mark_if_new(const std::string& signature) {
    try {
        // SET NX returns true only when the key did not exist yet
        return redis_->set(key_prefix_ + signature, "1", window_, sw::redis::UpdateType::NOT_EXIST);
    } catch (const std::exception& e) {
        // An unreachable store must not drop events
        spdlog::warn("Dedup check failed for {}, treating as new: {}", signature, e.what());
        return true;
    }
}

void RedisDedupStore::forget(const std::string& signature) {
    try {
        redis_->del(key_prefix_ + signature);
    } catch (const std::exception& e) {
        spdlog::warn("Could not release dedup mark for {}: {}", signature, e.what());
    }
}
