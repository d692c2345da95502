#include "cache_layer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

double CacheStats::hit_rate() const {
    uint64_t total = hits + misses;
    if (total == 0) return 0.0;
    return static_cast<double>(hits) / total;
}

nlohmann::json CacheStats::to_json() const {
    return nlohmann::json{
        {"hits", hits},
        {"misses", misses},
        {"hit_rate", hit_rate()},
        {"evictions", evictions},
        {"expirations", expirations},
        {"entries", entries},
        {"entries_per_tier", {
            {"hot", entries_per_tier[0]},
            {"warm", entries_per_tier[1]},
            {"cold", entries_per_tier[2]},
            {"frozen", entries_per_tier[3]}
        }}
    };
}

CacheLayer::CacheLayer(const CacheTtls& ttls, size_t max_entries, const Clock& clock)
    : ttls_(ttls), max_entries_(max_entries), clock_(clock) {
}

std::optional<nlohmann::json> CacheLayer::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        miss_count_++;
        return std::nullopt;
    }

    if (is_expired(it->second, clock_.steady_now())) {
        erase_locked(it);
        expiration_count_++;
        miss_count_++;
        return std::nullopt;
    }

    // Move to front of LRU list
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_iterator);

    hit_count_++;
    return it->second.value;
}

void CacheLayer::put(const std::string& key, VolatilityTier tier, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = cache_.find(key);
    if (existing != cache_.end()) {
        erase_locked(existing);
    }

    while (cache_.size() >= max_entries_ && !lru_list_.empty()) {
        evict_lru_locked();
    }

    lru_list_.push_front(key);
    CacheEntry entry{value, tier, clock_.steady_now() + ttl_for(tier), lru_list_.begin()};
    cache_.emplace(key, std::move(entry));
}

nlohmann::json CacheLayer::get_or_compute(const std::string& key, VolatilityTier tier,
                                          const ComputeFn& compute) {
    if (auto cached = get(key)) {
        return *cached;
    }

    nlohmann::json value = compute();
    put(key, tier, value);
    return value;
}

size_t CacheLayer::invalidate_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (util::starts_with(it->first, prefix)) {
            lru_list_.erase(it->second.lru_iterator);
            it = cache_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t CacheLayer::sweep_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = clock_.steady_now();
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (is_expired(it->second, now)) {
            lru_list_.erase(it->second.lru_iterator);
            it = cache_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    expiration_count_ += removed;
    if (removed > 0) {
        spdlog::debug("Cache sweep removed {} expired entries, {} remain", removed, cache_.size());
    }
    return removed;
}

void CacheLayer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    lru_list_.clear();
}

size_t CacheLayer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::chrono::seconds CacheLayer::ttl_for(VolatilityTier tier) const {
    switch (tier) {
        case VolatilityTier::Hot:    return ttls_.hot;
        case VolatilityTier::Warm:   return ttls_.warm;
        case VolatilityTier::Cold:   return ttls_.cold;
        case VolatilityTier::Frozen: return ttls_.frozen;
    }
    return ttls_.hot;
}

CacheStats CacheLayer::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheStats s;
    s.hits = hit_count_;
    s.misses = miss_count_;
    s.evictions = eviction_count_;
    s.expirations = expiration_count_;
    s.entries = cache_.size();
    for (const auto& [key, entry] : cache_) {
        s.entries_per_tier[static_cast<size_t>(entry.tier)]++;
    }
    return s;
}

std::string CacheLayer::make_key(const std::string& method, const nlohmann::json& params) {
    return fmt::format("{}:{}", method, params.dump());
}

VolatilityTier CacheLayer::classify_volatility(const VolatilityMetrics& m) {
    double score = m.price_volatility * 0.4 +
                   m.volume_volatility * 0.3 +
                   m.holder_volatility * 0.2 +
                   m.liquidity_volatility * 0.1;

    if (score > 0.8) return VolatilityTier::Hot;
    if (score > 0.5) return VolatilityTier::Warm;
    if (score > 0.2) return VolatilityTier::Cold;
    return VolatilityTier::Frozen;
}

bool CacheLayer::is_expired(const CacheEntry& entry, std::chrono::steady_clock::time_point now) const {
    return now >= entry.expires_at;
}

void CacheLayer::erase_locked(std::unordered_map<std::string, CacheEntry>::iterator it) {
    lru_list_.erase(it->second.lru_iterator);
    cache_.erase(it);
}

void CacheLayer::evict_lru_locked() {
    const std::string lru_key = lru_list_.back();
    lru_list_.pop_back();
    cache_.erase(lru_key);
    eviction_count_++;
}
