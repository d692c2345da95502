#pragma once
#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

struct CacheTtls {
    std::chrono::seconds hot{5};
    std::chrono::seconds warm{30};
    std::chrono::seconds cold{300};
    std::chrono::seconds frozen{3600};
};

// Normalized 0-1 volatility inputs for a piece of market data
struct VolatilityMetrics {
    double price_volatility = 0.0;
    double volume_volatility = 0.0;
    double holder_volatility = 0.0;
    double liquidity_volatility = 0.0;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    size_t entries = 0;
    std::array<size_t, 4> entries_per_tier{};

    double hit_rate() const;
    nlohmann::json to_json() const;
};

class CacheLayer {
public:
    using ComputeFn = std::function<nlohmann::json()>;

    CacheLayer(const CacheTtls& ttls, size_t max_entries, const Clock& clock);

    std::optional<nlohmann::json> get(const std::string& key);

    void put(const std::string& key, VolatilityTier tier, const nlohmann::json& value);

    // compute runs outside the lock; concurrent misses may both compute
    nlohmann::json get_or_compute(const std::string& key, VolatilityTier tier, const ComputeFn& compute);

    size_t invalidate_prefix(const std::string& prefix);

    // Drops every expired entry, returns how many were removed
    size_t sweep_expired();

    void clear();
    size_t size() const;

    std::chrono::seconds ttl_for(VolatilityTier tier) const;
    CacheStats stats() const;

    static std::string make_key(const std::string& method, const nlohmann::json& params);
    static VolatilityTier classify_volatility(const VolatilityMetrics& metrics);

private:
    struct CacheEntry {
        nlohmann::json value;
        VolatilityTier tier;
        std::chrono::steady_clock::time_point expires_at;
        std::list<std::string>::iterator lru_iterator;
    };

    bool is_expired(const CacheEntry& entry, std::chrono::steady_clock::time_point now) const;
    void erase_locked(std::unordered_map<std::string, CacheEntry>::iterator it);
    void evict_lru_locked();

    const CacheTtls ttls_;
    const size_t max_entries_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> cache_;
    std::list<std::string> lru_list_;

    uint64_t hit_count_ = 0;
    uint64_t miss_count_ = 0;
    uint64_t eviction_count_ = 0;
    uint64_t expiration_count_ = 0;
};
