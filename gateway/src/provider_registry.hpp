#pragma once
#include "types.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

class ProviderRegistry {
public:
    explicit ProviderRegistry(const std::vector<Provider>& providers);

    // Snapshot of all providers in registration order
    std::vector<Provider> list_providers() const;

    std::optional<Provider> find(const std::string& id) const;

    bool contains(const std::string& id) const;

    // Folds one call outcome into the moving success rate and latency, re-derives health
    bool record_outcome(const std::string& id, bool success, double latency_ms);

    bool set_health(const std::string& id, ProviderHealth health);

    size_t size() const { return entries_.size(); }

    static constexpr double kEmaWeight = 0.1;
    static ProviderHealth health_for_success_rate(double success_rate);

private:
    struct Entry {
        mutable std::mutex mutex;
        Provider provider;
        bool has_latency_sample = false;
    };

    Entry* entry_for(const std::string& id) const;

    std::vector<std::unique_ptr<Entry>> entries_;
    std::unordered_map<std::string, size_t> index_;
};
