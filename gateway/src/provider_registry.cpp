#include "provider_registry.hpp"
#include <spdlog/spdlog.h>

ProviderRegistry::ProviderRegistry(const std::vector<Provider>& providers) {
    entries_.reserve(providers.size());
    for (const auto& p : providers) {
        if (index_.count(p.id)) {
            spdlog::warn("Ignoring duplicate provider id {}", p.id);
            continue;
        }
        auto entry = std::make_unique<Entry>();
        entry->provider = p;
        entry->has_latency_sample = p.avg_latency_ms > 0.0;
        index_[p.id] = entries_.size();
        entries_.push_back(std::move(entry));
    }
    spdlog::info("Provider registry initialized with {} providers", entries_.size());
}

std::vector<Provider> ProviderRegistry::list_providers() const {
    std::vector<Provider> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        result.push_back(entry->provider);
    }
    return result;
}

std::optional<Provider> ProviderRegistry::find(const std::string& id) const {
    Entry* entry = entry_for(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->provider;
}

bool ProviderRegistry::contains(const std::string& id) const {
    return index_.count(id) > 0;
}

bool ProviderRegistry::record_outcome(const std::string& id, bool success, double latency_ms) {
    Entry* entry = entry_for(id);
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    auto& p = entry->provider;

    const double sample = success ? 100.0 : 0.0;
    p.success_rate = p.success_rate * (1.0 - kEmaWeight) + sample * kEmaWeight;

    if (latency_ms >= 0.0) {
        if (!entry->has_latency_sample) {
            p.avg_latency_ms = latency_ms;
            entry->has_latency_sample = true;
        } else {
            p.avg_latency_ms = p.avg_latency_ms * (1.0 - kEmaWeight) + latency_ms * kEmaWeight;
        }
    }

    ProviderHealth health = health_for_success_rate(p.success_rate);
    if (health != p.health) {
        spdlog::info("Provider {} health {} -> {} (success rate {:.1f}%)",
                     id, to_string(p.health), to_string(health), p.success_rate);
        p.health = health;
    }
    return true;
}

bool ProviderRegistry::set_health(const std::string& id, ProviderHealth health) {
    Entry* entry = entry_for(id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->provider.health = health;
    return true;
}

ProviderHealth ProviderRegistry::health_for_success_rate(double success_rate) {
    if (success_rate > 80.0) return ProviderHealth::Healthy;
    if (success_rate > 50.0) return ProviderHealth::Degraded;
    return ProviderHealth::Down;
}

ProviderRegistry::Entry* ProviderRegistry::entry_for(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return entries_[it->second].get();
}
