#include "metrics_collector.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

LatencyReservoir::LatencyReservoir(size_t capacity)
    : capacity_(capacity) {
}

void LatencyReservoir::add(double value_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(value_ms);
    total_samples_++;
    while (samples_.size() > capacity_) {
        samples_.pop_front();
    }
}

size_t LatencyReservoir::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

// Nearest-rank percentile over the retained samples
double LatencyReservoir::percentile(double p) const {
    std::vector<double> sorted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sorted.assign(samples_.begin(), samples_.end());
    }
    if (sorted.empty()) {
        return 0.0;
    }

    std::sort(sorted.begin(), sorted.end());
    double rank = std::ceil(p / 100.0 * static_cast<double>(sorted.size()));
    size_t index = rank < 1.0 ? 0 : static_cast<size_t>(rank) - 1;
    return sorted[std::min(index, sorted.size() - 1)];
}

nlohmann::json LatencyReservoir::to_json() const {
    uint64_t total;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = total_samples_;
    }
    return nlohmann::json{
        {"samples", total},
        {"p50_ms", percentile(50)},
        {"p90_ms", percentile(90)},
        {"p99_ms", percentile(99)}
    };
}

void MetricsCollector::record_webhook_received() {
    webhooks_received_++;
}

void MetricsCollector::record_webhook_succeeded(double latency_ms) {
    webhooks_succeeded_++;
    ingestion_latency_.add(latency_ms);
}

void MetricsCollector::record_webhook_failed(ErrorCode reason, double latency_ms) {
    webhooks_failed_++;
    ingestion_latency_.add(latency_ms);

    std::lock_guard<std::mutex> lock(mutex_);
    rejections_[error_code_name(reason)]++;
}

void MetricsCollector::record_duplicates(size_t count) {
    duplicates_ += count;
}

void MetricsCollector::record_events_accepted(size_t count) {
    events_accepted_ += count;
}

void MetricsCollector::record_extraction(size_t signals, size_t risks) {
    signals_emitted_ += signals;
    risks_emitted_ += risks;
}

void MetricsCollector::record_dispatch(const DispatchResult& result) {
    dispatch_latency_.add(static_cast<double>(result.latency.count()));

    std::lock_guard<std::mutex> lock(mutex_);
    auto& counters = targets_[result.target];
    if (result.success) {
        counters.successes++;
    } else if (result.error_code && *result.error_code == ErrorCode::DownstreamTimeout) {
        counters.timeouts++;
    } else {
        counters.failures++;
    }
}

void MetricsCollector::record_provider_call(const std::string& provider_id, bool success,
                                            double latency_ms) {
    provider_latency_.add(latency_ms);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& counters = providers_[provider_id];
    counters.requests++;
    if (success) {
        counters.successes++;
    } else {
        counters.failures++;
    }
}

void MetricsCollector::record_failover(const std::string& from_provider_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[from_provider_id].failovers++;
}

void MetricsCollector::record_degraded_result() {
    degraded_results_++;
}

void MetricsCollector::record_cache_hit() {
    cache_hits_++;
}

void MetricsCollector::record_cache_miss() {
    cache_misses_++;
}

uint64_t MetricsCollector::rejections(ErrorCode reason) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rejections_.find(error_code_name(reason));
    return it == rejections_.end() ? 0 : it->second;
}

nlohmann::json MetricsCollector::to_json() const {
    const uint64_t hits = cache_hits_.load();
    const uint64_t misses = cache_misses_.load();

    nlohmann::json j = {
        {"webhooks", {
            {"received", webhooks_received_.load()},
            {"succeeded", webhooks_succeeded_.load()},
            {"failed", webhooks_failed_.load()},
            {"duplicates", duplicates_.load()},
            {"events_accepted", events_accepted_.load()},
            {"signals_emitted", signals_emitted_.load()},
            {"risk_indicators_emitted", risks_emitted_.load()},
            {"latency", ingestion_latency_.to_json()}
        }},
        {"cache", {
            {"hits", hits},
            {"misses", misses},
            {"hit_rate", hits + misses == 0 ? 0.0 : static_cast<double>(hits) / (hits + misses)}
        }},
        {"degraded_results", degraded_results_.load()},
        {"provider_latency", provider_latency_.to_json()},
        {"dispatch_latency", dispatch_latency_.to_json()}
    };

    std::lock_guard<std::mutex> lock(mutex_);

    j["webhooks"]["rejections"] = rejections_;

    nlohmann::json providers = nlohmann::json::object();
    for (const auto& [id, c] : providers_) {
        providers[id] = {
            {"requests", c.requests},
            {"successes", c.successes},
            {"failures", c.failures},
            {"failovers", c.failovers}
        };
    }
    j["providers"] = providers;

    nlohmann::json targets = nlohmann::json::object();
    for (const auto& [target, c] : targets_) {
        targets[target] = {
            {"successes", c.successes},
            {"failures", c.failures},
            {"timeouts", c.timeouts}
        };
    }
    j["dispatch_targets"] = targets;

    return j;
}
