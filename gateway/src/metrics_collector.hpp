#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <string>

// Keeps the most recent samples and answers percentile queries over them
class LatencyReservoir {
public:
    explicit LatencyReservoir(size_t capacity = 1024);

    void add(double value_ms);

    size_t count() const;
    double percentile(double p) const;

    nlohmann::json to_json() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<double> samples_;
    uint64_t total_samples_ = 0;
};

class MetricsCollector {
public:
    MetricsCollector() = default;

    // Ingress
    void record_webhook_received();
    void record_webhook_succeeded(double latency_ms);
    void record_webhook_failed(ErrorCode reason, double latency_ms);
    void record_duplicates(size_t count);
    void record_events_accepted(size_t count);
    void record_extraction(size_t signals, size_t risks);

    // Fan-out
    void record_dispatch(const DispatchResult& result);

    // Outbound provider calls
    void record_provider_call(const std::string& provider_id, bool success, double latency_ms);
    void record_failover(const std::string& from_provider_id);
    void record_degraded_result();
    void record_cache_hit();
    void record_cache_miss();

    uint64_t webhooks_received() const { return webhooks_received_.load(); }
    uint64_t webhooks_succeeded() const { return webhooks_succeeded_.load(); }
    uint64_t webhooks_failed() const { return webhooks_failed_.load(); }
    uint64_t duplicates() const { return duplicates_.load(); }
    uint64_t degraded_results() const { return degraded_results_.load(); }
    uint64_t rejections(ErrorCode reason) const;

    nlohmann::json to_json() const;

private:
    struct ProviderCounters {
        uint64_t requests = 0;
        uint64_t successes = 0;
        uint64_t failures = 0;
        uint64_t failovers = 0;
    };

    struct TargetCounters {
        uint64_t successes = 0;
        uint64_t failures = 0;
        uint64_t timeouts = 0;
    };

    std::atomic<uint64_t> webhooks_received_{0};
    std::atomic<uint64_t> webhooks_succeeded_{0};
    std::atomic<uint64_t> webhooks_failed_{0};
    std::atomic<uint64_t> duplicates_{0};
    std::atomic<uint64_t> events_accepted_{0};
    std::atomic<uint64_t> signals_emitted_{0};
    std::atomic<uint64_t> risks_emitted_{0};
    std::atomic<uint64_t> degraded_results_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> cache_misses_{0};

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> rejections_;
    std::map<std::string, ProviderCounters> providers_;
    std::map<std::string, TargetCounters> targets_;

    LatencyReservoir ingestion_latency_;
    LatencyReservoir provider_latency_;
    LatencyReservoir dispatch_latency_;
};
