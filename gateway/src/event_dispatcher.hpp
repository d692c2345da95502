#pragma once
#include "config.hpp"
#include "metrics_collector.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sw {
namespace redis {
class Redis;
}
}

class DispatchTarget {
public:
    virtual ~DispatchTarget() = default;

    virtual const std::string& id() const = 0;
    virtual std::chrono::milliseconds timeout() const = 0;

    // Throws on any delivery failure
    virtual void deliver(const std::string& body) = 0;
};

// POSTs the document, expects 2xx
class HttpDispatchTarget : public DispatchTarget {
public:
    HttpDispatchTarget(std::string url, std::chrono::milliseconds timeout);

    const std::string& id() const override { return url_; }
    std::chrono::milliseconds timeout() const override { return timeout_; }
    void deliver(const std::string& body) override;

private:
    const std::string url_;
    const std::chrono::milliseconds timeout_;
};

// redis://host:port/stream, appended with XADD under field "data"
class RedisStreamTarget : public DispatchTarget {
public:
    RedisStreamTarget(const std::string& url, std::chrono::milliseconds timeout);
    ~RedisStreamTarget() override;

    const std::string& id() const override { return url_; }
    std::chrono::milliseconds timeout() const override { return timeout_; }
    void deliver(const std::string& body) override;

private:
    const std::string url_;
    const std::chrono::milliseconds timeout_;
    std::string stream_;
    std::unique_ptr<sw::redis::Redis> redis_;
};

std::shared_ptr<DispatchTarget> make_dispatch_target(const DispatchTargetConfig& config);

class EventDispatcher {
public:
    static constexpr size_t kDefaultMaxInFlight = 64;

    EventDispatcher(std::vector<std::shared_ptr<DispatchTarget>> targets,
                    std::chrono::milliseconds global_timeout, MetricsCollector* metrics = nullptr,
                    size_t max_in_flight_per_target = kDefaultMaxInFlight);

    // Contacts every target concurrently; returns one result per target once all have
    // finished or their timeout (bounded by the global ceiling) has passed
    std::vector<DispatchResult> dispatch(const WebhookEvent& event, const ExtractionResult& extraction);

    std::vector<DispatchResult> dispatch_document(const nlohmann::json& document);

    // Fans out every document at once and waits on a single deadline for the whole batch
    std::vector<std::vector<DispatchResult>> dispatch_batch(const std::vector<nlohmann::json>& documents);

    size_t target_count() const { return targets_.size(); }

    // Deliveries still running, including ones abandoned after a timeout
    size_t in_flight(size_t target_index) const;

    static nlohmann::json build_document(const WebhookEvent& event, const ExtractionResult& extraction);

private:
    std::vector<std::shared_ptr<DispatchTarget>> targets_;
    std::vector<std::shared_ptr<std::atomic<size_t>>> in_flight_;
    const std::chrono::milliseconds global_timeout_;
    MetricsCollector* metrics_;
    const size_t max_in_flight_;
};
