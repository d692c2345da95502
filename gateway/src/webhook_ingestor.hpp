#pragma once
#include "clock.hpp"
#include "dedup_store.hpp"
#include "event_dispatcher.hpp"
#include "metrics_collector.hpp"
#include "rate_limiter.hpp"
#include "signal_extractor.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Transport-neutral view of one webhook POST
struct IngestRequest {
    std::string provider;
    std::string authorization;
    std::string forwarded_for;
    std::string real_ip;
    std::string remote_addr;
    std::string body;
};

struct IngestResponse {
    int status = 200;
    nlohmann::json body;
    std::optional<int> retry_after_seconds;
};

class WebhookIngestor {
public:
    WebhookIngestor(std::string shared_secret, RateLimiter& limiter, DedupStore& dedup,
                    const SignalExtractor& extractor, EventDispatcher& dispatcher,
                    MetricsCollector& metrics, const Clock& clock);

    // rate limit -> auth -> parse -> dedup -> extract -> dispatch
    IngestResponse handle(const IngestRequest& request);

    bool authenticate(const std::string& authorization) const;

    // First X-Forwarded-For entry, else X-Real-IP, else the peer address
    static std::string source_key(const IngestRequest& request);

private:
    IngestResponse reject(ErrorCode code, const std::string& message,
                          std::chrono::steady_clock::time_point start);
    double elapsed_ms(std::chrono::steady_clock::time_point start) const;

    const std::string shared_secret_;
    RateLimiter& limiter_;
    DedupStore& dedup_;
    const SignalExtractor& extractor_;
    EventDispatcher& dispatcher_;
    MetricsCollector& metrics_;
    const Clock& clock_;
};
