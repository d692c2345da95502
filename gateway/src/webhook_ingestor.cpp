#include "webhook_ingestor.hpp"
#include "util.hpp"
#include "webhook_payload.hpp"
#include <spdlog/spdlog.h>

namespace {

const std::string kBearerPrefix = "Bearer ";

}

WebhookIngestor::WebhookIngestor(std::string shared_secret, RateLimiter& limiter, DedupStore& dedup,
                                 const SignalExtractor& extractor, EventDispatcher& dispatcher,
                                 MetricsCollector& metrics, const Clock& clock)
    : shared_secret_(std::move(shared_secret)),
      limiter_(limiter),
      dedup_(dedup),
      extractor_(extractor),
      dispatcher_(dispatcher),
      metrics_(metrics),
      clock_(clock) {
}

IngestResponse WebhookIngestor::handle(const IngestRequest& request) {
    const auto start = clock_.steady_now();
    metrics_.record_webhook_received();

    const std::string source = source_key(request);
    auto decision = limiter_.check(source);
    if (!decision.allowed) {
        auto response = reject(ErrorCode::RateLimitExceeded, "rate limit exceeded for " + source, start);
        response.retry_after_seconds = static_cast<int>(decision.retry_after.count());
        return response;
    }

    // Unauthenticated bodies are never parsed
    if (!authenticate(request.authorization)) {
        spdlog::warn("Rejected webhook from {} for {}: bad or missing bearer token", source, request.provider);
        return reject(ErrorCode::AuthenticationFailed, "invalid or missing bearer token", start);
    }

    std::vector<WebhookEvent> events;
    try {
        events = parse_webhook_events(request.body, request.provider, clock_.system_now());
    } catch (const GatewayError& e) {
        spdlog::warn("Rejected webhook from {} for {}: {}", source, request.provider, e.what());
        return reject(e.code(), e.what(), start);
    }

    size_t duplicates = 0;
    std::vector<WebhookEvent> accepted;
    accepted.reserve(events.size());
    for (auto& event : events) {
        event.authenticated = true;
        if (!dedup_.mark_if_new(event.signature)) {
            duplicates++;
            continue;
        }
        accepted.push_back(std::move(event));
    }
    metrics_.record_duplicates(duplicates);
    metrics_.record_events_accepted(accepted.size());

    IngestResponse response;
    response.status = 200;

    if (accepted.empty()) {
        spdlog::debug("Webhook batch of {} from {} was fully replayed", events.size(), request.provider);
        response.body = {
            {"ok", true},
            {"duplicate", true},
            {"received", events.size()},
            {"accepted", 0}
        };
        metrics_.record_webhook_succeeded(elapsed_ms(start));
        return response;
    }

    size_t signals = 0;
    size_t risks = 0;
    size_t dispatched = 0;
    size_t dispatch_failures = 0;

    try {
        std::vector<nlohmann::json> documents;
        for (const auto& event : accepted) {
            auto extraction = extractor_.extract(event);
            metrics_.record_extraction(extraction.signals.size(), extraction.risks.size());
            signals += extraction.signals.size();
            risks += extraction.risks.size();

            if (!extraction.empty()) {
                documents.push_back(EventDispatcher::build_document(event, extraction));
            }
        }

        dispatched = documents.size();
        for (const auto& results : dispatcher_.dispatch_batch(documents)) {
            for (const auto& result : results) {
                if (!result.success) {
                    dispatch_failures++;
                }
            }
        }
    } catch (const std::exception& e) {
        // Let the sender's retry through instead of answering it as a duplicate
        spdlog::error("Webhook from {} failed after dedup, releasing {} signatures: {}",
                      request.provider, accepted.size(), e.what());
        for (const auto& event : accepted) {
            dedup_.forget(event.signature);
        }
        throw;
    }

    response.body = {
        {"ok", true},
        {"duplicate", false},
        {"received", events.size()},
        {"accepted", accepted.size()},
        {"duplicates", duplicates},
        {"signals", signals},
        {"risk_indicators", risks},
        {"dispatched", dispatched},
        {"dispatch_failures", dispatch_failures}
    };

    metrics_.record_webhook_succeeded(elapsed_ms(start));
    spdlog::info("Webhook from {} ({}): {} events, {} new, {} signals, {} risks",
                 request.provider, source, events.size(), accepted.size(), signals, risks);
    return response;
}

bool WebhookIngestor::authenticate(const std::string& authorization) const {
    if (!util::starts_with(authorization, kBearerPrefix)) {
        return false;
    }
    const std::string token = util::trim(authorization.substr(kBearerPrefix.size()));
    if (token.empty()) {
        return false;
    }
    return util::constant_time_equals(token, shared_secret_);
}

std::string WebhookIngestor::source_key(const IngestRequest& request) {
    if (!request.forwarded_for.empty()) {
        auto first = util::trim(request.forwarded_for.substr(0, request.forwarded_for.find(',')));
        if (!first.empty()) {
            return first;
        }
    }
    if (!request.real_ip.empty()) {
        return util::trim(request.real_ip);
    }
    return request.remote_addr.empty() ? "unknown" : request.remote_addr;
}

IngestResponse WebhookIngestor::reject(ErrorCode code, const std::string& message,
                                       std::chrono::steady_clock::time_point start) {
    metrics_.record_webhook_failed(code, elapsed_ms(start));

    IngestResponse response;
    response.status = http_status_for(code);
    response.body = {
        {"ok", false},
        {"error", error_code_name(code)},
        {"message", message}
    };
    return response;
}

double WebhookIngestor::elapsed_ms(std::chrono::steady_clock::time_point start) const {
    return std::chrono::duration<double, std::milli>(clock_.steady_now() - start).count();
}
