#include "event_dispatcher.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace {

// Shared with the worker threads, which may outlive a timed-out dispatch
struct DispatchState {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::optional<DispatchResult>> results;
    size_t pending = 0;
};

void complete(DispatchState& state, size_t slot, DispatchResult result) {
    std::lock_guard<std::mutex> lock(state.mutex);
    state.results[slot] = std::move(result);
    state.pending--;
    state.cv.notify_all();
}

DispatchResult timeout_result(const std::string& target, const std::string& error,
                              std::chrono::milliseconds latency) {
    DispatchResult result;
    result.target = target;
    result.error = error;
    result.error_code = ErrorCode::DownstreamTimeout;
    result.latency = latency;
    return result;
}

}

HttpDispatchTarget::HttpDispatchTarget(std::string url, std::chrono::milliseconds timeout)
    : url_(std::move(url)), timeout_(timeout) {}

void HttpDispatchTarget::deliver(const std::string& body) {
    auto response = cpr::Post(
        cpr::Url{url_},
        cpr::Header{{"Content-Type", "application/json"}, {"User-Agent", "solrelay/1.0"}},
        cpr::Body{body},
        cpr::Timeout{timeout_}
    );

    if (response.error) {
        if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            throw GatewayError(ErrorCode::DownstreamTimeout, "timed out: " + response.error.message);
        }
        throw std::runtime_error(response.error.message);
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        throw std::runtime_error(fmt::format("status {}", response.status_code));
    }
}

RedisStreamTarget::RedisStreamTarget(const std::string& url, std::chrono::milliseconds timeout)
    : url_(url), timeout_(timeout) {
    // redis://host:port/stream
    std::string rest = url.substr(std::string("redis://").size());
    auto slash = rest.find('/');
    if (slash == std::string::npos || slash + 1 >= rest.size()) {
        throw GatewayError(ErrorCode::ValidationFailed, "Redis target needs a stream name: " + url);
    }
    stream_ = rest.substr(slash + 1);
    std::string host_port = rest.substr(0, slash);

    sw::redis::ConnectionOptions connection_opts;
    auto colon = host_port.find(':');
    connection_opts.host = host_port.substr(0, colon);
    if (colon != std::string::npos) {
        try {
            connection_opts.port = std::stoi(host_port.substr(colon + 1));
        } catch (const std::exception&) {
            throw GatewayError(ErrorCode::ValidationFailed, "Invalid Redis port in " + url);
        }
    }
    connection_opts.connect_timeout = timeout;
    connection_opts.socket_timeout = timeout;

    sw::redis::ConnectionPoolOptions pool_opts;
    pool_opts.size = 4;
    // Workers waiting for a pooled connection give up with the target
    pool_opts.wait_timeout = timeout;

    redis_ = std::make_unique<sw::redis::Redis>(connection_opts, pool_opts);
}

RedisStreamTarget::~RedisStreamTarget() = default;

void RedisStreamTarget::deliver(const std::string& body) {
    std::unordered_map<std::string, std::string> fields;
    fields["data"] = body;

    try {
        redis_->xadd(stream_, "*", fields.begin(), fields.end());
    } catch (const sw::redis::TimeoutError& e) {
        throw GatewayError(ErrorCode::DownstreamTimeout, e.what());
    }
}

std::shared_ptr<DispatchTarget> make_dispatch_target(const DispatchTargetConfig& config) {
    auto timeout = std::chrono::milliseconds(config.timeout_ms);
    if (util::starts_with(config.url, "http://") || util::starts_with(config.url, "https://")) {
        return std::make_shared<HttpDispatchTarget>(config.url, timeout);
    }
    if (util::starts_with(config.url, "redis://")) {
        return std::make_shared<RedisStreamTarget>(config.url, timeout);
    }
    throw GatewayError(ErrorCode::ValidationFailed, "Unsupported dispatch target: " + config.url);
}

EventDispatcher::EventDispatcher(std::vector<std::shared_ptr<DispatchTarget>> targets,
                                 std::chrono::milliseconds global_timeout, MetricsCollector* metrics,
                                 size_t max_in_flight_per_target)
    : targets_(std::move(targets)),
      global_timeout_(global_timeout),
      metrics_(metrics),
      max_in_flight_(std::max<size_t>(1, max_in_flight_per_target)) {
    for (size_t i = 0; i < targets_.size(); ++i) {
        in_flight_.push_back(std::make_shared<std::atomic<size_t>>(0));
    }
    spdlog::info("Event dispatcher configured with {} targets", targets_.size());
}

std::vector<DispatchResult> EventDispatcher::dispatch(const WebhookEvent& event,
                                                      const ExtractionResult& extraction) {
    return dispatch_document(build_document(event, extraction));
}

std::vector<DispatchResult> EventDispatcher::dispatch_document(const nlohmann::json& document) {
    auto batch = dispatch_batch({document});
    return std::move(batch.front());
}

size_t EventDispatcher::in_flight(size_t target_index) const {
    return in_flight_.at(target_index)->load();
}

std::vector<std::vector<DispatchResult>> EventDispatcher::dispatch_batch(
        const std::vector<nlohmann::json>& documents) {
    std::vector<std::vector<DispatchResult>> batch(documents.size());
    if (targets_.empty() || documents.empty()) {
        return batch;
    }

    const size_t target_count = targets_.size();
    const auto start = std::chrono::steady_clock::now();

    auto state = std::make_shared<DispatchState>();
    state->results.resize(documents.size() * target_count);
    state->pending = state->results.size();

    std::chrono::milliseconds max_wait{0};
    for (const auto& target : targets_) {
        max_wait = std::max(max_wait, target->timeout());
    }

    for (size_t d = 0; d < documents.size(); ++d) {
        const std::string body = documents[d].dump();

        for (size_t i = 0; i < target_count; ++i) {
            const size_t slot = d * target_count + i;
            std::shared_ptr<DispatchTarget> target = targets_[i];
            std::shared_ptr<std::atomic<size_t>> in_flight = in_flight_[i];

            if (in_flight->fetch_add(1) >= max_in_flight_) {
                in_flight->fetch_sub(1);
                complete(*state, slot, timeout_result(target->id(),
                    fmt::format("{} deliveries already in flight", max_in_flight_),
                    std::chrono::milliseconds(0)));
                continue;
            }

            try {
                std::thread([state, target, in_flight, body, slot, start]() {
                    DispatchResult result;
                    result.target = target->id();
                    try {
                        target->deliver(body);
                        result.success = true;
                    } catch (const GatewayError& e) {
                        result.error = e.what();
                        result.error_code = e.code();
                    } catch (const std::exception& e) {
                        result.error = e.what();
                    }
                    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start);

                    in_flight->fetch_sub(1);
                    complete(*state, slot, std::move(result));
                }).detach();
            } catch (const std::system_error& e) {
                in_flight->fetch_sub(1);
                DispatchResult failed;
                failed.target = target->id();
                failed.error = fmt::format("could not start delivery: {}", e.what());
                complete(*state, slot, std::move(failed));
            }
        }
    }

    const auto deadline = start + std::min(max_wait, global_timeout_);
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->cv.wait_until(lock, deadline, [&state]() { return state->pending == 0; });

        for (size_t d = 0; d < documents.size(); ++d) {
            for (size_t i = 0; i < target_count; ++i) {
                const auto& slot = state->results[d * target_count + i];
                if (slot) {
                    auto result = *slot;
                    // A late answer past the target's own timeout still counts as a timeout
                    if (result.success && result.latency > targets_[i]->timeout()) {
                        result.success = false;
                        result.error = "completed after target timeout";
                        result.error_code = ErrorCode::DownstreamTimeout;
                    }
                    batch[d].push_back(std::move(result));
                } else {
                    batch[d].push_back(timeout_result(targets_[i]->id(), "no response within timeout",
                        std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - start)));
                }
            }
        }
    }

    for (const auto& results : batch) {
        for (const auto& r : results) {
            if (metrics_) {
                metrics_->record_dispatch(r);
            }
            if (!r.success) {
                spdlog::warn("Dispatch to {} failed after {}ms: {}", r.target, r.latency.count(), r.error);
            }
        }
    }

    return batch;
}

nlohmann::json EventDispatcher::build_document(const WebhookEvent& event,
                                               const ExtractionResult& extraction) {
    nlohmann::json signals = nlohmann::json::array();
    for (const auto& s : extraction.signals) {
        signals.push_back(s.to_json());
    }

    nlohmann::json risks = nlohmann::json::array();
    for (const auto& r : extraction.risks) {
        risks.push_back(r.to_json());
    }

    return nlohmann::json{
        {"event_id", event.signature},
        {"source", event.source},
        {"signals", signals},
        {"risk_indicators", risks},
        {"timestamp", util::format_timestamp(event.received_at)},
        {"chain_timestamp", event.timestamp}
    };
}
