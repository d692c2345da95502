#include "provider_transport.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

nlohmann::json build_rpc_request(uint64_t id, const std::string& method, const nlohmann::json& params) {
    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

RpcOutcome interpret_rpc_response(const TransportResponse& response) {
    RpcOutcome outcome;

    if (!response.reached) {
        outcome.error = response.timed_out ? "timeout" : "transport error: " + response.error;
        return outcome;
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        outcome.error = fmt::format("http status {}", response.status_code);
        return outcome;
    }

    auto json_response = nlohmann::json::parse(response.body, nullptr, false);
    if (json_response.is_discarded() || !json_response.is_object()) {
        outcome.error = "unparseable response body";
        return outcome;
    }

    if (json_response.contains("error") && !json_response["error"].is_null()) {
        outcome.error = "rpc error: " + json_response["error"].dump();
        return outcome;
    }

    if (!json_response.contains("result")) {
        outcome.error = "response has no result";
        return outcome;
    }

    outcome.success = true;
    outcome.result = json_response["result"];
    return outcome;
}

class HttpProviderTransport::Impl {
public:
    TransportResponse post(const Provider& provider, const std::string& body,
                           std::chrono::milliseconds timeout) {
        TransportResponse result;
        const auto start = std::chrono::steady_clock::now();

        try {
            auto response = cpr::Post(
                cpr::Url{build_url(provider)},
                cpr::Header{{"Content-Type", "application/json"}, {"User-Agent", "solrelay/1.0"}},
                cpr::Body{body},
                cpr::Timeout{timeout}
            );

            result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);

            if (response.error) {
                result.timed_out = response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT;
                result.error = response.error.message;
                spdlog::debug("Provider {} transport error: {}", provider.id, result.error);
                return result;
            }

            result.reached = true;
            result.status_code = static_cast<int>(response.status_code);
            result.body = std::move(response.text);

        } catch (const std::exception& e) {
            result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            result.error = e.what();
            spdlog::error("Provider {} request exception: {}", provider.id, e.what());
        }

        return result;
    }
};

HttpProviderTransport::HttpProviderTransport()
    : pImpl_(std::make_unique<Impl>()) {}

HttpProviderTransport::~HttpProviderTransport() = default;

TransportResponse HttpProviderTransport::post(const Provider& provider, const std::string& body,
                                              std::chrono::milliseconds timeout) {
    return pImpl_->post(provider, body, timeout);
}

std::string HttpProviderTransport::build_url(const Provider& provider) {
    if (provider.api_key.empty()) {
        return provider.endpoint;
    }
    if (util::ends_with(provider.endpoint, "/")) {
        return provider.endpoint + provider.api_key;
    }
    return provider.endpoint + "/" + provider.api_key;
}
