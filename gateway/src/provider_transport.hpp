#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

struct TransportResponse {
    bool reached = false;       // an HTTP response came back
    bool timed_out = false;
    int status_code = 0;
    std::string body;
    std::string error;
    std::chrono::milliseconds latency{0};
};

// Interpreted JSON-RPC reply: result on success, reason otherwise
struct RpcOutcome {
    bool success = false;
    nlohmann::json result;
    std::string error;
};

nlohmann::json build_rpc_request(uint64_t id, const std::string& method, const nlohmann::json& params);

// Fails on transport error, non-2xx status, unparseable body, an `error` member or a missing `result`
RpcOutcome interpret_rpc_response(const TransportResponse& response);

class ProviderTransport {
public:
    virtual ~ProviderTransport() = default;

    // POSTs a JSON-RPC body to the provider; never throws
    virtual TransportResponse post(const Provider& provider, const std::string& body,
                                   std::chrono::milliseconds timeout) = 0;
};

class HttpProviderTransport : public ProviderTransport {
public:
    HttpProviderTransport();
    ~HttpProviderTransport() override;

    TransportResponse post(const Provider& provider, const std::string& body,
                           std::chrono::milliseconds timeout) override;

    // Endpoint with the API key appended as a path segment when one is set
    static std::string build_url(const Provider& provider);

    HttpProviderTransport(const HttpProviderTransport&) = delete;
    HttpProviderTransport& operator=(const HttpProviderTransport&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
