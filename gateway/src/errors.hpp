#pragma once
#include <stdexcept>
#include <string>

enum class ErrorCode {
    AuthenticationFailed,
    RateLimitExceeded,
    ValidationFailed,
    ProviderUnavailable,
    QuotaExceeded,
    CircuitOpen,
    DownstreamTimeout,
    DegradedResult
};

const char* error_code_name(ErrorCode code);

// HTTP status the ingress boundary answers with for a terminal error
int http_status_for(ErrorCode code);

class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};
