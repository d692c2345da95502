#include "errors.hpp"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::AuthenticationFailed: return "authentication_failed";
        case ErrorCode::RateLimitExceeded:    return "rate_limit_exceeded";
        case ErrorCode::ValidationFailed:     return "validation_failed";
        case ErrorCode::ProviderUnavailable:  return "provider_unavailable";
        case ErrorCode::QuotaExceeded:        return "quota_exceeded";
        case ErrorCode::CircuitOpen:          return "circuit_open";
        case ErrorCode::DownstreamTimeout:    return "downstream_timeout";
        case ErrorCode::DegradedResult:       return "degraded_result";
    }
    return "unknown";
}

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::AuthenticationFailed: return 401;
        case ErrorCode::RateLimitExceeded:    return 429;
        case ErrorCode::ValidationFailed:     return 400;
        case ErrorCode::ProviderUnavailable:  return 503;
        default:                              return 500;
    }
}
