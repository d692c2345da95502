#include "types.hpp"
#include "util.hpp"

const char* to_string(ProviderHealth health) {
    switch (health) {
        case ProviderHealth::Healthy:  return "healthy";
        case ProviderHealth::Degraded: return "degraded";
        case ProviderHealth::Down:     return "down";
    }
    return "unknown";
}

const char* to_string(RoutingPolicy policy) {
    switch (policy) {
        case RoutingPolicy::CostOptimized:      return "cost_optimized";
        case RoutingPolicy::PerformanceFirst:   return "performance_first";
        case RoutingPolicy::RoundRobin:         return "round_robin";
        case RoutingPolicy::WeightedRoundRobin: return "weighted_round_robin";
        case RoutingPolicy::EnhancedDataFirst:  return "enhanced_data_first";
    }
    return "unknown";
}

const char* to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

const char* to_string(VolatilityTier tier) {
    switch (tier) {
        case VolatilityTier::Hot:    return "hot";
        case VolatilityTier::Warm:   return "warm";
        case VolatilityTier::Cold:   return "cold";
        case VolatilityTier::Frozen: return "frozen";
    }
    return "unknown";
}

const char* to_string(CallStatus status) {
    switch (status) {
        case CallStatus::Success:  return "success";
        case CallStatus::Degraded: return "degraded";
        case CallStatus::Error:    return "error";
    }
    return "unknown";
}

RoutingPolicy parse_routing_policy(const std::string& name) {
    const std::string n = util::to_lower(util::trim(name));
    if (n == "cost_optimized") return RoutingPolicy::CostOptimized;
    if (n == "performance_first") return RoutingPolicy::PerformanceFirst;
    if (n == "round_robin") return RoutingPolicy::RoundRobin;
    if (n == "weighted_round_robin") return RoutingPolicy::WeightedRoundRobin;
    if (n == "enhanced_data_first") return RoutingPolicy::EnhancedDataFirst;
    throw GatewayError(ErrorCode::ValidationFailed, "Unknown routing strategy: " + name);
}

VolatilityTier parse_volatility_tier(const std::string& name) {
    const std::string n = util::to_lower(util::trim(name));
    if (n == "hot") return VolatilityTier::Hot;
    if (n == "warm") return VolatilityTier::Warm;
    if (n == "cold") return VolatilityTier::Cold;
    if (n == "frozen") return VolatilityTier::Frozen;
    throw GatewayError(ErrorCode::ValidationFailed, "Unknown volatility tier: " + name);
}

nlohmann::json Provider::to_json() const {
    return nlohmann::json{
        {"id", id},
        {"name", name},
        {"endpoint", endpoint},
        {"supports_enhanced_data", supports_enhanced_data},
        {"supports_push", supports_push},
        {"monthly_quota", monthly_quota},
        {"cost_per_request", cost_per_request},
        {"rpm_limit", rpm_limit},
        {"priority", priority},
        {"avg_latency_ms", avg_latency_ms},
        {"success_rate", success_rate},
        {"health", to_string(health)}
    };
}

Provider Provider::from_json(const nlohmann::json& j) {
    Provider p;
    p.id = j.at("id").get<std::string>();
    p.name = j.value("name", p.id);
    p.endpoint = j.at("endpoint").get<std::string>();
    p.api_key = j.value("api_key", "");
    // api_key_env lets the file name a variable instead of carrying the secret
    if (p.api_key.empty() && j.contains("api_key_env")) {
        p.api_key = util::get_env_var(j["api_key_env"].get<std::string>());
    }
    p.supports_enhanced_data = j.value("supports_enhanced_data", false);
    p.supports_push = j.value("supports_push", false);
    p.monthly_quota = j.value("monthly_quota", static_cast<uint64_t>(0));
    p.cost_per_request = j.value("cost_per_request", 0.0);
    p.rpm_limit = j.value("rpm_limit", 0);
    p.priority = j.value("priority", 5);
    return p;
}

nlohmann::json ExtractedSignal::to_json() const {
    return nlohmann::json{
        {"signal_type", type},
        {"strength", strength},
        {"confidence", confidence},
        {"metadata", metadata},
        {"event_id", event_id}
    };
}

nlohmann::json RiskIndicator::to_json() const {
    return nlohmann::json{
        {"risk_type", type},
        {"severity", severity},
        {"description", description},
        {"event_id", event_id}
    };
}

nlohmann::json DispatchResult::to_json() const {
    nlohmann::json j = {
        {"target", target},
        {"success", success},
        {"latency_ms", latency.count()}
    };
    if (!success) {
        j["error"] = error;
        if (error_code) {
            j["error_code"] = error_code_name(*error_code);
        }
    }
    return j;
}

nlohmann::json CallResult::to_json() const {
    nlohmann::json j = {
        {"status", to_string(status)},
        {"payload", payload},
        {"provider", provider_id},
        {"stage", stage},
        {"attempts", attempts},
        {"from_cache", from_cache}
    };
    if (!error.empty()) {
        j["error"] = error;
    }
    if (error_code) {
        j["error_code"] = error_code_name(*error_code);
    }
    return j;
}
