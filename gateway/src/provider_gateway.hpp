#pragma once
#include "cache_layer.hpp"
#include "metrics_collector.hpp"
#include "resilient_executor.hpp"
#include <optional>
#include <string>

// Entry point for internal callers that need chain data
class ProviderGateway {
public:
    ProviderGateway(CacheLayer& cache, ResilientExecutor& executor, MetricsCollector& metrics);

    // Caches under the method's default tier
    CallResult call(const RpcRequest& request);

    // nullopt tier bypasses the cache entirely
    CallResult call(const RpcRequest& request, std::optional<VolatilityTier> tier);

    static VolatilityTier default_tier_for(const std::string& method);

    // Method and params, qualified by any routing constraint on the request
    static std::string cache_key(const RpcRequest& request);

private:
    CacheLayer& cache_;
    ResilientExecutor& executor_;
    MetricsCollector& metrics_;
};
