#include "provider_gateway.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

ProviderGateway::ProviderGateway(CacheLayer& cache, ResilientExecutor& executor,
                                 MetricsCollector& metrics)
    : cache_(cache), executor_(executor), metrics_(metrics) {
}

CallResult ProviderGateway::call(const RpcRequest& request) {
    return call(request, default_tier_for(request.method));
}

CallResult ProviderGateway::call(const RpcRequest& request, std::optional<VolatilityTier> tier) {
    std::string key;
    if (tier) {
        key = cache_key(request);
        if (auto cached = cache_.get(key)) {
            metrics_.record_cache_hit();

            CallResult result;
            result.status = CallStatus::Success;
            result.payload = std::move(*cached);
            result.provider_id = "cache";
            result.stage = "cache";
            result.from_cache = true;
            return result;
        }
        metrics_.record_cache_miss();
    }

    CallResult result = executor_.execute(request);

    // Degraded and failed results are never cached
    if (tier && result.ok()) {
        cache_.put(key, *tier, result.payload);
        spdlog::debug("Cached {} for {}s", request.method, cache_.ttl_for(*tier).count());
    }

    return result;
}

std::string ProviderGateway::cache_key(const RpcRequest& request) {
    std::string key = CacheLayer::make_key(request.method, request.params);
    // Answers from a restricted provider set are kept apart from general ones
    if (request.requires_enhanced_data) {
        key += "|enhanced";
    }
    if (request.requires_push) {
        key += "|push";
    }
    if (request.preferred_provider) {
        key += "|via=" + *request.preferred_provider;
    }
    return key;
}

VolatilityTier ProviderGateway::default_tier_for(const std::string& method) {
    static const std::unordered_map<std::string, VolatilityTier> tiers = {
        {"getSlot", VolatilityTier::Hot},
        {"getLatestBlockhash", VolatilityTier::Hot},
        {"getRecentPrioritizationFees", VolatilityTier::Hot},
        {"getBalance", VolatilityTier::Warm},
        {"getTokenAccountsByOwner", VolatilityTier::Warm},
        {"getTokenLargestAccounts", VolatilityTier::Warm},
        {"getSignaturesForAddress", VolatilityTier::Warm},
        {"getAccountInfo", VolatilityTier::Cold},
        {"getTransaction", VolatilityTier::Cold},
        {"getTokenSupply", VolatilityTier::Cold},
        {"getAsset", VolatilityTier::Frozen},
        {"getGenesisHash", VolatilityTier::Frozen},
        {"getTokenMetadata", VolatilityTier::Frozen}
    };

    auto it = tiers.find(method);
    return it == tiers.end() ? VolatilityTier::Warm : it->second;
}
