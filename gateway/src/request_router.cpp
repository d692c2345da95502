#include "request_router.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_map>

OperationDescriptor OperationDescriptor::from_request(const RpcRequest& request) {
    OperationDescriptor op;
    op.method = request.method;
    op.requires_enhanced_data = request.requires_enhanced_data;
    op.requires_push = request.requires_push;
    op.preferred_provider = request.preferred_provider;
    return op;
}

RequestRouter::RequestRouter(const ProviderRegistry& registry, UsageTracker& usage,
                             const CircuitBreakerBank& breakers, RoutingPolicy default_policy)
    : registry_(registry),
      usage_(usage),
      breakers_(breakers),
      default_policy_(default_policy) {
}

std::vector<Provider> RequestRouter::rank(const OperationDescriptor& op,
                                          std::optional<RoutingPolicy> policy) {
    std::vector<Provider> eligible;
    for (const auto& p : registry_.list_providers()) {
        if (is_eligible(p, op)) {
            eligible.push_back(p);
        }
    }

    if (eligible.empty()) {
        spdlog::debug("No eligible provider for {} ({} excluded)", op.method, op.excluded.size());
        return eligible;
    }

    const RoutingPolicy effective = policy.value_or(default_policy_);
    order_by_policy(eligible, effective);

    // Cost and round-robin orders change only through eligibility
    if (effective == RoutingPolicy::PerformanceFirst || effective == RoutingPolicy::EnhancedDataFirst) {
        std::stable_partition(eligible.begin(), eligible.end(),
                              [](const Provider& p) { return p.health != ProviderHealth::Down; });
    }

    if (op.preferred_provider) {
        auto it = std::find_if(eligible.begin(), eligible.end(),
                               [&](const Provider& p) { return p.id == *op.preferred_provider; });
        if (it != eligible.end()) {
            std::rotate(eligible.begin(), it, it + 1);
        }
    }

    return eligible;
}

std::optional<Provider> RequestRouter::select(const OperationDescriptor& op,
                                              std::optional<RoutingPolicy> policy) {
    auto ranked = rank(op, policy);
    if (ranked.empty()) {
        return std::nullopt;
    }
    return ranked.front();
}

bool RequestRouter::is_eligible(const Provider& p, const OperationDescriptor& op) {
    if (op.excluded.count(p.id)) {
        return false;
    }

    if (op.requires_enhanced_data && !p.supports_enhanced_data) {
        return false;
    }

    if (op.requires_push && !p.supports_push) {
        return false;
    }

    auto* breaker = breakers_.get(p.id);
    if (!breaker || !breaker->is_call_permitted()) {
        return false;
    }

    if (usage_.is_over_quota(p.id) || usage_.is_rate_limited(p.id)) {
        return false;
    }

    return true;
}

void RequestRouter::order_by_policy(std::vector<Provider>& providers, RoutingPolicy policy) {
    auto by_cost = [](const Provider& a, const Provider& b) {
        if (a.cost_per_request != b.cost_per_request) {
            return a.cost_per_request < b.cost_per_request;
        }
        return a.avg_latency_ms < b.avg_latency_ms;
    };

    switch (policy) {
        case RoutingPolicy::CostOptimized:
            std::stable_sort(providers.begin(), providers.end(), by_cost);
            break;

        case RoutingPolicy::PerformanceFirst: {
            std::unordered_map<std::string, double> remaining;
            for (const auto& p : providers) {
                remaining[p.id] = usage_.remaining_fraction(p.id);
            }
            std::stable_sort(providers.begin(), providers.end(),
                             [&remaining](const Provider& a, const Provider& b) {
                                 if (a.avg_latency_ms != b.avg_latency_ms) {
                                     return a.avg_latency_ms < b.avg_latency_ms;
                                 }
                                 return remaining[a.id] > remaining[b.id];
                             });
            break;
        }

        case RoutingPolicy::RoundRobin:
            rotate_round_robin(providers);
            break;

        case RoutingPolicy::WeightedRoundRobin:
            rotate_weighted(providers);
            break;

        case RoutingPolicy::EnhancedDataFirst:
            std::stable_sort(providers.begin(), providers.end(), by_cost);
            std::stable_partition(providers.begin(), providers.end(),
                                  [](const Provider& p) { return p.supports_enhanced_data; });
            break;
    }
}

void RequestRouter::rotate_round_robin(std::vector<Provider>& eligible) {
    size_t start;
    {
        std::lock_guard<std::mutex> lock(rr_mutex_);
        start = static_cast<size_t>(rr_counter_++ % eligible.size());
    }
    std::rotate(eligible.begin(), eligible.begin() + start, eligible.end());
}

void RequestRouter::rotate_weighted(std::vector<Provider>& eligible) {
    uint64_t total_weight = 0;
    for (const auto& p : eligible) {
        total_weight += static_cast<uint64_t>(std::max(1, p.priority));
    }

    uint64_t slot;
    {
        std::lock_guard<std::mutex> lock(rr_mutex_);
        slot = weighted_counter_++ % total_weight;
    }

    // Walk the cumulative weights to find the slot owner
    size_t chosen = 0;
    uint64_t cumulative = 0;
    for (size_t i = 0; i < eligible.size(); ++i) {
        cumulative += static_cast<uint64_t>(std::max(1, eligible[i].priority));
        if (slot < cumulative) {
            chosen = i;
            break;
        }
    }

    std::rotate(eligible.begin(), eligible.begin() + chosen, eligible.end());
}
