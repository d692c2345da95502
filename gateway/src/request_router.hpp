#pragma once
#include "circuit_breaker.hpp"
#include "provider_registry.hpp"
#include "usage_tracker.hpp"
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct OperationDescriptor {
    std::string method;
    bool requires_enhanced_data = false;
    bool requires_push = false;
    std::optional<std::string> preferred_provider;
    std::set<std::string> excluded;

    static OperationDescriptor from_request(const RpcRequest& request);
};

class RequestRouter {
public:
    RequestRouter(const ProviderRegistry& registry, UsageTracker& usage,
                  const CircuitBreakerBank& breakers, RoutingPolicy default_policy);

    // Eligible providers, best first
    std::vector<Provider> rank(const OperationDescriptor& op, std::optional<RoutingPolicy> policy = std::nullopt);

    // Head of rank(); nullopt means ProviderUnavailable
    std::optional<Provider> select(const OperationDescriptor& op, std::optional<RoutingPolicy> policy = std::nullopt);

    RoutingPolicy default_policy() const { return default_policy_; }

private:
    bool is_eligible(const Provider& p, const OperationDescriptor& op);
    void order_by_policy(std::vector<Provider>& providers, RoutingPolicy policy);
    void rotate_round_robin(std::vector<Provider>& eligible);
    void rotate_weighted(std::vector<Provider>& eligible);

    const ProviderRegistry& registry_;
    UsageTracker& usage_;
    const CircuitBreakerBank& breakers_;
    const RoutingPolicy default_policy_;

    std::mutex rr_mutex_;
    uint64_t rr_counter_ = 0;
    uint64_t weighted_counter_ = 0;
};
