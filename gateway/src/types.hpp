#pragma once
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class ProviderHealth {
    Healthy,
    Degraded,
    Down
};

enum class RoutingPolicy {
    CostOptimized,
    PerformanceFirst,
    RoundRobin,
    WeightedRoundRobin,
    EnhancedDataFirst
};

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

enum class VolatilityTier {
    Hot,
    Warm,
    Cold,
    Frozen
};

const char* to_string(ProviderHealth health);
const char* to_string(RoutingPolicy policy);
const char* to_string(CircuitState state);
const char* to_string(VolatilityTier tier);

// Accepts snake_case names ("cost_optimized"); throws GatewayError on unknown input
RoutingPolicy parse_routing_policy(const std::string& name);
VolatilityTier parse_volatility_tier(const std::string& name);

struct Provider {
    std::string id;
    std::string name;
    std::string endpoint;
    std::string api_key;
    bool supports_enhanced_data = false;
    bool supports_push = false;
    uint64_t monthly_quota = 0;
    double cost_per_request = 0.0;
    int rpm_limit = 0;                  // 0 = no per-minute limit
    int priority = 5;                   // 1-10, weight for weighted round robin
    double avg_latency_ms = 0.0;
    double success_rate = 100.0;
    ProviderHealth health = ProviderHealth::Healthy;

    nlohmann::json to_json() const;
    static Provider from_json(const nlohmann::json& j);
};

// --- Webhook event model ---

struct NativeTransfer {
    std::string from_account;
    std::string to_account;
    uint64_t lamports = 0;
};

struct TokenTransfer {
    std::string from_account;
    std::string to_account;
    std::string mint;
    double token_amount = 0.0;
};

struct Instruction {
    std::string program_id;
    std::vector<std::string> accounts;
    std::string data;
};

struct TokenMetadata {
    std::optional<std::string> name;
    std::optional<std::string> symbol;
    std::optional<int> decimals;
};

struct WebhookEvent {
    std::string signature;
    int64_t timestamp = 0;              // chain time, unix seconds
    std::chrono::system_clock::time_point received_at;
    std::string source;                 // provider path segment of the webhook URL
    std::string type;
    uint64_t slot = 0;
    uint64_t fee = 0;
    std::string fee_payer;
    bool authenticated = false;

    std::vector<NativeTransfer> native_transfers;
    std::vector<TokenTransfer> token_transfers;
    std::vector<Instruction> instructions;
    std::map<std::string, TokenMetadata> token_metadata;

    nlohmann::json raw;
};

// --- Extraction output ---

struct ExtractedSignal {
    std::string type;
    double strength = 0.0;
    double confidence = 0.0;
    nlohmann::json metadata = nlohmann::json::object();
    std::string event_id;

    nlohmann::json to_json() const;
};

struct RiskIndicator {
    std::string type;
    double severity = 0.0;
    std::string description;
    std::string event_id;

    nlohmann::json to_json() const;
};

struct ExtractionResult {
    std::vector<ExtractedSignal> signals;
    std::vector<RiskIndicator> risks;

    bool empty() const { return signals.empty() && risks.empty(); }
};

struct DispatchResult {
    std::string target;
    bool success = false;
    std::chrono::milliseconds latency{0};
    std::string error;
    std::optional<ErrorCode> error_code;

    nlohmann::json to_json() const;
};

// --- Outbound call model ---

struct RpcRequest {
    std::string method;
    nlohmann::json params = nlohmann::json::array();
    bool requires_enhanced_data = false;
    bool requires_push = false;
    std::optional<std::string> preferred_provider;
    std::optional<RoutingPolicy> policy;
};

enum class CallStatus {
    Success,
    Degraded,
    Error
};

const char* to_string(CallStatus status);

struct CallResult {
    CallStatus status = CallStatus::Error;
    nlohmann::json payload;
    std::string provider_id;
    std::string stage;                  // cascade stage that produced the result
    int attempts = 0;
    bool from_cache = false;
    std::string error;
    std::optional<ErrorCode> error_code;

    bool ok() const { return status == CallStatus::Success; }
    bool degraded() const { return status == CallStatus::Degraded; }

    nlohmann::json to_json() const;
};
