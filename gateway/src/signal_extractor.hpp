#pragma once
#include "types.hpp"
#include <functional>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

struct ExtractionSettings {
    double large_volume_usd = 1000.0;
    double volume_ceiling_usd = 100000.0;
    double sol_price_usd = 150.0;
    std::map<std::string, double> token_prices_usd;
    std::set<std::string> new_listing_programs;
    uint64_t high_fee_lamports = 100000;
};

using Finding = std::variant<ExtractedSignal, RiskIndicator>;
using ExtractionRule = std::function<std::vector<Finding>(const WebhookEvent&, const ExtractionSettings&)>;

class SignalExtractor {
public:
    explicit SignalExtractor(const ExtractionSettings& settings, bool with_default_rules = true);

    void add_rule(const std::string& name, ExtractionRule rule);

    // Runs every rule; a throwing rule is logged and skipped
    ExtractionResult extract(const WebhookEvent& event) const;

    size_t rule_count() const { return rules_.size(); }

    // USD value of the event's non-self transfers; unpriced mints are skipped
    static double transfer_volume_usd(const WebhookEvent& event, const ExtractionSettings& settings);

    static std::vector<Finding> large_volume_rule(const WebhookEvent& event, const ExtractionSettings& settings);
    static std::vector<Finding> new_token_launch_rule(const WebhookEvent& event, const ExtractionSettings& settings);
    static std::vector<Finding> wash_trading_rule(const WebhookEvent& event, const ExtractionSettings& settings);
    static std::vector<Finding> missing_metadata_rule(const WebhookEvent& event, const ExtractionSettings& settings);
    static std::vector<Finding> high_priority_fee_rule(const WebhookEvent& event, const ExtractionSettings& settings);

private:
    struct NamedRule {
        std::string name;
        ExtractionRule rule;
    };

    ExtractionSettings settings_;
    std::vector<NamedRule> rules_;
};
