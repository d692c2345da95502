#include "signal_extractor.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>

namespace {

constexpr double kLamportsPerSol = 1e9;

constexpr double kLargeVolumeConfidence = 0.8;
constexpr double kLaunchStrength = 0.6;
constexpr double kLaunchConfidence = 0.9;
constexpr double kWashTradingSeverity = 0.7;
constexpr double kMissingMetadataSeverity = 0.3;
constexpr double kHighFeeSeverity = 0.4;

bool is_self_transfer(const std::string& from, const std::string& to) {
    return !from.empty() && from == to;
}

}

SignalExtractor::SignalExtractor(const ExtractionSettings& settings, bool with_default_rules)
    : settings_(settings) {
    if (with_default_rules) {
        add_rule("large_volume", &SignalExtractor::large_volume_rule);
        add_rule("new_token_launch", &SignalExtractor::new_token_launch_rule);
        add_rule("wash_trading", &SignalExtractor::wash_trading_rule);
        add_rule("missing_metadata", &SignalExtractor::missing_metadata_rule);
        add_rule("high_priority_fee", &SignalExtractor::high_priority_fee_rule);
    }
}

void SignalExtractor::add_rule(const std::string& name, ExtractionRule rule) {
    rules_.push_back({name, std::move(rule)});
}

ExtractionResult SignalExtractor::extract(const WebhookEvent& event) const {
    ExtractionResult result;

    for (const auto& named : rules_) {
        std::vector<Finding> findings;
        try {
            findings = named.rule(event, settings_);
        } catch (const std::exception& e) {
            spdlog::warn("Rule {} failed on {}: {}", named.name, event.signature, e.what());
            continue;
        }

        for (auto& finding : findings) {
            if (auto* signal = std::get_if<ExtractedSignal>(&finding)) {
                signal->event_id = event.signature;
                signal->strength = std::clamp(signal->strength, 0.0, 1.0);
                signal->confidence = std::clamp(signal->confidence, 0.0, 1.0);
                result.signals.push_back(std::move(*signal));
            } else {
                auto& risk = std::get<RiskIndicator>(finding);
                risk.event_id = event.signature;
                risk.severity = std::clamp(risk.severity, 0.0, 1.0);
                result.risks.push_back(std::move(risk));
            }
        }
    }

    if (!result.empty()) {
        spdlog::debug("Event {} produced {} signals, {} risk indicators",
                      event.signature, result.signals.size(), result.risks.size());
    }
    return result;
}

double SignalExtractor::transfer_volume_usd(const WebhookEvent& event,
                                            const ExtractionSettings& settings) {
    double total = 0.0;

    for (const auto& t : event.native_transfers) {
        if (is_self_transfer(t.from_account, t.to_account)) continue;
        total += static_cast<double>(t.lamports) / kLamportsPerSol * settings.sol_price_usd;
    }

    for (const auto& t : event.token_transfers) {
        if (is_self_transfer(t.from_account, t.to_account)) continue;
        auto price = settings.token_prices_usd.find(t.mint);
        if (price == settings.token_prices_usd.end()) continue;
        total += t.token_amount * price->second;
    }

    return total;
}

std::vector<Finding> SignalExtractor::large_volume_rule(const WebhookEvent& event,
                                                        const ExtractionSettings& settings) {
    const double usd = transfer_volume_usd(event, settings);
    if (usd <= settings.large_volume_usd) {
        return {};
    }

    ExtractedSignal signal;
    signal.type = "large_volume";
    signal.strength = std::min(1.0, usd / settings.volume_ceiling_usd);
    signal.confidence = kLargeVolumeConfidence;
    signal.metadata = {
        {"volume_usd", usd},
        {"native_transfers", event.native_transfers.size()},
        {"token_transfers", event.token_transfers.size()}
    };
    return {signal};
}

std::vector<Finding> SignalExtractor::new_token_launch_rule(const WebhookEvent& event,
                                                            const ExtractionSettings& settings) {
    auto it = std::find_if(event.instructions.begin(), event.instructions.end(),
                           [&](const Instruction& ix) {
                               return settings.new_listing_programs.count(ix.program_id) > 0;
                           });
    if (it == event.instructions.end()) {
        return {};
    }

    std::set<std::string> mints;
    for (const auto& t : event.token_transfers) {
        if (!t.mint.empty()) mints.insert(t.mint);
    }

    ExtractedSignal signal;
    signal.type = "new_token_launch";
    signal.strength = kLaunchStrength;
    signal.confidence = kLaunchConfidence;
    signal.metadata = {
        {"program_id", it->program_id},
        {"mints", mints}
    };
    return {signal};
}

std::vector<Finding> SignalExtractor::wash_trading_rule(const WebhookEvent& event,
                                                        const ExtractionSettings&) {
    size_t self_transfers = 0;
    std::string account;

    for (const auto& t : event.native_transfers) {
        if (is_self_transfer(t.from_account, t.to_account)) {
            self_transfers++;
            account = t.from_account;
        }
    }
    for (const auto& t : event.token_transfers) {
        if (is_self_transfer(t.from_account, t.to_account)) {
            self_transfers++;
            account = t.from_account;
        }
    }

    if (self_transfers == 0) {
        return {};
    }

    RiskIndicator risk;
    risk.type = "wash_trading";
    risk.severity = kWashTradingSeverity;
    risk.description = fmt::format("{} self-transfer(s) by {}", self_transfers, account);
    return {risk};
}

// A token counts as newly observed when the provider attached metadata for it, or when
// the event launches it through a listing program
std::vector<Finding> SignalExtractor::missing_metadata_rule(const WebhookEvent& event,
                                                            const ExtractionSettings& settings) {
    std::map<std::string, TokenMetadata> observed = event.token_metadata;

    bool is_launch = std::any_of(event.instructions.begin(), event.instructions.end(),
                                 [&](const Instruction& ix) {
                                     return settings.new_listing_programs.count(ix.program_id) > 0;
                                 });
    if (is_launch) {
        for (const auto& t : event.token_transfers) {
            if (!t.mint.empty() && !observed.count(t.mint)) {
                observed[t.mint] = TokenMetadata{};
            }
        }
    }

    std::vector<Finding> findings;
    for (const auto& [mint, meta] : observed) {
        std::vector<std::string> missing;
        if (!meta.name) missing.push_back("name");
        if (!meta.symbol) missing.push_back("symbol");
        if (!meta.decimals) missing.push_back("decimals");
        if (missing.empty()) continue;

        RiskIndicator risk;
        risk.type = "missing_metadata";
        risk.severity = kMissingMetadataSeverity;
        risk.description = fmt::format("token {} missing {}", mint, fmt::join(missing, ", "));
        findings.push_back(risk);
    }
    return findings;
}

std::vector<Finding> SignalExtractor::high_priority_fee_rule(const WebhookEvent& event,
                                                             const ExtractionSettings& settings) {
    if (event.fee <= settings.high_fee_lamports) {
        return {};
    }

    RiskIndicator risk;
    risk.type = "high_priority_fee";
    risk.severity = kHighFeeSeverity;
    risk.description = fmt::format("fee of {} lamports paid by {} suggests bot activity",
                                   event.fee, event.fee_payer.empty() ? "unknown payer" : event.fee_payer);
    return {risk};
}
