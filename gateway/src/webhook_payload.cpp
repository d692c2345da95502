#include "webhook_payload.hpp"
#include <fmt/format.h>
#include <cmath>
#include <cstdint>

namespace {

[[noreturn]] void invalid(const std::string& message) {
    throw GatewayError(ErrorCode::ValidationFailed, message);
}

std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// Providers send amounts either as numbers or as decimal strings
double numeric_field(const nlohmann::json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return 0.0;
    }

    double value = 0.0;
    if (it->is_number()) {
        value = it->get<double>();
    } else if (it->is_string()) {
        const auto text = it->get<std::string>();
        size_t consumed = 0;
        try {
            value = std::stod(text, &consumed);
        } catch (const std::exception&) {
            invalid(fmt::format("{}: field '{}' is not numeric", where, key));
        }
        if (consumed != text.size()) {
            invalid(fmt::format("{}: field '{}' has trailing characters", where, key));
        }
    } else {
        invalid(fmt::format("{}: field '{}' is not numeric", where, key));
    }

    if (!std::isfinite(value)) {
        invalid(fmt::format("{}: field '{}' is not finite", where, key));
    }
    return value;
}

double amount_field(const nlohmann::json& j, const char* key, const std::string& where) {
    double value = numeric_field(j, key, where);
    if (value < 0.0) {
        invalid(fmt::format("{}: field '{}' is negative", where, key));
    }
    return value;
}

// Slots, fees and lamports: whole, non-negative and within uint64
uint64_t unsigned_field(const nlohmann::json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it != j.end() && it->is_number_integer()) {
        auto value = it->get<int64_t>();
        if (value < 0) {
            invalid(fmt::format("{}: field '{}' is negative", where, key));
        }
        return static_cast<uint64_t>(value);
    }

    double value = amount_field(j, key, where);
    // 2^64
    if (value >= 18446744073709551616.0) {
        invalid(fmt::format("{}: field '{}' is out of range", where, key));
    }
    return static_cast<uint64_t>(value);
}

const nlohmann::json* object_array(const nlohmann::json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_array()) {
        invalid(fmt::format("{}: '{}' must be an array", where, key));
    }
    for (const auto& item : *it) {
        if (!item.is_object()) {
            invalid(fmt::format("{}: '{}' entries must be objects", where, key));
        }
    }
    return &*it;
}

TokenMetadata parse_metadata(const nlohmann::json& j) {
    TokenMetadata meta;
    auto name = string_field(j, "name");
    if (!name.empty()) meta.name = name;
    auto symbol = string_field(j, "symbol");
    if (!symbol.empty()) meta.symbol = symbol;
    auto decimals = j.find("decimals");
    if (decimals != j.end() && decimals->is_number_integer()) {
        meta.decimals = decimals->get<int>();
    }
    return meta;
}

}

WebhookEvent parse_webhook_event(const nlohmann::json& j, const std::string& source,
                                 std::chrono::system_clock::time_point received_at) {
    if (!j.is_object()) {
        invalid("event must be a JSON object");
    }

    WebhookEvent event;
    event.signature = string_field(j, "signature");
    if (event.signature.empty() && j.contains("transaction") && j["transaction"].is_object()) {
        event.signature = string_field(j["transaction"], "signature");
    }
    if (event.signature.empty()) {
        invalid("event has no signature");
    }

    const std::string where = "event " + event.signature;

    const nlohmann::json* ts = nullptr;
    if (j.contains("timestamp")) {
        ts = &j["timestamp"];
    } else if (j.contains("transaction") && j["transaction"].is_object() &&
               j["transaction"].contains("timestamp")) {
        ts = &j["transaction"]["timestamp"];
    }
    if (!ts || !ts->is_number()) {
        invalid(where + ": missing numeric timestamp");
    }
    if (ts->is_number_float()) {
        double seconds = ts->get<double>();
        // 2^63
        if (!std::isfinite(seconds) || std::fabs(seconds) >= 9223372036854775808.0) {
            invalid(where + ": timestamp is out of range");
        }
    }
    if (ts->is_number_unsigned() && ts->get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
        invalid(where + ": timestamp is out of range");
    }
    event.timestamp = ts->get<int64_t>();

    event.received_at = received_at;
    event.source = source;
    event.type = string_field(j, "type");
    event.fee_payer = string_field(j, "feePayer");
    event.slot = unsigned_field(j, "slot", where);
    event.fee = unsigned_field(j, "fee", where);

    if (auto natives = object_array(j, "nativeTransfers", where)) {
        for (const auto& t : *natives) {
            NativeTransfer transfer;
            transfer.from_account = string_field(t, "fromUserAccount");
            transfer.to_account = string_field(t, "toUserAccount");
            transfer.lamports = unsigned_field(t, "amount", where);
            event.native_transfers.push_back(std::move(transfer));
        }
    }

    if (auto tokens = object_array(j, "tokenTransfers", where)) {
        for (const auto& t : *tokens) {
            TokenTransfer transfer;
            transfer.from_account = string_field(t, "fromUserAccount");
            transfer.to_account = string_field(t, "toUserAccount");
            transfer.mint = string_field(t, "mint");
            transfer.token_amount = amount_field(t, "tokenAmount", where);
            event.token_transfers.push_back(std::move(transfer));
        }
    }

    if (auto instructions = object_array(j, "instructions", where)) {
        for (const auto& ix : *instructions) {
            Instruction instruction;
            instruction.program_id = string_field(ix, "programId");
            instruction.data = string_field(ix, "data");
            auto accounts = ix.find("accounts");
            if (accounts != ix.end() && accounts->is_array()) {
                for (const auto& a : *accounts) {
                    if (a.is_string()) instruction.accounts.push_back(a.get<std::string>());
                }
            }
            event.instructions.push_back(std::move(instruction));
        }
    }

    auto metadata = j.find("tokenMetadata");
    if (metadata != j.end() && !metadata->is_null()) {
        if (metadata->is_array()) {
            for (const auto& m : *metadata) {
                if (!m.is_object() || string_field(m, "mint").empty()) {
                    invalid(where + ": tokenMetadata entries need a mint");
                }
                event.token_metadata[m["mint"].get<std::string>()] = parse_metadata(m);
            }
        } else if (metadata->is_object()) {
            for (const auto& [mint, m] : metadata->items()) {
                event.token_metadata[mint] = m.is_object() ? parse_metadata(m) : TokenMetadata{};
            }
        } else {
            invalid(where + ": tokenMetadata must be an array or object");
        }
    }

    event.raw = j;
    return event;
}

std::vector<WebhookEvent> parse_webhook_events(const std::string& body, const std::string& source,
                                               std::chrono::system_clock::time_point received_at) {
    auto root = nlohmann::json::parse(body, nullptr, false);
    if (root.is_discarded()) {
        invalid("body is not valid JSON");
    }

    const nlohmann::json* events = nullptr;
    if (root.is_array()) {
        events = &root;
    } else if (root.is_object() && root.contains("events") && root["events"].is_array()) {
        events = &root["events"];
    } else {
        invalid("body must be an array of events or an object with an 'events' array");
    }

    if (events->empty()) {
        invalid("body contains no events");
    }

    std::vector<WebhookEvent> parsed;
    parsed.reserve(events->size());
    for (const auto& e : *events) {
        parsed.push_back(parse_webhook_event(e, source, received_at));
    }
    return parsed;
}
