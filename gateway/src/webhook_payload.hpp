#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <vector>

// Parses a webhook body (an array of events or {"events": [...]}) into validated events.
// Throws GatewayError(ValidationFailed) naming the first offending event.
std::vector<WebhookEvent> parse_webhook_events(const std::string& body, const std::string& source,
                                               std::chrono::system_clock::time_point received_at);

WebhookEvent parse_webhook_event(const nlohmann::json& j, const std::string& source,
                                 std::chrono::system_clock::time_point received_at);
