/*
 * JSON request/result codec - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>
#include <vector>
#include <ai-mailguard/core/intent.hpp>

namespace mailguard::io {

struct ParsedRequest {
    ActionRequest request;
    std::optional<std::string> proposed_response;
    std::vector<std::string> dropped_params;   // action_params keys outside the schema
    bool valid = false;
    std::string error;                         // set when !valid
};

// Parse one flat JSON object (UTF-8, string values, action_params as an object of strings).
// Never throws; malformed input yields valid == false.
ParsedRequest parse_request_json(const std::string& json);

// {"action_approved": ..., "validation_reason": "...", "user_intent": "..."}
std::string to_json(const ValidationResult& r);

} // namespace mailguard::io
