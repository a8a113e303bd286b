/*
 * AI-MailGuard Intent Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Defines intent kinds, the fixed parameter schema shared by user prompts and
 *   agent actions, and the request/result values exchanged with the validator.
 *   A parameter that is absent is unconstrained; it is never an empty string.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <optional>
#include <array>

namespace mailguard {

enum class IntentKind {
    Read,
    Write,
    Delete,
    Unknown
};

// Lower-case name used in reasons and JSON output (read|write|delete|unknown).
const char* to_string(IntentKind kind);

enum class ParamKey {
    From,
    To,
    Subject
};

constexpr std::array<ParamKey, 3> kAllParamKeys = {ParamKey::From, ParamKey::To, ParamKey::Subject};

const char* to_string(ParamKey key);
std::optional<ParamKey> param_key_from_string(const std::string& name);

// Fixed-schema parameter bag. Keys outside ParamKey are not representable.
class ExtractedParams {
public:
    ExtractedParams() = default;

    bool has(ParamKey key) const { return slot(key).has_value(); }
    const std::optional<std::string>& get(ParamKey key) const { return slot(key); }
    void set(ParamKey key, std::string value) { slot(key) = std::move(value); }
    void erase(ParamKey key) { slot(key).reset(); }
    bool empty() const { return !m_from && !m_to && !m_subject; }

    bool operator==(const ExtractedParams& o) const {
        return m_from == o.m_from && m_to == o.m_to && m_subject == o.m_subject;
    }
    bool operator!=(const ExtractedParams& o) const { return !(*this == o); }

private:
    std::optional<std::string>& slot(ParamKey key) {
        switch (key) {
            case ParamKey::From: return m_from;
            case ParamKey::To: return m_to;
            case ParamKey::Subject: return m_subject;
        }
        return m_subject;
    }
    const std::optional<std::string>& slot(ParamKey key) const {
        return const_cast<ExtractedParams*>(this)->slot(key);
    }

    std::optional<std::string> m_from;
    std::optional<std::string> m_to;
    std::optional<std::string> m_subject;
};

struct ExtractedIntent {
    IntentKind kind = IntentKind::Unknown;
    ExtractedParams params;
};

// One unit of work presented to the proxy.
struct ActionRequest {
    std::string user_prompt;
    std::string proposed_action;               // e.g. read_email
    ExtractedParams action_params;
    std::optional<std::string> email_content;  // source email for read actions
};

// Outcome of a single check (action or response content).
struct CheckResult {
    bool approved = false;
    std::string reason;
};

struct ValidationResult {
    bool approved = false;
    std::string reason;
    IntentKind user_intent = IntentKind::Unknown;

    bool operator==(const ValidationResult& o) const {
        return approved == o.approved && reason == o.reason && user_intent == o.user_intent;
    }
};

} // namespace mailguard
