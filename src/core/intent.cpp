/*
 * Intent value types - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-mailguard/core/intent.hpp>

namespace mailguard {

const char* to_string(IntentKind kind) {
    switch (kind) {
        case IntentKind::Read: return "read";
        case IntentKind::Write: return "write";
        case IntentKind::Delete: return "delete";
        case IntentKind::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(ParamKey key) {
    switch (key) {
        case ParamKey::From: return "from";
        case ParamKey::To: return "to";
        case ParamKey::Subject: return "subject";
    }
    return "";
}

std::optional<ParamKey> param_key_from_string(const std::string& name) {
    for (auto k : kAllParamKeys) {
        if (name == to_string(k)) return k;
    }
    return std::nullopt;
}

} // namespace mailguard
