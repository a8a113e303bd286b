/*
 * Action validator implementation - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-mailguard/core/action_validator.hpp>
#include <ai-mailguard/util/text.hpp>

namespace mailguard {

using util::to_lower;

IntentKind classify_action(const std::string& proposed_action) {
    std::string lower = to_lower(proposed_action);
    auto has_any = [&](std::initializer_list<const char*> verbs){
        for (auto v : verbs) if (lower.find(v) != std::string::npos) return true;
        return false;
    };
    if (has_any({"read", "fetch", "get", "retrieve"})) return IntentKind::Read;
    if (has_any({"send", "write", "compose", "reply", "forward"})) return IntentKind::Write;
    if (has_any({"delete", "remove", "trash"})) return IntentKind::Delete;
    return IntentKind::Unknown;
}

CheckResult ActionValidator::validate(const std::string& user_prompt,
                                      const std::string& proposed_action,
                                      const ExtractedParams& action_params) const {
    return validate(m_extractor.extract(user_prompt), proposed_action, action_params);
}

CheckResult ActionValidator::validate(const ExtractedIntent& user,
                                      const std::string& proposed_action,
                                      const ExtractedParams& action_params) const {
    IntentKind action_kind = classify_action(proposed_action);
    if (user.kind != action_kind) {
        return {false, std::string("Intent mismatch: User intended ") + to_string(user.kind) +
                       " but action is " + to_string(action_kind)};
    }
    switch (user.kind) {
        case IntentKind::Read:
        case IntentKind::Delete:
            return reconcile(user.params, action_params, ParamKey::From);
        case IntentKind::Write:
            return reconcile(user.params, action_params, ParamKey::To);
        case IntentKind::Unknown:
            break;
    }
    return {false, "Unknown user intent"};
}

CheckResult ActionValidator::reconcile(const ExtractedParams& user, const ExtractedParams& action,
                                       ParamKey address_key) const {
    const auto& u_addr = user.get(address_key);
    const auto& a_addr = action.get(address_key);
    if (u_addr && a_addr && *u_addr != *a_addr) {
        std::string label = (address_key == ParamKey::To) ? "To" : "From";
        return {false, label + " address mismatch: User specified " + *u_addr + " but action uses " + *a_addr};
    }
    const auto& u_subj = user.get(ParamKey::Subject);
    const auto& a_subj = action.get(ParamKey::Subject);
    if (u_subj && a_subj && to_lower(*u_subj) != to_lower(*a_subj)) {
        return {false, "Subject mismatch: User specified '" + *u_subj + "' but action uses '" + *a_subj + "'"};
    }
    return {true, "Parameters validated successfully"};
}

} // namespace mailguard
