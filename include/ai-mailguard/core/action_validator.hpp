/*
 * Action validator - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <ai-mailguard/core/intent.hpp>
#include <ai-mailguard/core/intent_extractor.hpp>

namespace mailguard {

// Maps an agent action identifier (read_email, send_reply, ...) to an intent
// kind by case-insensitive substring match. Read verbs win over write verbs,
// write verbs over delete verbs.
IntentKind classify_action(const std::string& proposed_action);

// Compares what the user asked for against what the agent proposes to do.
// Only fields present on both sides are compared.
class ActionValidator {
public:
    explicit ActionValidator(const IntentExtractor& extractor) : m_extractor(extractor) {}

    CheckResult validate(const std::string& user_prompt,
                         const std::string& proposed_action,
                         const ExtractedParams& action_params) const;

    // Same as validate() when the user intent has already been extracted.
    CheckResult validate(const ExtractedIntent& user,
                         const std::string& proposed_action,
                         const ExtractedParams& action_params) const;

private:
    CheckResult reconcile(const ExtractedParams& user, const ExtractedParams& action,
                          ParamKey address_key) const;

    const IntentExtractor& m_extractor;
};

} // namespace mailguard
