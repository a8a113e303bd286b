/*
 * AI-MailGuard Security Proxy
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Entry point of the validator. Sits between the user request and the email
 *   agent's action dispatcher: extracts the user intent, checks the proposed
 *   action against it and, for read actions, vets the generated response
 *   against the source email. The decision is a pure function of the request;
 *   the only side effect is optional diagnostic logging.
 *
 * License (MIT): see intent.hpp.
 */
#pragma once
#include <string>
#include <optional>
#include <memory>
#include <iosfwd>
#include <ai-mailguard/core/intent.hpp>
#include <ai-mailguard/core/intent_extractor.hpp>
#include <ai-mailguard/core/action_validator.hpp>
#include <ai-mailguard/core/content_checker.hpp>

namespace mailguard {

namespace ai { class Responder; }

struct ProxyOptions {
    bool verbose = false;          // log each request/decision
    std::ostream* log = nullptr;   // defaults to std::cerr when null
};

class SecurityProxy {
public:
    explicit SecurityProxy(ProxyOptions opts = {});
    ~SecurityProxy();
    SecurityProxy(const SecurityProxy&) = delete;
    SecurityProxy& operator=(const SecurityProxy&) = delete;

    // Source of response text for read actions when the caller supplies none.
    void set_responder(std::unique_ptr<ai::Responder> responder);

    ExtractedIntent extract_intent(const std::string& user_prompt) const { return m_extractor.extract(user_prompt); }

    CheckResult validate_action(const std::string& user_prompt,
                                const std::string& proposed_action,
                                const ExtractedParams& action_params) const {
        return m_validator.validate(user_prompt, proposed_action, action_params);
    }

    CheckResult validate_response_content(const std::string& email_content,
                                          const std::string& proposed_response) const {
        return m_checker.validate(email_content, proposed_response);
    }

    // Response text comes from the configured responder, if any.
    ValidationResult process_request(const ActionRequest& req) const;
    // proposed_response, when set, takes precedence over the responder.
    ValidationResult process_request(const ActionRequest& req,
                                     const std::optional<std::string>& proposed_response) const;

private:
    std::optional<std::string> response_for(const ActionRequest& req,
                                            const std::optional<std::string>& supplied) const;
    std::ostream& log() const;

    ProxyOptions m_opts;
    IntentExtractor m_extractor;
    ActionValidator m_validator;
    ContentChecker m_checker;
    std::unique_ptr<ai::Responder> m_responder;
};

} // namespace mailguard
