/*
 * AI-MailGuard Security Proxy Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Request orchestration; see header for overview.
 */
#include <ai-mailguard/core/security_proxy.hpp>
#include <ai-mailguard/ai/responder.hpp>
#include <iostream>

namespace mailguard {

SecurityProxy::SecurityProxy(ProxyOptions opts)
    : m_opts(opts), m_extractor(), m_validator(m_extractor), m_checker() {
    if (m_opts.verbose) log() << "[mailguard] security proxy initialized\n";
}

SecurityProxy::~SecurityProxy() = default;

void SecurityProxy::set_responder(std::unique_ptr<ai::Responder> responder) {
    m_responder = std::move(responder);
}

std::ostream& SecurityProxy::log() const {
    return m_opts.log ? *m_opts.log : std::cerr;
}

std::optional<std::string> SecurityProxy::response_for(const ActionRequest& req,
                                                       const std::optional<std::string>& supplied) const {
    if (supplied) return supplied;
    if (m_responder) return m_responder->respond(req);
    return std::nullopt;
}

ValidationResult SecurityProxy::process_request(const ActionRequest& req) const {
    return process_request(req, std::nullopt);
}

ValidationResult SecurityProxy::process_request(const ActionRequest& req,
                                                const std::optional<std::string>& proposed_response) const {
    if (m_opts.verbose) {
        log() << "[mailguard] Processing request: User prompt='" << req.user_prompt
              << "', Action='" << req.proposed_action << "'\n";
    }
    ExtractedIntent user = m_extractor.extract(req.user_prompt);
    CheckResult action = m_validator.validate(user, req.proposed_action, req.action_params);

    ValidationResult result;
    result.approved = action.approved;
    result.reason = action.reason;
    result.user_intent = user.kind;

    bool has_email = req.email_content && !req.email_content->empty();
    if (result.approved && has_email && classify_action(req.proposed_action) == IntentKind::Read) {
        auto response = response_for(req, proposed_response);
        if (response) {
            CheckResult content = m_checker.validate(*req.email_content, *response);
            if (!content.approved) {
                result.approved = false;
                result.reason = "Action approved but response validation failed: " + content.reason;
            }
        } else if (m_opts.verbose) {
            log() << "[mailguard] no response text available, content check skipped\n";
        }
    }

    if (m_opts.verbose) {
        log() << "[mailguard] Request processed: Approved=" << (result.approved ? "true" : "false")
              << ", Reason=" << result.reason << "\n";
    }
    return result;
}

} // namespace mailguard
