/*
 * LLM responder - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-mailguard/ai/responder.hpp>
#include <sstream>

namespace mailguard::ai {

std::string LLMResponder::build_prompt(const ActionRequest& req) {
    std::ostringstream p;
    p << "The user asked: " << req.user_prompt << "\n"
      << "Reply to the user using only the email below. Quote or summarize it; do not add anything.";
    // payload goes after the marker so offline clients can echo it
    p << "\n---\n" << req.email_content.value_or("");
    return p.str();
}

std::optional<std::string> LLMResponder::respond(const ActionRequest& req) {
    if (!m_client || !req.email_content) return std::nullopt;
    auto completion = m_client->complete(build_prompt(req));
    if (!completion || !completion->ok()) return std::nullopt;
    return completion->text;
}

} // namespace mailguard::ai
