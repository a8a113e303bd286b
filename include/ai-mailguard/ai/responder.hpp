/*
 * Response generation for read actions - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>
#include <memory>
#include <ai-mailguard/core/intent.hpp>
#include <ai-mailguard/ai/llm.hpp>

namespace mailguard::ai {

// Produces the text the agent would show the user for a read action.
class Responder {
public:
    virtual ~Responder() = default;
    // nullopt when no response could be produced; the content check is then skipped.
    virtual std::optional<std::string> respond(const ActionRequest& req) = 0;
};

// Asks an LLM to summarize the email content for the user's request.
class LLMResponder : public Responder {
public:
    explicit LLMResponder(std::unique_ptr<LLMClient> client) : m_client(std::move(client)) {}
    std::optional<std::string> respond(const ActionRequest& req) override;

    static std::string build_prompt(const ActionRequest& req);
private:
    std::unique_ptr<LLMClient> m_client;
};

} // namespace mailguard::ai
