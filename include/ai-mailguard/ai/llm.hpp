/*
 * LLM client layer - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>
#include <memory>

namespace mailguard::ai {

struct LLMConfig {
    bool enabled = false;            // llm_enabled
    std::string provider = "none";  // openai, ollama
    std::string model;               // model id
    std::string endpoint;            // HTTP endpoint (if remote)
    std::string api_key_env;         // env var containing key
    std::string api_key;             // direct key (less secure; prefer env)
    std::string stub_file;           // local file with a canned response (for offline)
    int max_tokens = 512;
    double temperature = 0.2;
    int timeout_seconds = 20;        // network timeout
};

// Response from LLM completion. source is "error" when text carries a failure note.
struct LLMCompletion {
    std::string text;                // raw model text
    std::string source;              // stub_file|stub_plain|openai|ollama|error
    int prompt_tokens = -1;
    int completion_tokens = -1;

    bool ok() const { return source != "error"; }
};

class LLMClient {
public:
    virtual ~LLMClient() = default;
    virtual std::optional<LLMCompletion> complete(const std::string& prompt) = 0;
};

// Offline client: stub_file contents if readable, otherwise the prompt itself.
class StubLLMClient : public LLMClient {
public:
    explicit StubLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& prompt) override;
private:
    LLMConfig m_cfg;
};

// OpenAI Chat Completions (libcurl).
class OpenAILLMClient : public LLMClient {
public:
    explicit OpenAILLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& prompt) override;
private:
    LLMConfig m_cfg;
};

// Ollama /api/generate (libcurl).
class OllamaLLMClient : public LLMClient {
public:
    explicit OllamaLLMClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const std::string& prompt) override;
private:
    LLMConfig m_cfg;
};

// Falls back to the stub client when disabled or provider is unknown.
std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg);

// Shared helpers for the curl-based clients.
std::string escape_json(const std::string& in);
// Returns the unescaped string value following "key": after position from, or "" if none.
std::string extract_json_string(const std::string& body, const std::string& key, size_t from = 0);
int extract_json_int(const std::string& body, const std::string& key);

} // namespace mailguard::ai
