/*
 * LLM client helpers and factory - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-mailguard/ai/llm.hpp>
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace mailguard::ai {

// Marker separating instructions from the payload in prompts built by the responder.
static const char* kPayloadMarker = "\n---\n";

std::optional<LLMCompletion> StubLLMClient::complete(const std::string& prompt) {
    // 1. stub_file configured and readable: return its contents
    if (!m_cfg.stub_file.empty()) {
        std::ifstream in(m_cfg.stub_file);
        if (in) {
            std::ostringstream oss; oss << in.rdbuf();
            std::string data = oss.str();
            if (!data.empty()) return LLMCompletion{data, "stub_file"};
        }
    }
    // 2. echo the payload (text after the last marker), or the whole prompt
    size_t pos = prompt.rfind(kPayloadMarker);
    if (pos != std::string::npos) return LLMCompletion{prompt.substr(pos + std::string(kPayloadMarker).size()), "stub_plain"};
    return LLMCompletion{prompt, "stub_plain"};
}

std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg) {
    if (cfg.enabled) {
        if (cfg.provider == "openai") return std::make_unique<OpenAILLMClient>(cfg);
        if (cfg.provider == "ollama") return std::make_unique<OllamaLLMClient>(cfg);
    }
    return std::make_unique<StubLLMClient>(cfg);
}

std::string escape_json(const std::string& in) {
    std::string out; out.reserve(in.size()+16);
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned char)c); out += buf;
                } else out.push_back(c);
        }
    }
    return out;
}

std::string extract_json_string(const std::string& body, const std::string& key, size_t from) {
    std::string quoted = "\"" + key + "\"";
    size_t pos = body.find(quoted, from); if (pos == std::string::npos) return {};
    pos = body.find(':', pos + quoted.size()); if (pos == std::string::npos) return {};
    ++pos; while (pos < body.size() && std::isspace((unsigned char)body[pos])) ++pos;
    if (pos >= body.size() || body[pos] != '"') return {};
    std::string out; bool esc = false;
    for (size_t i = pos + 1; i < body.size(); ++i) {
        char c = body[i];
        if (esc) {
            if (c=='n') out.push_back('\n'); else if (c=='r') out.push_back('\r'); else if (c=='t') out.push_back('\t');
            else if (c=='u' && i + 4 < body.size()) {
                unsigned code = 0;
                try { code = (unsigned)std::stoul(body.substr(i+1, 4), nullptr, 16); } catch (const std::exception&) { code = '?'; }
                out.push_back(code < 0x80 ? (char)code : '?'); i += 4;
            }
            else out.push_back(c);
            esc = false; continue;
        }
        if (c == '\\') { esc = true; continue; }
        if (c == '"') return out;
        out.push_back(c);
    }
    return {}; // unterminated
}

int extract_json_int(const std::string& body, const std::string& key) {
    size_t pos = body.find("\"" + key + "\""); if (pos == std::string::npos) return -1;
    pos = body.find(':', pos); if (pos == std::string::npos) return -1;
    ++pos; while (pos < body.size() && std::isspace((unsigned char)body[pos])) ++pos;
    size_t end = pos; while (end < body.size() && std::isdigit((unsigned char)body[end])) ++end;
    if (end == pos) return -1;
    try { return std::stoi(body.substr(pos, end - pos)); } catch (const std::exception&) { return -1; }
}

} // namespace mailguard::ai
