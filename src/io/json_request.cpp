/*
 * JSON request codec - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-mailguard/io/json_request.hpp>
#include <ai-mailguard/ai/llm.hpp>
#include <cctype>

namespace mailguard::io {

namespace {

// Minimal cursor over a JSON text; supports the subset used by request lines.
struct Cursor {
    const std::string& s;
    size_t pos = 0;

    void skip_ws() { while (pos < s.size() && std::isspace((unsigned char)s[pos])) ++pos; }
    bool eat(char c) { skip_ws(); if (pos < s.size() && s[pos] == c) { ++pos; return true; } return false; }
    bool peek(char c) { skip_ws(); return pos < s.size() && s[pos] == c; }

    std::optional<std::string> string_value() {
        if (!eat('"')) return std::nullopt;
        std::string out;
        while (pos < s.size()) {
            char c = s[pos++];
            if (c == '"') return out;
            if (c != '\\') { out.push_back(c); continue; }
            if (pos >= s.size()) return std::nullopt;
            char e = s[pos++];
            switch (e) {
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    if (pos + 4 > s.size()) return std::nullopt;
                    unsigned code = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = s[pos++]; code <<= 4;
                        if (h >= '0' && h <= '9') code |= (unsigned)(h - '0');
                        else if (h >= 'a' && h <= 'f') code |= (unsigned)(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') code |= (unsigned)(h - 'A' + 10);
                        else return std::nullopt;
                    }
                    // encode BMP code point as UTF-8 (surrogates are kept as-is)
                    if (code < 0x80) out.push_back((char)code);
                    else if (code < 0x800) { out.push_back((char)(0xC0 | (code >> 6))); out.push_back((char)(0x80 | (code & 0x3F))); }
                    else { out.push_back((char)(0xE0 | (code >> 12))); out.push_back((char)(0x80 | ((code >> 6) & 0x3F))); out.push_back((char)(0x80 | (code & 0x3F))); }
                    break;
                }
                default: out.push_back(e); break; // \" \\ \/
            }
        }
        return std::nullopt;
    }

    // Scalar literal (number, true, false, null) returned as raw text.
    std::optional<std::string> literal_value() {
        skip_ws(); size_t start = pos;
        while (pos < s.size() && (std::isalnum((unsigned char)s[pos]) || s[pos]=='-' || s[pos]=='+' || s[pos]=='.')) ++pos;
        if (pos == start) return std::nullopt;
        return s.substr(start, pos - start);
    }
};

bool parse_params(Cursor& c, ParsedRequest& out) {
    if (!c.eat('{')) return false;
    if (c.eat('}')) return true;
    do {
        auto key = c.string_value(); if (!key || !c.eat(':')) return false;
        bool quoted = c.peek('"');
        std::optional<std::string> val = quoted ? c.string_value() : c.literal_value();
        if (!val) return false;
        auto pk = param_key_from_string(*key);
        if (pk) { if (quoted || *val != "null") out.request.action_params.set(*pk, *val); }
        else out.dropped_params.push_back(*key);
    } while (c.eat(','));
    return c.eat('}');
}

} // namespace

ParsedRequest parse_request_json(const std::string& json) {
    ParsedRequest out;
    Cursor c{json};
    bool have_prompt = false, have_action = false;
    auto fail = [&](const std::string& why){ out.valid = false; out.error = why + " at offset " + std::to_string(c.pos); return out; };
    if (!c.eat('{')) return fail("expected '{'");
    if (!c.eat('}')) {
        do {
            auto key = c.string_value(); if (!key) return fail("expected key");
            if (!c.eat(':')) return fail("expected ':'");
            if (*key == "action_params") {
                if (!parse_params(c, out)) return fail("bad action_params");
                continue;
            }
            std::optional<std::string> val;
            bool is_null = false;
            if (c.peek('"')) val = c.string_value();
            else { val = c.literal_value(); is_null = val && *val == "null"; }
            if (!val) return fail("bad value for '" + *key + "'");
            if (*key == "user_prompt") { out.request.user_prompt = *val; have_prompt = true; }
            else if (*key == "proposed_action") { out.request.proposed_action = *val; have_action = true; }
            else if (*key == "email_content") { if (!is_null) out.request.email_content = *val; }
            else if (*key == "proposed_response") { if (!is_null) out.proposed_response = *val; }
        } while (c.eat(','));
        if (!c.eat('}')) return fail("expected '}'");
    }
    if (!have_prompt) return fail("missing user_prompt");
    if (!have_action) return fail("missing proposed_action");
    out.valid = true;
    return out;
}

std::string to_json(const ValidationResult& r) {
    std::string out = "{";
    out += "\"action_approved\": "; out += (r.approved ? "true" : "false"); out += ", ";
    out += "\"validation_reason\": \"" + ai::escape_json(r.reason) + "\", ";
    out += "\"user_intent\": \""; out += to_string(r.user_intent); out += "\"}";
    return out;
}

} // namespace mailguard::io
