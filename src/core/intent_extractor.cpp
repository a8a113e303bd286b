/*
 * Intent extractor implementation - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-mailguard/core/intent_extractor.hpp>
#include <ai-mailguard/util/text.hpp>
#include <cctype>

namespace mailguard {

static bool is_word_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

// Splits on line terminators; verb and "email" must share a line.
static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    size_t start = 0;
    for (size_t i = 0; i <= s.size(); ++i) {
        if (i == s.size() || s[i] == '\n' || s[i] == '\r') {
            lines.push_back(s.substr(start, i - start));
            start = i + 1;
        }
    }
    return lines;
}

static bool chain_in_line(const std::vector<std::string>& chain, const std::string& line) {
    size_t pos = 0;
    for (const auto& word : chain) {
        size_t p = line.find(word, pos);
        if (p == std::string::npos) return false;
        pos = p + word.size();
    }
    return true;
}

IntentExtractor::IntentExtractor() {
    auto chains = [](std::initializer_list<VerbChain> verbs) {
        std::vector<VerbChain> out;
        for (auto v : verbs) { v.push_back("email"); out.push_back(std::move(v)); }
        return out;
    };
    m_sets.push_back({IntentKind::Read,
                      chains({{"read"}, {"show"}, {"check"}, {"view"}, {"open"}, {"see"}, {"display"}, {"look", "at"}, {"what"}, {"fetch"}}),
                      ParamKey::From});
    m_sets.push_back({IntentKind::Write,
                      chains({{"send"}, {"write"}, {"compose"}, {"reply"}, {"forward"}, {"create"}, {"draft"}}),
                      ParamKey::To});
    m_sets.push_back({IntentKind::Delete,
                      chains({{"delete"}, {"remove"}, {"trash"}, {"discard"}, {"erase"}}),
                      ParamKey::From});
}

bool IntentExtractor::matches(const PatternSet& set, const std::vector<std::string>& lines) const {
    for (const auto& chain : set.chains) {
        for (const auto& line : lines) {
            if (chain_in_line(chain, line)) return true;
        }
    }
    return false;
}

// Position just past "<label>[: ]+" for the next whole-word label at or after from,
// or npos. label_pos receives where the label started.
static size_t after_label(const std::string& lower, const std::string& label, size_t from, size_t& label_pos) {
    for (size_t p = lower.find(label, from); p != std::string::npos; p = lower.find(label, p + 1)) {
        if (p > 0 && is_word_char(lower[p - 1])) continue;
        size_t q = p + label.size();
        size_t seps = q;
        while (seps < lower.size() && (lower[seps] == ':' || util::is_space(lower[seps]))) ++seps;
        if (seps == q) continue;
        label_pos = p;
        return seps;
    }
    return std::string::npos;
}

// local-part@domain: a run without whitespace or commas holding an inner '@'.
std::optional<std::string> IntentExtractor::address_after(const std::string& text, const std::string& lower,
                                                          const std::string& label) const {
    size_t label_pos = 0;
    for (size_t q = after_label(lower, label, 0, label_pos); q != std::string::npos;
         q = after_label(lower, label, label_pos + 1, label_pos)) {
        size_t e = q;
        while (e < text.size() && text[e] != ',' && !util::is_space(text[e])) ++e;
        if (e - q < 3) continue;
        size_t at = text.find('@', q + 1);
        if (at == std::string::npos || at >= e - 1) continue;
        return text.substr(q, e - q);
    }
    return std::nullopt;
}

// Contents of a '...' or "..." string; either quote closes it.
std::optional<std::string> IntentExtractor::quoted_after(const std::string& text, const std::string& lower,
                                                         const std::string& label) const {
    size_t label_pos = 0;
    for (size_t q = after_label(lower, label, 0, label_pos); q != std::string::npos;
         q = after_label(lower, label, label_pos + 1, label_pos)) {
        if (q >= text.size() || (text[q] != '\'' && text[q] != '"')) continue;
        size_t close = text.find_first_of("'\"", q + 1);
        if (close == std::string::npos || close == q + 1) continue;
        return text.substr(q + 1, close - q - 1);
    }
    return std::nullopt;
}

ExtractedParams IntentExtractor::extract_params(const PatternSet& set, const std::string& text,
                                                const std::string& lower) const {
    ExtractedParams params;
    const char* label = (set.address_key == ParamKey::To) ? "to" : "from";
    if (auto addr = address_after(text, lower, label)) {
        std::string v = util::trim(*addr);
        if (!v.empty()) params.set(set.address_key, v);
    }
    if (auto subject = quoted_after(text, lower, "subject")) {
        std::string v = util::trim(*subject);
        if (!v.empty()) params.set(ParamKey::Subject, v);
    }
    return params;
}

ExtractedIntent IntentExtractor::extract(const std::string& user_prompt) const {
    std::string lower = util::to_lower(user_prompt);
    auto lines = split_lines(lower);
    // first matching set wins, even if a later one would match too
    for (const auto& set : m_sets) {
        if (matches(set, lines)) {
            return ExtractedIntent{set.kind, extract_params(set, user_prompt, lower)};
        }
    }
    return ExtractedIntent{};
}

} // namespace mailguard
