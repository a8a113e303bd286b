/*
 * Intent extractor - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Classifies a free-text user prompt into an IntentKind and pulls out the
 * from/to/subject constraints the user stated. Verb tables are built once in
 * the constructor and only read afterwards, so one instance can be shared
 * between threads. Matching is a linear scan; prompt length is unbounded.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <ai-mailguard/core/intent.hpp>

namespace mailguard {

class IntentExtractor {
public:
    IntentExtractor();

    // Never throws; unmatched prompts yield {Unknown, {}}.
    ExtractedIntent extract(const std::string& user_prompt) const;

private:
    // Words that must appear in order on one line, "email" last.
    using VerbChain = std::vector<std::string>;

    struct PatternSet {
        IntentKind kind;
        std::vector<VerbChain> chains;
        ParamKey address_key;   // from for read/delete, to for write
    };

    bool matches(const PatternSet& set, const std::vector<std::string>& lines) const;
    ExtractedParams extract_params(const PatternSet& set, const std::string& text, const std::string& lower) const;
    std::optional<std::string> address_after(const std::string& text, const std::string& lower, const std::string& label) const;
    std::optional<std::string> quoted_after(const std::string& text, const std::string& lower, const std::string& label) const;

    std::vector<PatternSet> m_sets;   // priority order: read, write, delete
};

} // namespace mailguard
