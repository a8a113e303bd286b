/*
 * Response content checker implementation - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-mailguard/core/content_checker.hpp>
#include <ai-mailguard/util/text.hpp>
#include <sstream>
#include <unordered_set>

namespace mailguard {

static std::unordered_set<std::string> word_set(const std::string& lower_text) {
    std::unordered_set<std::string> words;
    std::istringstream iss(lower_text); std::string w;
    while (iss >> w) words.insert(w);
    return words;
}

ContentChecker::ContentChecker()
    : m_indicators{
        "forward this email",
        "click this link",
        "download this attachment",
        "reply with your password",
        "provide your credentials",
        "execute this code",
        "run this command",
        "ignore security warnings"} {}

CheckResult ContentChecker::validate(const std::string& email_content, const std::string& proposed_response) const {
    // lengths in characters, not bytes
    if ((double)util::utf8_length(proposed_response) > (double)util::utf8_length(email_content) * kMaxLengthRatio) {
        return {false, "Response is significantly longer than email content, potential deceptive output"};
    }

    std::string response_lower = util::to_lower(proposed_response);
    for (const auto& ind : m_indicators) {
        if (response_lower.find(ind) != std::string::npos) {
            return {false, "Response contains potential attack indicator: '" + ind + "'"};
        }
    }

    auto email_words = word_set(util::to_lower(email_content));
    auto response_words = word_set(response_lower);
    size_t novel = 0;
    for (const auto& w : response_words) {
        if (email_words.find(w) == email_words.end()) ++novel;
    }
    // empty response: 0 > 0 never holds
    if ((double)novel > (double)response_words.size() * kMaxNovelWordRatio) {
        return {false, "Response introduces many new concepts not present in the email"};
    }
    return {true, "Response content validated successfully"};
}

} // namespace mailguard
