/*
 * Response content checker - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include <ai-mailguard/core/intent.hpp>

namespace mailguard {

// Heuristic filter for responses generated on top of a read action. Catches
// responses that inflate the source email, carry known attack phrases, or
// introduce too much vocabulary the email never used. Checks run in that
// order and the first failure is reported.
class ContentChecker {
public:
    static constexpr double kMaxLengthRatio = 1.5;
    static constexpr double kMaxNovelWordRatio = 0.3;

    ContentChecker();

    CheckResult validate(const std::string& email_content, const std::string& proposed_response) const;

    const std::vector<std::string>& indicators() const { return m_indicators; }

private:
    std::vector<std::string> m_indicators; // lower-case phrases
};

} // namespace mailguard
