/*
 * Text helpers - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-mailguard/util/text.hpp>
#include <algorithm>
#include <cctype>

namespace mailguard::util {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string trim(const std::string& s) {
    size_t a=0; while(a<s.size() && is_space(s[a])) ++a;
    size_t b=s.size(); while(b>a && is_space(s[b-1])) --b;
    return s.substr(a,b-a);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

std::size_t utf8_length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) if ((c & 0xC0) != 0x80) ++n;
    return n;
}

} // namespace mailguard::util
