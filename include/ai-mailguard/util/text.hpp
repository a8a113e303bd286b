/*
 * Text helpers - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <cstddef>

namespace mailguard::util {

// Strips ASCII whitespace; bytes >= 0x80 are never treated as space.
std::string trim(const std::string& s);
// ASCII lower-casing; multi-byte UTF-8 sequences pass through unchanged.
std::string to_lower(std::string s);
// Number of UTF-8 code points (continuation bytes are not counted).
std::size_t utf8_length(const std::string& s);
bool is_space(char c);

} // namespace mailguard::util
