/*
 * Configuration - AI-MailGuard
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <istream>
#include <ai-mailguard/ai/llm.hpp>

namespace mailguard {

struct GuardConfig {
    bool verbose = false;   // log every request to stderr
    bool color = true;      // colored approve/reject markers in demo output
    ai::LLMConfig llm;      // responder backend for read actions
};

// key=value lines, '#' comments. Unknown keys and bad numbers are ignored.
void parse_config(std::istream& in, GuardConfig& cfg);
// Returns false if the file could not be opened (cfg left untouched).
bool load_config_file(const std::string& path, GuardConfig& cfg);
// $HOME/.ai-mailguardrc, empty if HOME is unset.
std::string default_config_path();

} // namespace mailguard
