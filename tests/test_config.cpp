#include <gtest/gtest.h>
#include <ai-mailguard/config.hpp>
#include <sstream>

using namespace mailguard;

TEST(Config, ParsesKnownKeys) {
    std::istringstream in(
        "# responder\n"
        "verbose=on\n"
        "color = false\n"
        "llm_enabled=1\n"
        "llm_provider=ollama\n"
        "llm_model=llama3\n"
        "llm_max_tokens=128\n"
        "llm_temperature=0.5\n"
        "llm_timeout=5\n");
    GuardConfig cfg;
    parse_config(in, cfg);
    EXPECT_TRUE(cfg.verbose);
    EXPECT_FALSE(cfg.color);
    EXPECT_TRUE(cfg.llm.enabled);
    EXPECT_EQ(cfg.llm.provider, "ollama");
    EXPECT_EQ(cfg.llm.model, "llama3");
    EXPECT_EQ(cfg.llm.max_tokens, 128);
    EXPECT_DOUBLE_EQ(cfg.llm.temperature, 0.5);
    EXPECT_EQ(cfg.llm.timeout_seconds, 5);
}

TEST(Config, BadValuesKeepDefaults) {
    std::istringstream in("llm_max_tokens=lots\nunknown_key=1\nno equals sign\nllm_timeout=\n");
    GuardConfig cfg;
    parse_config(in, cfg);
    EXPECT_EQ(cfg.llm.max_tokens, 512);
    EXPECT_EQ(cfg.llm.timeout_seconds, 20);
    EXPECT_FALSE(cfg.verbose);
}

TEST(Config, MissingFile) {
    GuardConfig cfg;
    EXPECT_FALSE(load_config_file("/nonexistent/ai-mailguardrc", cfg));
    EXPECT_FALSE(load_config_file("", cfg));
}
