// RISKVAULT - Configuration File Parser Tests
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include <gtest/gtest.h>

#include "riskvault/util/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace riskvault {
namespace util {
namespace test {

// ============================================================================
// Test Fixture
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() /
                   ("riskvault_config_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tempDir_, ec);
    }

    std::string WriteFile(const std::string& name, const std::string& content) {
        auto path = tempDir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path tempDir_;
    ConfigManager config_;
};

// ============================================================================
// Basic Parsing
// ============================================================================

TEST_F(ConfigTest, KeyValuePairs) {
    auto result = config_.ParseString(
        "# vault settings\n"
        "network=regtest\n"
        "  minupdateinterval = 120  \n"
        "; another comment\n"
        "\n"
        "printtoconsole\n");
    ASSERT_TRUE(result.success) << result.errorMessage;

    EXPECT_EQ(config_.GetString(ConfigKeys::NETWORK, "main"), "regtest");
    EXPECT_EQ(config_.GetInt(ConfigKeys::MIN_UPDATE_INTERVAL, 0), 120);
    EXPECT_TRUE(config_.GetBool(ConfigKeys::PRINTTOCONSOLE, false));
    EXPECT_FALSE(config_.HasKey(ConfigKeys::DATADIR));
    EXPECT_EQ(config_.GetString(ConfigKeys::DATADIR, "fallback"), "fallback");
}

TEST_F(ConfigTest, Sections) {
    ASSERT_TRUE(config_.ParseString(
        "bands=3\n"
        "[regtest]\n"
        "bands=4\n").success);

    EXPECT_EQ(config_.GetInt("bands", 0), 3);
    EXPECT_EQ(config_.GetInt("bands", 0, "regtest"), 4);
    EXPECT_FALSE(config_.HasKey("bands", "test"));
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString(
        "a=\"value with spaces\"\n"
        "b='single # quoted'\n"
        "c=\"tab\\tand\\\"quote\\\"\"\n").success);

    EXPECT_EQ(config_.GetString("a", ""), "value with spaces");
    EXPECT_EQ(config_.GetString("b", ""), "single # quoted");
    EXPECT_EQ(config_.GetString("c", ""), "tab\tand\"quote\"");
}

TEST_F(ConfigTest, ParseErrors) {
    auto bracket = config_.ParseString("ok=1\n[broken\n", "bad.conf");
    EXPECT_FALSE(bracket.success);
    EXPECT_EQ(bracket.errorFile, "bad.conf");
    EXPECT_EQ(bracket.errorLine, 2);

    auto key = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(key.success);

    auto longLine = config_.ParseString(std::string(MAX_LINE_LENGTH + 1, 'x'));
    EXPECT_FALSE(longLine.success);
}

// ============================================================================
// Typed Values
// ============================================================================

TEST_F(ConfigTest, Booleans) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=Off\nc=TRUE\nd=0\ne=maybe\n").success);
    EXPECT_EQ(config_.TryGetBool("a"), std::optional<bool>(true));
    EXPECT_EQ(config_.TryGetBool("b"), std::optional<bool>(false));
    EXPECT_EQ(config_.TryGetBool("c"), std::optional<bool>(true));
    EXPECT_EQ(config_.TryGetBool("d"), std::optional<bool>(false));
    EXPECT_FALSE(config_.TryGetBool("e").has_value());
    EXPECT_TRUE(config_.GetBool("e", true));
}

TEST_F(ConfigTest, DurationSuffixes) {
    ASSERT_TRUE(config_.ParseString(
        "plain=45\nsec=30s\nmin=2m\nhour=1h\nday=30d\nneg=-5\nbad=5w\nword=soon\n").success);

    EXPECT_EQ(config_.TryGetInt("plain"), std::optional<int64_t>(45));
    EXPECT_EQ(config_.TryGetInt("sec"), std::optional<int64_t>(30));
    EXPECT_EQ(config_.TryGetInt("min"), std::optional<int64_t>(120));
    EXPECT_EQ(config_.TryGetInt("hour"), std::optional<int64_t>(3600));
    EXPECT_EQ(config_.TryGetInt("day"), std::optional<int64_t>(30 * 86400));
    EXPECT_EQ(config_.TryGetInt("neg"), std::optional<int64_t>(-5));
    EXPECT_FALSE(config_.TryGetInt("bad").has_value());
    EXPECT_FALSE(config_.TryGetInt("word").has_value());
    EXPECT_EQ(config_.GetInt("word", 7), 7);
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    ::setenv("RISKVAULT_TEST_DIR", "/srv/vault", 1);
    ASSERT_TRUE(config_.ParseString("datadir=${RISKVAULT_TEST_DIR}/state\n").success);
    EXPECT_EQ(config_.GetString(ConfigKeys::DATADIR, ""), "/srv/vault/state");
    ::unsetenv("RISKVAULT_TEST_DIR");

    EXPECT_EQ(ConfigManager::ExpandEnvVars("${RISKVAULT_TEST_UNSET_VAR}x"), "x");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${unterminated"), "${unterminated");
}

TEST_F(ConfigTest, TildeExpansion) {
    const char* saved = std::getenv("HOME");
    std::string home = saved ? saved : "";

    ::setenv("HOME", "/home/auditor", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/vault"), "/home/auditor/vault");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs/path"), "/abs/path");
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/auditor/.riskvault");

    if (saved) {
        ::setenv("HOME", home.c_str(), 1);
    } else {
        ::unsetenv("HOME");
    }
}

// ============================================================================
// Files and Command Line
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = WriteFile("riskvault.conf", "network=test\nscorevalidity=7d\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString(ConfigKeys::NETWORK, ""), "test");
    EXPECT_EQ(config_.GetInt(ConfigKeys::SCORE_VALIDITY, 0), 7 * 86400);

    EXPECT_FALSE(config_.ParseFile((tempDir_ / "missing.conf").string()).success);
}

TEST_F(ConfigTest, CommandLine) {
    const char* args[] = {"riskvault-cli", "-datadir=/tmp/rv", "--network=regtest",
                          "-noprinttoconsole", "-debug", "submit", "-42", "0xabc"};
    auto result = config_.ParseCommandLine(8, const_cast<char**>(args));
    ASSERT_TRUE(result.success) << result.errorMessage;

    EXPECT_EQ(config_.GetString(ConfigKeys::DATADIR, ""), "/tmp/rv");
    EXPECT_EQ(config_.GetString(ConfigKeys::NETWORK, ""), "regtest");
    EXPECT_FALSE(config_.GetBool(ConfigKeys::PRINTTOCONSOLE, true));
    EXPECT_TRUE(config_.GetBool(ConfigKeys::DEBUG, false));

    ASSERT_EQ(config_.GetPositionalArgs().size(), 3u);
    EXPECT_EQ(config_.GetPositionalArgs()[0], "submit");
    EXPECT_EQ(config_.GetPositionalArgs()[1], "-42");
    EXPECT_EQ(config_.GetPositionalArgs()[2], "0xabc");
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    const char* args[] = {"riskvault-cli", "-network=regtest"};
    ASSERT_TRUE(config_.ParseCommandLine(2, const_cast<char**>(args)).success);
    config_.SetDefault(ConfigKeys::NETWORK, "main");
    config_.SetDefault(ConfigKeys::BANDS, "3");

    EXPECT_EQ(config_.GetString(ConfigKeys::NETWORK, ""), "regtest");
    EXPECT_EQ(config_.GetInt(ConfigKeys::BANDS, 0), 3);
}

TEST_F(ConfigTest, InvalidOption) {
    const char* args[] = {"riskvault-cli", "-bad key=1"};
    EXPECT_FALSE(config_.ParseCommandLine(2, const_cast<char**>(args)).success);
}

TEST_F(ConfigTest, SetAndClear) {
    config_.Set("sender", "0x01", "admin");
    EXPECT_EQ(config_.GetString("sender", "", "admin"), "0x01");
    EXPECT_NE(config_.Dump().find("admin.sender=0x01"), std::string::npos);

    config_.Clear();
    EXPECT_FALSE(config_.HasKey("sender", "admin"));
    EXPECT_TRUE(config_.GetPositionalArgs().empty());
}

} // namespace test
} // namespace util
} // namespace riskvault
