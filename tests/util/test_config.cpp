// LOCKVAULT - Configuration File Parser Tests
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include <gtest/gtest.h>

#include "lockvault/core/types.h"
#include "lockvault/util/config.h"
#include "lockvault/util/time.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace lockvault {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/lockvault_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValueAndComments) {
    auto result = config_.ParseString(
        "# comment\n"
        "; also a comment\n"
        "datadir = /var/lib/lockvault\n"
        "\n"
        "loglevel=debug\n");
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString("datadir", ""), "/var/lib/lockvault");
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.Size(), 2u);
}

TEST_F(ConfigTest, SectionsScopeKeys) {
    auto result = config_.ParseString(
        "[vault]\n"
        "cooldown=2d\n"
        "[roles]\n"
        "admin=ops\n");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(config_.HasKey("cooldown", "vault"));
    EXPECT_FALSE(config_.HasKey("cooldown"));
    EXPECT_EQ(config_.GetString("admin", "", "roles"), "ops");

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0], "roles");
    EXPECT_EQ(sections[1], "vault");
}

TEST_F(ConfigTest, BareFlagsAndNegation) {
    ASSERT_TRUE(config_.ParseString("debug\nnoprinttoconsole\n").success);
    EXPECT_TRUE(config_.GetBool("debug", false));
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString(
        "a=\"hello world\"\n"
        "b='single'\n"
        "c=\"tab\\there\"\n").success);
    EXPECT_EQ(config_.GetString("a", ""), "hello world");
    EXPECT_EQ(config_.GetString("b", ""), "single");
    EXPECT_EQ(config_.GetString("c", ""), "tab\there");
}

TEST_F(ConfigTest, LineContinuation) {
    ASSERT_TRUE(config_.ParseString("lockups=30d,\\\n90d\n", "<test>").success);
    EXPECT_EQ(config_.GetList("lockups").size(), 2u);
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("LOCKVAULT_TEST_DIR", "/opt/lv", 1);
    ASSERT_TRUE(config_.ParseString("datadir=${LOCKVAULT_TEST_DIR}/data\n"
                                    "logfile=$LOCKVAULT_TEST_DIR/debug.log\n").success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/opt/lv/data");
    EXPECT_EQ(config_.GetString("logfile", ""), "/opt/lv/debug.log");
    unsetenv("LOCKVAULT_TEST_DIR");
}

// ============================================================================
// Error Reporting
// ============================================================================

TEST_F(ConfigTest, UnclosedSectionIsError) {
    auto result = config_.ParseString("ok=1\n[vault\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.ToString(), "test.conf:2: Missing closing bracket in section header");
}

TEST_F(ConfigTest, InvalidKeyCharacterIsError) {
    auto result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid character"), std::string::npos);
}

TEST_F(ConfigTest, MissingFileIsError) {
    auto result = config_.ParseFile("/nonexistent/lockvault.conf");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, MissingDataDirConfigIsNotError) {
    auto result = config_.LoadDataDirConfig("/nonexistent/datadir");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

// ============================================================================
// Files and Includes
// ============================================================================

TEST_F(ConfigTest, ParseFileWithInclude) {
    std::string included = CreateTempFile("[multiplier]\nceiling=14000\n");
    std::string main = CreateTempFile("include " + included + "\n[vault]\nminstake=5\n");

    auto result = config_.ParseFile(main);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetInt("ceiling", 0, "multiplier"), 14000);
    EXPECT_EQ(config_.TryGetAmount("minstake", "vault"), 5 * COIN);
}

TEST_F(ConfigTest, SelfIncludeHitsDepthLimit) {
    std::string path = CreateTempFile("");
    {
        std::ofstream file(path);
        file << "include " << path << "\n";
    }
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("include depth"), std::string::npos);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, IntegersAreStrict) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=12abc\nd=\n").success);
    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_EQ(config_.TryGetInt("b"), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_EQ(config_.GetInt("missing", 9), 9);
}

TEST_F(ConfigTest, Booleans) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=OFF\nc=maybe\n").success);
    EXPECT_EQ(config_.TryGetBool("a"), true);
    EXPECT_EQ(config_.TryGetBool("b"), false);
    EXPECT_FALSE(config_.TryGetBool("c").has_value());
}

TEST_F(ConfigTest, DurationsAndAmounts) {
    ASSERT_TRUE(config_.ParseString("[vault]\ncooldown=2d\nearlycooldown=1w\n"
                                    "maxstake=10000\nminstake=0.5\nbad=ten\n").success);
    EXPECT_EQ(config_.TryGetDuration("cooldown", "vault"), 2 * SECONDS_PER_DAY);
    EXPECT_EQ(config_.TryGetDuration("earlycooldown", "vault"), 7 * SECONDS_PER_DAY);
    EXPECT_EQ(config_.TryGetAmount("maxstake", "vault"), 10000 * COIN);
    EXPECT_EQ(config_.TryGetAmount("minstake", "vault"), COIN / 2);
    EXPECT_FALSE(config_.TryGetAmount("bad", "vault").has_value());
    EXPECT_FALSE(config_.TryGetDuration("bad", "vault").has_value());
}

TEST_F(ConfigTest, ListsCombineCommasAndRepeats) {
    ASSERT_TRUE(config_.ParseString(
        "[multiplier]\n"
        "tier=0:10500/11000\n"
        "tier=1000:11000/11500\n"
        "[vault]\n"
        "lockups=30d, 90d ,180d\n").success);

    auto tiers = config_.GetList("tier", "multiplier");
    ASSERT_EQ(tiers.size(), 2u);
    EXPECT_EQ(tiers[0], "0:10500/11000");
    EXPECT_EQ(tiers[1], "1000:11000/11500");

    auto lockups = config_.GetList("lockups", "vault");
    ASSERT_EQ(lockups.size(), 3u);
    EXPECT_EQ(lockups[1], "90d");
}

// ============================================================================
// Programmatic Values
// ============================================================================

TEST_F(ConfigTest, SetOverridesParsedValuesAndLists) {
    ASSERT_TRUE(config_.ParseString("[multiplier]\ntier=a\ntier=b\n").success);
    config_.Set("tier", "c", "multiplier");
    auto tiers = config_.GetList("tier", "multiplier");
    ASSERT_EQ(tiers.size(), 1u);
    EXPECT_EQ(tiers[0], "c");
}

TEST_F(ConfigTest, DefaultsYieldToFileValues) {
    config_.SetDefault("loglevel", "info");
    EXPECT_EQ(config_.GetString("loglevel", ""), "info");

    ASSERT_TRUE(config_.ParseString("loglevel=trace\n").success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "trace");

    config_.SetDefault("loglevel", "warn");
    EXPECT_EQ(config_.GetString("loglevel", ""), "trace");
}

TEST_F(ConfigTest, ValidateReportsUnknownKeys) {
    EXPECT_TRUE(config_.Validate().empty());

    ASSERT_TRUE(config_.ParseString("[vault]\ncooldown=2d\ncooldwn=3d\n", "x.conf").success);
    config_.AllowKey("cooldown", "vault");

    auto warnings = config_.Validate();
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("vault.cooldwn"), std::string::npos);
    EXPECT_NE(warnings[0].find("x.conf:3"), std::string::npos);
}

TEST_F(ConfigTest, ExpandTilde) {
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/data"), "/home/tester/data");
    EXPECT_EQ(ConfigManager::ExpandTilde("~"), "/home/tester");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/x"), "~other/x");
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/tester/.lockvault");
}

} // namespace test
} // namespace util
} // namespace lockvault
