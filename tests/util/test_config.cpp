// VELOCK - Configuration Tests
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include <gtest/gtest.h>
#include "velock/util/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace velock::util;

// ============================================================================
// Parsing
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    ConfigManager config_;
};

TEST_F(ConfigTest, KeyValuePairs) {
    auto result = config_.ParseString(
        "datadir = /var/lib/velock\n"
        "loglevel=debug\n"
        "  script =  run.txt  \n");
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString("datadir", ""), "/var/lib/velock");
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.GetString("script", ""), "run.txt");
    EXPECT_EQ(config_.Size(), 3u);
}

TEST_F(ConfigTest, CommentsAndBlankLines) {
    ASSERT_TRUE(config_.ParseString("# comment\n; also comment\n\n  \nkey=1\n").success);
    EXPECT_EQ(config_.Size(), 1u);
    EXPECT_EQ(config_.GetInt("key", 0), 1);
}

TEST_F(ConfigTest, Sections) {
    ASSERT_TRUE(config_.ParseString(
        "loglevel=info\n"
        "[ledger]\n"
        "epoch_width = 86400\n"
        "[ governance ]\n"
        "vote_window = 2\n").success);

    EXPECT_EQ(config_.GetInt(ConfigKeys::EPOCH_WIDTH, 0, ConfigKeys::LEDGER_SECTION), 86400);
    EXPECT_EQ(config_.GetUInt(ConfigKeys::VOTE_WINDOW, 0, ConfigKeys::GOVERNANCE_SECTION), 2u);
    EXPECT_FALSE(config_.HasKey("epoch_width"));
    EXPECT_EQ(config_.GetSections(), (std::vector<std::string>{"governance", "ledger"}));
    EXPECT_EQ(config_.GetKeys(), (std::vector<std::string>{"loglevel"}));
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString(
        "a = \"with spaces\"\n"
        "b = 'raw \\n'\n"
        "c = \"tab\\there\"\n").success);
    EXPECT_EQ(config_.GetString("a", ""), "with spaces");
    EXPECT_EQ(config_.GetString("b", ""), "raw \\n");
    EXPECT_EQ(config_.GetString("c", ""), "tab\there");
}

TEST_F(ConfigTest, LineContinuation) {
    ASSERT_TRUE(config_.ParseString("script = first\\\n_second\nnext=1\n").success);
    EXPECT_EQ(config_.GetString("script", ""), "first_second");
    EXPECT_EQ(config_.GetEntry("next")->lineNumber, 3);
}

TEST_F(ConfigTest, BareKeysAndNegation) {
    ASSERT_TRUE(config_.ParseString("printtoconsole\nnodebug\n").success);
    EXPECT_TRUE(config_.GetBool(ConfigKeys::PRINTTOCONSOLE, false));
    EXPECT_EQ(config_.TryGetBool(ConfigKeys::DEBUG), false);
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("VELOCK_TEST_DIR", "/tmp/velock", 1);
    ASSERT_TRUE(config_.ParseString("datadir = ${VELOCK_TEST_DIR}/data\n"
                                    "other = ${VELOCK_UNSET_VARIABLE}x\n").success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/tmp/velock/data");
    EXPECT_EQ(config_.GetString("other", ""), "x");
    unsetenv("VELOCK_TEST_DIR");
}

TEST_F(ConfigTest, LaterDefinitionWins) {
    ASSERT_TRUE(config_.ParseString("key=1\nkey=2\n").success);
    EXPECT_EQ(config_.GetInt("key", 0), 2);
}

TEST_F(ConfigTest, ErrorsReportLine) {
    auto result = config_.ParseString("ok=1\n[broken\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.ToString(), "test.conf:2: Missing closing bracket in section header");

    result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid character"), std::string::npos);

    EXPECT_FALSE(config_.ParseString("=value\n").success);
}

TEST_F(ConfigTest, ParseFile) {
    auto path = std::filesystem::temp_directory_path() / "velock_config_test.conf";
    {
        std::ofstream out(path);
        out << "[ledger]\nmax_lock_epochs = 104\n";
    }
    auto result = config_.ParseFile(path.string());
    ASSERT_TRUE(result.success) << result.ToString();
    auto entry = config_.GetEntry(ConfigKeys::MAX_LOCK_EPOCHS, ConfigKeys::LEDGER_SECTION);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->value, "104");
    EXPECT_EQ(entry->source, path.string());
    std::filesystem::remove(path);

    EXPECT_FALSE(config_.ParseFile("/nonexistent/velock.conf").success);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, IntegerGetters) {
    ASSERT_TRUE(config_.ParseString("neg=-5\nbig=18446744073709551615\nbad=12x\n").success);
    EXPECT_EQ(config_.TryGetInt("neg"), -5);
    EXPECT_FALSE(config_.TryGetUInt("neg"));
    EXPECT_EQ(config_.TryGetUInt("big"), UINT64_MAX);
    EXPECT_FALSE(config_.TryGetInt("big"));
    EXPECT_FALSE(config_.TryGetInt("bad"));
    EXPECT_EQ(config_.GetInt("bad", 7), 7);
    EXPECT_EQ(config_.GetUInt("missing", 9), 9u);
}

TEST_F(ConfigTest, BoolGetters) {
    EXPECT_EQ(ConfigManager::ParseBool("Yes"), true);
    EXPECT_EQ(ConfigManager::ParseBool("off"), false);
    EXPECT_EQ(ConfigManager::ParseBool("0"), false);
    EXPECT_FALSE(ConfigManager::ParseBool("maybe"));
}

TEST_F(ConfigTest, PathExpandsTilde) {
    setenv("HOME", "/home/tester", 1);
    ASSERT_TRUE(config_.ParseString("datadir=~/velock\n").success);
    EXPECT_EQ(config_.GetPath("datadir"), "/home/tester/velock");
    EXPECT_EQ(config_.GetPath("missing", "fallback"), "fallback");
}

TEST_F(ConfigTest, DefaultsYieldToExplicitValues) {
    config_.SetDefault("loglevel", "warn");
    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
    EXPECT_TRUE(config_.GetEntry("loglevel")->isDefault);

    ASSERT_TRUE(config_.ParseString("loglevel=debug\n").success);
    config_.SetDefault("loglevel", "error");
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, CommandLineForms) {
    const char* argv[] = {"velock-sim", "--datadir=/data", "--loglevel", "debug",
                          "--ledger.epoch_width=3600", "--noprinttoconsole",
                          "script.txt", "--debug"};
    auto result = config_.ParseCommandLine(8, argv);
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString("datadir", ""), "/data");
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.GetInt("epoch_width", 0, "ledger"), 3600);
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
    EXPECT_TRUE(config_.GetBool("debug", false));
    EXPECT_EQ(config_.GetPositionalArgs(), (std::vector<std::string>{"script.txt"}));
    EXPECT_EQ(config_.GetEntry("datadir")->source, "<command-line>");
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    ASSERT_TRUE(config_.ParseString("[governance]\nvote_window=1\n").success);
    const char* argv[] = {"velock-sim", "--governance.vote_window=4"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    EXPECT_EQ(config_.GetUInt("vote_window", 0, "governance"), 4u);
}

TEST_F(ConfigTest, CommandLineRejectsBadOption) {
    const char* argv[] = {"velock-sim", "--bad!option"};
    EXPECT_FALSE(config_.ParseCommandLine(2, argv).success);
}

TEST_F(ConfigTest, ClearRemovesEverything) {
    const char* argv[] = {"velock-sim", "pos", "--a=1"};
    ASSERT_TRUE(config_.ParseCommandLine(3, argv).success);
    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_TRUE(config_.GetPositionalArgs().empty());
}

TEST_F(ConfigTest, DumpListsQualifiedKeys) {
    ASSERT_TRUE(config_.ParseString("a=1\n[ledger]\nb=2\n").success);
    EXPECT_EQ(config_.Dump(), "a=1\nledger.b=2\n");
}
