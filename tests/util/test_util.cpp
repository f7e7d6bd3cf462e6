// VELOCK - Utility Tests
// Copyright (c) 2024 VELOCK Developers
// MIT License

#include <gtest/gtest.h>
#include "velock/util/callguard.h"
#include "velock/util/logging.h"
#include "velock/util/time.h"

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <thread>
#include <vector>

using namespace velock::util;

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Trace);
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); },
            LogLevel::Trace);
        logger.AddSink(sink_);
    }

    void TearDown() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, LevelNames) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_EQ(LogLevelFromString("WARNING"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("chatty"), LogLevel::Info);
}

TEST_F(LoggingTest, StreamMacroCarriesCategoryAndLocation) {
    LOG_INFO(LogCategory::STAKE) << "locked " << 1000 << " for " << 10 << " epochs";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, "stake");
    EXPECT_EQ(entries_[0].message, "locked 1000 for 10 epochs");
    EXPECT_EQ(GetBasename(entries_[0].file), "test_util.cpp");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, PrintfMacro) {
    LogWarnF(LogCategory::GOVERNANCE, "proposal %d rejected: %s", 7, "no power");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "proposal 7 rejected: no power");
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_DEBUG(LogCategory::DB) << "hidden";
    LOG_INFO(LogCategory::DB) << "hidden";
    LOG_ERROR(LogCategory::DB) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");

    sink_->SetLevel(LogLevel::Fatal);
    LOG_ERROR(LogCategory::DB) << "dropped by sink";
    EXPECT_EQ(entries_.size(), 1u);
}

TEST_F(LoggingTest, StreamArgumentsNotEvaluatedWhenDisabled) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluations = 0;
    auto expensive = [&evaluations]() { return ++evaluations; };
    LOG_DEBUG(LogCategory::STAKE) << expensive();
    EXPECT_EQ(evaluations, 0);
}

TEST_F(LoggingTest, CategoryFiltering) {
    Logger& logger = Logger::Instance();
    logger.EnableCategory(LogCategory::GOVERNANCE);
    EXPECT_TRUE(logger.IsCategoryEnabled("governance"));
    EXPECT_FALSE(logger.IsCategoryEnabled("stake"));

    LOG_INFO(LogCategory::STAKE) << "filtered";
    LOG_INFO(LogCategory::GOVERNANCE) << "kept";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "governance");

    logger.DisableCategory(LogCategory::GOVERNANCE);
    EXPECT_FALSE(logger.IsCategoryEnabled("governance"));
    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled("stake"));
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = "db";
    entry.message = "snapshot rejected";
    entry.file = "/src/db/ledgerdb.cpp";
    entry.line = 42;
    entry.function = "ReadLedger";

    LogFormat format;
    format.showTimestamp = false;
    EXPECT_EQ(FormatLogEntry(entry, format), "[WARN ] [db] snapshot rejected");

    format.showLocation = true;
    format.showLevel = false;
    EXPECT_EQ(FormatLogEntry(entry, format),
              "[db] ledgerdb.cpp:42 ReadLedger() snapshot rejected");

    entry.category = LogCategory::DEFAULT;
    format.showLocation = false;
    EXPECT_EQ(FormatLogEntry(entry, format), "snapshot rejected");
}

TEST_F(LoggingTest, RemoveSink) {
    Logger& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 1u);
    logger.RemoveSink(sink_);
    EXPECT_EQ(logger.SinkCount(), 0u);
    LOG_ERROR(LogCategory::SIM) << "nowhere";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    auto path = std::filesystem::temp_directory_path() / "velock_log_test.log";
    std::filesystem::remove(path);

    FileSink::Config config;
    config.path = path.string();
    config.append = false;
    config.format = LogFormat{false, true, true, false, false};
    {
        auto file = std::make_shared<FileSink>(config);
        ASSERT_TRUE(file->IsOpen());
        Logger::Instance().AddSink(file);
        LOG_INFO(LogCategory::CONFIG) << "loaded velock.conf";
        Logger::Instance().Flush();
        Logger::Instance().RemoveSink(file);
        EXPECT_GT(file->GetCurrentSize(), 0u);
    }

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "[INFO ] [config] loaded velock.conf\n");
    std::filesystem::remove(path);
}

TEST_F(LoggingTest, ScopedTimerLogsAtDebug) {
    {
        VELOCK_LOG_TIMER(LogCategory::DB, "WriteLedger");
    }
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Debug);
    EXPECT_EQ(entries_[0].message.rfind("WriteLedger took ", 0), 0u);
}

// ============================================================================
// Time Tests
// ============================================================================

TEST(TimeTest, ScopedMockTimeRestores) {
    bool wasEnabled = IsMockTimeEnabled();
    {
        ScopedMockTime mock(1700000000);
        EXPECT_TRUE(IsMockTimeEnabled());
        EXPECT_EQ(GetTime(), 1700000000);
        AdvanceMockTime(SECONDS_PER_WEEK);
        EXPECT_EQ(GetTime(), 1700000000 + 604800);
    }
    EXPECT_EQ(IsMockTimeEnabled(), wasEnabled);
}

TEST(TimeTest, RealTimeIsRecent) {
    ScopedMockTime mock(0);
    DisableMockTime();
    EXPECT_GT(GetTime(), 1600000000);
}

TEST(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1700000000), "2023-11-14T22:13:20Z");
}

TEST(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(0), "0s");
    EXPECT_EQ(FormatDuration(59), "59s");
    EXPECT_EQ(FormatDuration(SECONDS_PER_DAY + 2 * SECONDS_PER_HOUR + 5), "1d 2h 5s");
    EXPECT_EQ(FormatDuration(-90), "-1m 30s");
    EXPECT_EQ(FormatDuration(SECONDS_PER_WEEK), "7d");
}

TEST(TimeTest, FormatDurationExtremes) {
    EXPECT_EQ(FormatDuration(std::numeric_limits<int64_t>::min()),
              "-106751991167300d 15h 30m 8s");
    EXPECT_EQ(FormatDuration(std::numeric_limits<int64_t>::max()),
              "106751991167300d 15h 30m 7s");
}

// ============================================================================
// External Call Guard Tests
// ============================================================================

TEST(ExternalCallGuardTest, ScopeMarksCurrentThreadOnly) {
    ExternalCallGuard guard;
    EXPECT_FALSE(guard.IsCurrentThreadInside());
    {
        ExternalCallGuard::Scope scope(guard);
        EXPECT_TRUE(guard.IsCurrentThreadInside());

        bool otherInside = true;
        std::thread other([&]() { otherInside = guard.IsCurrentThreadInside(); });
        other.join();
        EXPECT_FALSE(otherInside);
    }
    EXPECT_FALSE(guard.IsCurrentThreadInside());
}
