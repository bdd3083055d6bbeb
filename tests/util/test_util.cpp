// VALORIA - Util Module Tests
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include <gtest/gtest.h>

#include <valoria/util/logging.h>
#include <valoria/util/time.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <random>
#include <string>
#include <vector>

namespace valoria {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> Capture(std::vector<LogEntry>& out,
                                          LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [&out](const LogEntry& entry) { out.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("1"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Info"), LogLevel::Info);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("ERROR"), LogLevel::Error);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info); // Default
}

TEST_F(LoggingTest, LoggerSingleton) {
    auto& logger1 = Logger::Instance();
    auto& logger2 = Logger::Instance();
    EXPECT_EQ(&logger1, &logger2);
}

TEST_F(LoggingTest, LoggerAddClearSinks) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    logger.AddSink(std::make_shared<ConsoleSink>());
    std::vector<LogEntry> captured;
    Capture(captured);
    EXPECT_EQ(logger.SinkCount(), 2u);

    logger.ClearSinks();
    EXPECT_EQ(logger.SinkCount(), 0u);
    LOG_ERROR(LogCategory::DB) << "nowhere";
    EXPECT_TRUE(captured.empty());
}

TEST_F(LoggingTest, LoggerWillLog) {
    auto& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Info);

    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::CONSENSUS));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::CONSENSUS));
    EXPECT_TRUE(logger.WillLog(LogLevel::Error, LogCategory::CONSENSUS));
    EXPECT_FALSE(logger.WillLog(LogLevel::Off, LogCategory::CONSENSUS));

    logger.SetLevel(LogLevel::Off);
    EXPECT_FALSE(logger.WillLog(LogLevel::Fatal, LogCategory::DEFAULT));
}

TEST_F(LoggingTest, LoggerCategoryFiltering) {
    auto& logger = Logger::Instance();

    logger.DisableCategory(LogCategory::LEDGER);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::LEDGER));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::CONSENSUS));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::ORACLE));

    logger.DisableCategory(LogCategory::CLI);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::CLI));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::LEDGER));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::LEDGER));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::CLI));
}

TEST_F(LoggingTest, StreamMacrosReachSinks) {
    std::vector<LogEntry> captured;
    Capture(captured);
    Logger::Instance().SetLevel(LogLevel::Debug);

    LOG_INFO(LogCategory::CONSENSUS) << "Subject " << 123 << " valued at " << 500000;
    LOG_TRACE(LogCategory::CONSENSUS) << "dropped";

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].level, LogLevel::Info);
    EXPECT_EQ(captured[0].category, LogCategory::CONSENSUS);
    EXPECT_EQ(captured[0].message, "Subject 123 valued at 500000");
    EXPECT_GT(captured[0].line, 0);
}

TEST_F(LoggingTest, DisabledCategoryIsNotEvaluated) {
    std::vector<LogEntry> captured;
    Capture(captured);
    Logger::Instance().DisableCategory(LogCategory::LEDGER);

    int evaluated = 0;
    auto sideEffect = [&evaluated]() { return ++evaluated; };
    LOG_WARN(LogCategory::LEDGER) << sideEffect();

    EXPECT_TRUE(captured.empty());
    EXPECT_EQ(evaluated, 0);
}

TEST_F(LoggingTest, PrintfStyle) {
    std::vector<LogEntry> captured;
    Capture(captured);

    LogWarnF(LogCategory::ORACLE, "oracle %s weight %d", "alice", 50);

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].message, "oracle alice weight 50");
    EXPECT_EQ(captured[0].level, LogLevel::Warn);
}

TEST_F(LoggingTest, CallbackSinkLevel) {
    std::vector<LogEntry> captured;
    Capture(captured, LogLevel::Error);

    auto& logger = Logger::Instance();
    logger.Log(LogLevel::Info, LogCategory::DEFAULT, "ignored");
    logger.Log(LogLevel::Error, LogCategory::DEFAULT, "kept");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].message, "kept");
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::DB;
    entry.message = "slow write";
    entry.file = "/src/db/database.cpp";
    entry.line = 42;

    LogFormat format;
    format.showTimestamp = false;
    format.showLocation = true;

    EXPECT_EQ(FormatLogEntry(entry, format), "[WARN ] [db] database.cpp:42 slow write");

    format.showCategory = false;
    format.showLocation = false;
    EXPECT_EQ(FormatLogEntry(entry, format), "[WARN ] slow write");
}

TEST_F(LoggingTest, GetBasename) {
    EXPECT_EQ(GetBasename("/a/b/engine.cpp"), "engine.cpp");
    EXPECT_EQ(GetBasename("engine.cpp"), "engine.cpp");
}

TEST_F(LoggingTest, ConsoleSinkConfig) {
    ConsoleSink::Config config;
    config.useColors = false;
    config.format.showTimestamp = false;

    ConsoleSink sink(config);
    EXPECT_FALSE(sink.GetConfig().useColors);
    EXPECT_FALSE(sink.GetConfig().format.showTimestamp);
    EXPECT_EQ(sink.GetLevel(), LogLevel::Info);
}

// ============================================================================
// File Sink Tests
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("valoria_log_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    static LogEntry MakeEntry(const std::string& message) {
        LogEntry entry;
        entry.level = LogLevel::Info;
        entry.category = LogCategory::DEFAULT;
        entry.message = message;
        entry.timestamp = std::chrono::system_clock::now();
        return entry;
    }

    static std::string ReadAll(const std::filesystem::path& path) {
        std::ifstream in(path);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, WritesLines) {
    const auto path = testDir_ / "debug.log";
    {
        FileSink sink(path.string());
        ASSERT_TRUE(sink.IsOpen());
        sink.Write(MakeEntry("first"));
        sink.Write(MakeEntry("second"));
        sink.Flush();
        EXPECT_GT(sink.GetCurrentSize(), 0u);
    }

    const std::string content = ReadAll(path);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, Rotates) {
    FileSink::Config config;
    config.path = (testDir_ / "debug.log").string();
    config.maxSize = 16;
    config.maxFiles = 2;
    config.format = LogFormat{false, false, false, false};

    FileSink sink(config);
    ASSERT_TRUE(sink.IsOpen());
    sink.Write(MakeEntry("aaaaaaaaaaaaaaaaaaaa"));
    sink.Write(MakeEntry("bbbbbbbbbbbbbbbbbbbb"));
    sink.Write(MakeEntry("cccccccccccccccccccc"));
    sink.Write(MakeEntry("dddddddddddddddddddd"));
    sink.Flush();

    EXPECT_EQ(ReadAll(testDir_ / "debug.log"), "dddddddddddddddddddd\n");
    EXPECT_EQ(ReadAll(testDir_ / "debug.log.1"), "cccccccccccccccccccc\n");
    EXPECT_EQ(ReadAll(testDir_ / "debug.log.2"), "bbbbbbbbbbbbbbbbbbbb\n");
    EXPECT_FALSE(std::filesystem::exists(testDir_ / "debug.log.3"));
}

TEST_F(FileSinkTest, UnwritablePath) {
    FileSink sink((testDir_ / "missing" / "debug.log").string());
    EXPECT_FALSE(sink.IsOpen());
    sink.Write(MakeEntry("lost"));
}

// ============================================================================
// Time Tests
// ============================================================================

class TimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
        SetMockTime(0);
    }
};

TEST_F(TimeTest, GetTime) {
    EXPECT_GT(GetTime(), 1600000000);
}

TEST_F(TimeTest, MockTime) {
    SetMockTime(1700000000);
    EnableMockTime();
    EXPECT_EQ(GetTime(), 1700000000);

    AdvanceMockTime(Seconds{90});
    EXPECT_EQ(GetTime(), 1700000090);

    DisableMockTime();
    EXPECT_NE(GetTime(), 1700000090);
}

TEST_F(TimeTest, MockTimeSeedsFromWallClock) {
    const int64_t before = GetTime();
    EnableMockTime();
    const int64_t frozen = GetTime();
    EXPECT_GE(frozen, before);

    AdvanceMockTime(Seconds{5});
    EXPECT_EQ(GetTime(), frozen + 5);
}

TEST_F(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(int64_t{0}), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(int64_t{1700000000}), "2023-11-14T22:13:20Z");
    EXPECT_EQ(FormatISO8601(int64_t{-86400}), "1969-12-31T00:00:00Z");
}

TEST_F(TimeTest, FormatISO8601OutOfRange) {
    const int64_t huge = std::numeric_limits<int64_t>::max();
    EXPECT_EQ(FormatISO8601(huge), "@" + std::to_string(huge));
    EXPECT_EQ(FormatISO8601(std::numeric_limits<int64_t>::min()),
              "@" + std::to_string(std::numeric_limits<int64_t>::min()));
}

TEST_F(TimeTest, FormatLog) {
    const std::string line = FormatLog(std::chrono::system_clock::now());
    ASSERT_EQ(line.size(), 23u);
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[10], ' ');
    EXPECT_EQ(line[19], '.');
}

TEST_F(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(Seconds{0}), "0s");
    EXPECT_EQ(FormatDuration(Seconds{45}), "45s");
    EXPECT_EQ(FormatDuration(Seconds{3600}), "1h");
    EXPECT_EQ(FormatDuration(Seconds{5025}), "1h 23m 45s");
    EXPECT_EQ(FormatDuration(Seconds{90061}), "1d 1h 1m 1s");
    EXPECT_EQ(FormatDuration(Seconds{-120}), "-2m");
}

} // namespace
} // namespace util
} // namespace valoria
