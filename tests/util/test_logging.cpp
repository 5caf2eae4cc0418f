// STAKELEDGER - Logging Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "stakeledger/util/logging.h"

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

namespace stakeledger {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::Instance();
        savedLevel_ = logger.GetLevel();
        logger.ClearSinks();
        logger.SetLevel(LogLevel::Trace);
        logger.EnableAllCategories();
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); });
        logger.AddSink(sink_);
    }

    void TearDown() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(savedLevel_);
    }

    std::vector<LogEntry> entries_;
    std::shared_ptr<CallbackSink> sink_;
    LogLevel savedLevel_{LogLevel::Info};
};

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, RoundTripNames) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("Debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("nonsense"), LogLevel::Info);
}

TEST_F(LoggingTest, MacroDeliversMessageAndCategory) {
    LOG_INFO(LogCategory::LEDGER) << "registered " << 42;
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, "ledger");
    EXPECT_EQ(entries_[0].message, "registered 42");
    EXPECT_EQ(GetBasename(entries_[0].file), "test_logging.cpp");
}

TEST_F(LoggingTest, LevelFilterSkipsFormatting) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    int evaluated = 0;
    auto count = [&evaluated]() { return ++evaluated; };

    LOG_DEBUG(LogCategory::LEDGER) << count();
    LOG_WARN(LogCategory::LEDGER) << count();

    EXPECT_EQ(evaluated, 1);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warn);
}

TEST_F(LoggingTest, CategoryFilter) {
    Logger::Instance().EnableCategory(LogCategory::STORE);
    LOG_INFO(LogCategory::LEDGER) << "hidden";
    LOG_INFO(LogCategory::STORE) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::STORE));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::DB));
}

TEST_F(LoggingTest, SinkLevel) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::DB) << "below sink level";
    LOG_ERROR(LogCategory::DB) << "at sink level";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "at sink level");
}

TEST_F(LoggingTest, RemoveSink) {
    Logger::Instance().RemoveSink(sink_);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
    LOG_ERROR(LogCategory::DB) << "nobody listens";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, FileSinkAppendsFormattedLines) {
    std::string path = ::testing::TempDir() + "stakeledger_logging_test.log";
    std::remove(path.c_str());
    {
        auto file = std::make_shared<FileSink>(path, LogLevel::Info);
        ASSERT_TRUE(file->IsOpen());
        Logger::Instance().AddSink(file);
        LOG_INFO(LogCategory::STORE) << "saved";
        LOG_DEBUG(LogCategory::STORE) << "not written";
        Logger::Instance().RemoveSink(file);
    }

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    std::string text = content.str();
    EXPECT_NE(text.find("[INFO] [store] "), std::string::npos);
    EXPECT_NE(text.find("saved"), std::string::npos);
    EXPECT_EQ(text.find("not written"), std::string::npos);
    std::remove(path.c_str());
}

TEST(LogFormatTest, Basename) {
    EXPECT_EQ(GetBasename("/a/b/c.cpp"), "c.cpp");
    EXPECT_EQ(GetBasename("c.cpp"), "c.cpp");
}

} // namespace test
} // namespace util
} // namespace stakeledger
