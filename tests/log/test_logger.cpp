#include <gtest/gtest.h>

#include "conform/log/logger.hpp"

namespace {

using namespace conform::log;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = getLogLevel(); }
    void TearDown() override { setLogLevel(saved_); }

private:
    LogLevel saved_{LogLevel::WARN};
};

TEST_F(LoggerTest, LevelNames) {
    EXPECT_EQ(logLevelToString(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(logLevelToString(LogLevel::CRITICAL), "CRITICAL");
    EXPECT_EQ(logLevelToString(LogLevel::UNKNOWN), "UNKNOWN");
}

TEST_F(LoggerTest, ParseLevels) {
    EXPECT_EQ(stringToLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(stringToLogLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(stringToLogLevel("ERR"), LogLevel::ERROR);
    EXPECT_EQ(stringToLogLevel("fatal"), LogLevel::CRITICAL);
    EXPECT_EQ(stringToLogLevel("off"), LogLevel::OFF);
    EXPECT_EQ(stringToLogLevel("loud"), LogLevel::UNKNOWN);
    EXPECT_EQ(stringToLogLevel(""), LogLevel::UNKNOWN);
}

TEST_F(LoggerTest, SharedNamedLogger) {
    auto first = getLogger();
    auto second = getLogger();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), std::string(kLoggerName));
    EXPECT_EQ(spdlog::get(std::string(kLoggerName)), first);
}

TEST_F(LoggerTest, SetLevel) {
    setLogLevel(LogLevel::DEBUG);
    EXPECT_EQ(getLogLevel(), LogLevel::DEBUG);
    setLogLevel(LogLevel::UNKNOWN);
    EXPECT_EQ(getLogLevel(), LogLevel::DEBUG);
    setLogLevel(LogLevel::OFF);
    EXPECT_EQ(getLogLevel(), LogLevel::OFF);
}

}  // namespace
