#include <memguard/core/logger.hpp>
#include <gtest/gtest.h>

using namespace memguard;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::instance().set_level(LogLevel::INFO);
    }
};

} // namespace

TEST_F(LoggerTest, WritesFormattedLineToStderr) {
    Logger::instance().set_level(LogLevel::INFO);
    ::testing::internal::CaptureStderr();
    LOG_WARN("denied %s %d", "store", 7);
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(std::string::npos, out.find("[WARN] denied store 7\n"));
}

TEST_F(LoggerTest, DropsLinesBelowLevel) {
    Logger::instance().set_level(LogLevel::ERROR);
    ::testing::internal::CaptureStderr();
    LOG_INFO("quiet");
    LOG_WARN("quiet");
    LOG_ERROR("loud");
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(std::string::npos, out.find("quiet"));
    EXPECT_NE(std::string::npos, out.find("[ERROR] loud"));
}

TEST_F(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("Debug", level));
    EXPECT_EQ(LogLevel::DEBUG, level);
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(LogLevel::DEBUG, level);
}
