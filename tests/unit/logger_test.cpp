#include "logging/logger.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace hubsync::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::stringstream captured;
    Level saved_level = Level::LVL_INFO;

    void SetUp() override {
        saved_level = Logger::level();
        Logger::set_output(&captured);
    }

    void TearDown() override {
        Logger::set_output(nullptr);
        Logger::set_level(saved_level);
    }
};

TEST_F(LoggerTest, WritesLevelTagAndMessage) {
    Logger::set_level(Level::LVL_DEBUG);
    LOG_INFO("[Test] hello " << 42);

    const std::string line = captured.str();
    EXPECT_NE(line.find("[INFO]"), std::string::npos);
    EXPECT_NE(line.find("[Test] hello 42"), std::string::npos);
    EXPECT_EQ(line.back(), '\n');
}

TEST_F(LoggerTest, BelowThresholdIsSuppressed) {
    Logger::set_level(Level::LVL_WARN);
    LOG_DEBUG("debug line");
    LOG_INFO("info line");
    LOG_WARN("warn line");
    LOG_ERROR("error line");

    const std::string out = captured.str();
    EXPECT_EQ(out.find("debug line"), std::string::npos);
    EXPECT_EQ(out.find("info line"), std::string::npos);
    EXPECT_NE(out.find("[WARN]  warn line"), std::string::npos);
    EXPECT_NE(out.find("[ERROR] error line"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::set_level(Level::LVL_NONE);
    LOG_ERROR("should not appear");
    EXPECT_TRUE(captured.str().empty());
}

TEST(LogLevelTest, StringConversions) {
    EXPECT_EQ(string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(string_to_level("WARN"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("Error"), Level::LVL_ERROR);
    EXPECT_EQ(string_to_level("bogus"), Level::LVL_INFO);

    EXPECT_STREQ(level_to_string(Level::LVL_INFO), "info");
    EXPECT_STREQ(level_to_string(Level::LVL_NONE), "none");
}
