#include "logging/logger.hpp"

#include <gtest/gtest.h>

using namespace spaserve::logging;

class LoggerTest : public ::testing::Test {
protected:
    Level saved = Level::LVL_INFO;

    void SetUp() override { saved = Logger::level(); }
    void TearDown() override { Logger::set_level(saved); }
};

TEST_F(LoggerTest, ParseLevelAcceptsAnyCase) {
    EXPECT_EQ(parse_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(parse_level("INFO"), Level::LVL_INFO);
    EXPECT_EQ(parse_level("Warn"), Level::LVL_WARN);
    EXPECT_EQ(parse_level("error"), Level::LVL_ERROR);
    EXPECT_EQ(parse_level("none"), Level::LVL_NONE);
}

TEST_F(LoggerTest, ParseLevelRejectsUnknown) {
    EXPECT_FALSE(parse_level("verbose").has_value());
    EXPECT_FALSE(parse_level("").has_value());
}

TEST_F(LoggerTest, LevelNamesRoundTrip) {
    for (Level level : {Level::LVL_DEBUG, Level::LVL_INFO, Level::LVL_WARN, Level::LVL_ERROR, Level::LVL_NONE}) {
        EXPECT_EQ(parse_level(level_to_string(level)), level);
    }
}

TEST_F(LoggerTest, ThresholdFiltersLowerLevels) {
    Logger::set_level(Level::LVL_WARN);
    EXPECT_FALSE(Logger::enabled(Level::LVL_DEBUG));
    EXPECT_FALSE(Logger::enabled(Level::LVL_INFO));
    EXPECT_TRUE(Logger::enabled(Level::LVL_WARN));
    EXPECT_TRUE(Logger::enabled(Level::LVL_ERROR));
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::set_level(Level::LVL_NONE);
    EXPECT_FALSE(Logger::enabled(Level::LVL_ERROR));
}

TEST_F(LoggerTest, DisabledMessageIsNotBuilt) {
    Logger::set_level(Level::LVL_ERROR);
    int evaluations = 0;
    auto count = [&evaluations]() { return ++evaluations; };

    LOG_DEBUG("value " << count());
    EXPECT_EQ(evaluations, 0);

    Logger::set_level(Level::LVL_DEBUG);
    testing::internal::CaptureStderr();
    LOG_DEBUG("value " << count());
    const std::string output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(evaluations, 1);
    EXPECT_NE(output.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(output.find("value 1"), std::string::npos);
}
