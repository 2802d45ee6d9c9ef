/**
 * Unit tests for facility logging configuration
 */
#include <gtest/gtest.h>
#include "Logger.hpp"
#include "test_fixtures.hpp"
#include <sstream>

using namespace wayslope;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::ERROR);
        Logger::setLogFile(std::nullopt);
    }
};

TEST_F(LoggerTest, DefaultLevelAppliesToEveryFacility) {
    Logger::setDefaultLevel(LogLevel::DETAILED);
    Logger logger("SlopePipeline");
    EXPECT_EQ(logger.getEffectiveLevel(), LogLevel::DETAILED);
    EXPECT_TRUE(logger.shouldOutput(LogLevel::INFO));
    EXPECT_FALSE(logger.shouldOutput(LogLevel::DEBUG));
}

TEST_F(LoggerTest, FacilityLevelOverridesDefault) {
    Logger::setDefaultLevel(LogLevel::INFO);
    Logger::setFacilityLevel("ElevationSampler", LogLevel::TRACE);

    Logger sampler("ElevationSampler");
    Logger reader("OsmPbfReader");
    EXPECT_TRUE(sampler.shouldOutput(LogLevel::TRACE));
    EXPECT_FALSE(reader.shouldOutput(LogLevel::DEBUG));
}

TEST_F(LoggerTest, ParsesPlainLevel) {
    EXPECT_TRUE(Logger::parseLogConfig("5"));
    EXPECT_EQ(Logger::getFacilityLevel("anything"), LogLevel::DEBUG);
}

TEST_F(LoggerTest, ParsesMixedFacilityConfig) {
    EXPECT_TRUE(Logger::parseLogConfig("4,ElevationSampler=6,OsmPbfReader=2"));
    EXPECT_EQ(Logger::getFacilityLevel("WaySlopeProcessor"), LogLevel::DETAILED);
    EXPECT_EQ(Logger::getFacilityLevel("ElevationSampler"), LogLevel::TRACE);
    EXPECT_EQ(Logger::getFacilityLevel("OsmPbfReader"), LogLevel::WARNING);
}

TEST_F(LoggerTest, ParsesDefaultKeyword) {
    EXPECT_TRUE(Logger::parseLogConfig("default=2"));
    EXPECT_EQ(Logger::getFacilityLevel("SlopePipeline"), LogLevel::WARNING);
}

TEST_F(LoggerTest, ReportsInvalidTokens) {
    EXPECT_FALSE(Logger::parseLogConfig("loud"));
    EXPECT_FALSE(Logger::parseLogConfig("=3"));
    EXPECT_FALSE(Logger::parseLogConfig("ElevationSampler=high"));
}

TEST_F(LoggerTest, WritesToLogFile) {
    test::TempDir dir;
    std::string path = dir.file("logs/run.log");

    Logger::setDefaultLevel(LogLevel::INFO);
    ASSERT_TRUE(Logger::setLogFile(path));
    {
        Logger logger("WaySlopeProcessor");
        logger.info("first message");
        logger.debug("hidden message");
        logger.flush();
    }
    ASSERT_TRUE(Logger::setLogFile(std::nullopt));

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("first message"), std::string::npos);
    EXPECT_EQ(contents.str().find("hidden message"), std::string::npos);
}

TEST_F(LoggerTest, CollapsesRepeatedMessages) {
    test::TempDir dir;
    std::string path = dir.file("repeat.log");

    Logger::setDefaultLevel(LogLevel::INFO);
    ASSERT_TRUE(Logger::setLogFile(path));
    {
        Logger logger("OsmPbfReader");
        logger.info("same");
        logger.info("same");
        logger.info("same");
        logger.flush();
    }
    ASSERT_TRUE(Logger::setLogFile(std::nullopt));

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("occurred 3 times"), std::string::npos);
}
