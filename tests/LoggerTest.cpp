#include <gtest/gtest.h>

#include <fstream>
#include <regex>
#include <sstream>
#include <string>

#include "TestHelpers.hpp"
#include "utils/Logger.hpp"

using AgentLog::Utils::Logger;
using AgentLog::Utils::LogLevel;
using AgentLog::Utils::parseLogLevel;

TEST(LoggerTest, WritesTimestampLevelAndMessage)
{
    std::ostringstream out;
    Logger logger(out);

    logger.info("Parsed 3 entries");

    const std::regex line(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] \[INFO\] Parsed 3 entries\n$)");
    EXPECT_TRUE(std::regex_match(out.str(), line)) << out.str();
}

TEST(LoggerTest, FiltersBelowMinimumLevel)
{
    std::ostringstream out;
    Logger logger(out, LogLevel::WARN);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("also shown");

    const auto text = out.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[WARN] shown"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] also shown"), std::string::npos);
}

TEST(LoggerTest, LevelCanBeChanged)
{
    std::ostringstream out;
    Logger logger(out);

    EXPECT_FALSE(logger.isEnabled(LogLevel::DEBUG));
    logger.setLevel(LogLevel::TRACE);
    EXPECT_EQ(logger.level(), LogLevel::TRACE);

    logger.trace("detail");
    EXPECT_NE(out.str().find("[TRACE] detail"), std::string::npos);
}

TEST(LoggerTest, NullConsoleDisablesConsoleOutput)
{
    std::ostringstream out;
    Logger logger(out);
    logger.setConsole(nullptr);

    logger.critical("nobody listens");
    EXPECT_TRUE(out.str().empty());
}

TEST(LoggerTest, AppendsToLogFile)
{
    AgentLog::Testing::TempDir dir;
    const auto path = (dir.path() / "agentlog.log").string();

    {
        std::ostringstream out;
        Logger logger(out);
        ASSERT_TRUE(logger.openFile(path));
        logger.info("first");
    }
    {
        std::ostringstream out;
        Logger logger(out);
        ASSERT_TRUE(logger.openFile(path));
        logger.info("second");
    }

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    const auto text = content.str();

    const auto first = text.find("[INFO] first");
    const auto second = text.find("[INFO] second");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
}

TEST(LoggerTest, OpenFileFailsForMissingDirectory)
{
    AgentLog::Testing::TempDir dir;
    std::ostringstream out;
    Logger logger(out);

    EXPECT_FALSE(logger.openFile((dir.path() / "no" / "such" / "dir.log").string()));
}

TEST(LoggerTest, ParsesLevelNames)
{
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel(" Info "), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("CRITICAL"), LogLevel::CRITICAL);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(LoggerTest, LevelNames)
{
    EXPECT_STREQ(Logger::toString(LogLevel::WARN), "WARN");
    EXPECT_STREQ(Logger::toString(LogLevel::CRITICAL), "CRITICAL");
}
