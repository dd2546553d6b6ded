#include <gtest/gtest.h>

#include "utils/StringUtils.hpp"

using namespace AgentLog::Utils;

TEST(StringUtilsTest, TrimsBothEnds)
{
    EXPECT_EQ(trim("  hello \t"), "hello");
    EXPECT_EQ(ltrim("  hello "), "hello ");
    EXPECT_EQ(rtrim("  hello "), "  hello");
    EXPECT_EQ(trim("   "), "");
}

TEST(StringUtilsTest, CaseConversion)
{
    EXPECT_EQ(toUpper("Warning"), "WARNING");
    EXPECT_EQ(toLower("ERROR"), "error");
}

TEST(StringUtilsTest, BlankDetection)
{
    EXPECT_TRUE(isBlank(""));
    EXPECT_TRUE(isBlank(" \t\r"));
    EXPECT_FALSE(isBlank(" x "));
}

TEST(StringUtilsTest, ContainsIgnoreCase)
{
    EXPECT_TRUE(containsIgnoreCase("Connection TIMEOUT reached", "timeout"));
    EXPECT_TRUE(containsIgnoreCase("anything", ""));
    EXPECT_FALSE(containsIgnoreCase("short", "longer needle"));
    EXPECT_FALSE(containsIgnoreCase("abc", "abd"));
}

TEST(StringUtilsTest, TruncateAppendsEllipsis)
{
    EXPECT_EQ(AgentLog::Utils::truncate("Hello world", 5), "Hello...");
    EXPECT_EQ(AgentLog::Utils::truncate("Hello", 5), "Hello");
    EXPECT_EQ(AgentLog::Utils::truncate("", 3), "");
}
