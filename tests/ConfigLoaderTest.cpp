#include <gtest/gtest.h>

#include <sstream>

#include "TestHelpers.hpp"
#include "utils/ConfigLoader.hpp"

using AgentLog::Utils::ConfigLoader;

namespace
{
    ConfigLoader loadText(const std::string &text)
    {
        ConfigLoader config;
        std::istringstream in(text);
        config.loadFromStream(in);
        return config;
    }
}

TEST(ConfigLoaderTest, ParsesKeyValueLinesAndSkipsComments)
{
    const auto config = loadText(
        "# thresholds\n"
        "; alternative comment\n"
        "\n"
        "  error_burst_threshold =  2.5  \n"
        "log_level=DEBUG\n"
        "not a key value line\n"
        "= missing key\n");

    EXPECT_EQ(config.size(), 2u);
    EXPECT_EQ(config.getStringOr("log_level", "INFO"), "DEBUG");
    EXPECT_DOUBLE_EQ(config.getDoubleOr("error_burst_threshold", 0.0), 2.5);
    EXPECT_FALSE(config.hasKey("not a key value line"));
}

TEST(ConfigLoaderTest, LastOccurrenceWins)
{
    const auto config = loadText("logs_dir = a\nlogs_dir = b\n");
    EXPECT_EQ(config.getString("logs_dir"), std::optional<std::string>("b"));
}

TEST(ConfigLoaderTest, TypedGettersRejectInvalidValues)
{
    const auto config = loadText(
        "count = 12\n"
        "negative = -3\n"
        "trailing = 12abc\n"
        "word = many\n"
        "ratio = 0.75\n");

    EXPECT_EQ(config.getInt("count"), std::optional<long long>(12));
    EXPECT_EQ(config.getInt("negative"), std::optional<long long>(-3));
    EXPECT_FALSE(config.getInt("trailing").has_value());
    EXPECT_FALSE(config.getInt("word").has_value());
    EXPECT_FALSE(config.getInt("ratio").has_value());

    EXPECT_EQ(config.getCount("count"), std::optional<std::size_t>(12));
    EXPECT_FALSE(config.getCount("negative").has_value());
    EXPECT_EQ(config.getCountOr("negative", 10u), 10u);

    EXPECT_DOUBLE_EQ(config.getDoubleOr("ratio", 1.0), 0.75);
    EXPECT_DOUBLE_EQ(config.getDoubleOr("word", 1.0), 1.0);
    EXPECT_DOUBLE_EQ(config.getDoubleOr("missing", 4.0), 4.0);
}

TEST(ConfigLoaderTest, LoadFromStreamReplacesPreviousValues)
{
    ConfigLoader config;
    config.set("log_file", "old.log");

    std::istringstream in("log_level = WARN\n");
    config.loadFromStream(in);

    EXPECT_FALSE(config.hasKey("log_file"));
    EXPECT_TRUE(config.hasKey("log_level"));
}

TEST(ConfigLoaderTest, LoadsFromFile)
{
    AgentLog::Testing::TempDir dir;
    const auto file = dir.writeFile("agentlog.conf", "agent_activity_threshold = 4\n");

    ConfigLoader config;
    ASSERT_TRUE(config.loadFromFile(file.string()));
    EXPECT_EQ(config.getCountOr("agent_activity_threshold", 10u), 4u);
}

TEST(ConfigLoaderTest, MissingFileKeepsExistingValues)
{
    AgentLog::Testing::TempDir dir;

    ConfigLoader config;
    config.set("log_level", "ERROR");

    EXPECT_FALSE(config.loadFromFile((dir.path() / "absent.conf").string()));
    EXPECT_EQ(config.getStringOr("log_level", "INFO"), "ERROR");
}
