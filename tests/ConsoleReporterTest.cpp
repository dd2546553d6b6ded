#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "TestHelpers.hpp"
#include "core/LogPattern.hpp"
#include "core/Stats.hpp"
#include "report/ConsoleReporter.hpp"

using AgentLog::Core::AgentStats;
using AgentLog::Core::EntryType;
using AgentLog::Core::PatternAnalysis;
using AgentLog::Core::TimingStats;
using AgentLog::Report::ConsoleReporter;
using AgentLog::Report::formatResult;
using namespace AgentLog::Testing;

class ConsoleReporterTest : public ::testing::Test
{
protected:
    std::ostringstream out;
    ConsoleReporter reporter{out};

    bool printed(const std::string &text) const
    {
        return out.str().find(text) != std::string::npos;
    }
};

TEST_F(ConsoleReporterTest, PrintsEntryLinesUpToLimit)
{
    reporter.printEntries({
        entryAt(atSeconds(0), EntryType::Info, "Session started"),
        agentEntry(atSeconds(5), "architect", 250),
        entryAt(atSeconds(9), EntryType::Error, "boom"),
    }, 2);

    EXPECT_TRUE(printed("[1] 2024-01-15 10:00:00 | Info | Session started\n"));
    EXPECT_TRUE(printed("[2] 2024-01-15 10:00:05 | AgentInvocation | invoked architect\n"));
    EXPECT_TRUE(printed("    Agent: architect\n"));
    EXPECT_TRUE(printed("    Duration: 250ms\n"));
    EXPECT_FALSE(printed("boom"));
    EXPECT_TRUE(printed("... and 1 more entries"));
}

TEST_F(ConsoleReporterTest, TruncatesLongMessages)
{
    reporter.setMaxMessageWidth(5);
    reporter.printEntries({entryAt(atSeconds(0), EntryType::Info, "Hello world")}, 10);

    EXPECT_TRUE(printed("| Hello...\n"));
    EXPECT_FALSE(printed("more entries"));
}

TEST_F(ConsoleReporterTest, PrintsTypeCounts)
{
    reporter.printTypeCounts({{EntryType::Error, 4}, {EntryType::Decision, 1}});
    EXPECT_EQ(out.str(), "  Error: 4\n  Decision: 1\n");
}

TEST_F(ConsoleReporterTest, PrintsTiming)
{
    TimingStats stats;
    stats.totalDurationSecs     = 30.0;
    stats.entryCount            = 4;
    stats.avgTimeBetweenEntries = 10.0;

    reporter.printTiming(stats);

    EXPECT_EQ(out.str(),
              "Timing Statistics:\n"
              "  Total duration: 30.00 seconds\n"
              "  Entry count: 4\n"
              "  Avg time between entries: 10.00s\n");
    EXPECT_EQ(formatResult(stats), out.str());
}

TEST_F(ConsoleReporterTest, PrintsAgentStatsSortedByName)
{
    AgentStats beta("beta");
    beta.addDuration(100);
    beta.addDuration(200);
    AgentStats alpha("alpha");
    alpha.addInvocation();

    reporter.printAgentStats({beta, alpha});

    const auto text = out.str();
    ASSERT_TRUE(printed("  alpha\n"));
    ASSERT_TRUE(printed("  beta\n"));
    EXPECT_LT(text.find("alpha"), text.find("beta"));
    EXPECT_TRUE(printed("    Invocations: 2\n    Total duration: 300ms\n    Avg duration: 150.00ms\n"));
}

TEST_F(ConsoleReporterTest, ReportsMissingAgents)
{
    reporter.printAgentStats({});
    EXPECT_TRUE(printed("No agent invocations found"));
}

TEST_F(ConsoleReporterTest, PrintsPatterns)
{
    PatternAnalysis analysis;
    analysis.patterns.push_back(AgentLog::Core::ErrorBurst{3, 0.2});
    analysis.patterns.push_back(AgentLog::Core::NoAgentActivity{});

    reporter.printPatterns(analysis);

    EXPECT_EQ(out.str(),
              "Pattern Detection:\n"
              "  - ErrorBurst: 3 errors in 0.20s\n"
              "  - NoAgentActivity: no agent invocations in session\n");
}

TEST_F(ConsoleReporterTest, ReportsAbsentPatterns)
{
    EXPECT_EQ(formatResult(PatternAnalysis{}), "Pattern Detection:\n  No significant patterns detected\n");
}

TEST_F(ConsoleReporterTest, PrintsRule)
{
    reporter.printRule('-', 4);
    EXPECT_EQ(out.str(), "----\n");
}
