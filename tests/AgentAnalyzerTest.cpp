#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "TestHelpers.hpp"
#include "analysis/AgentAnalyzer.hpp"

using AgentLog::Analysis::AgentAnalyzer;
using AgentLog::Core::AgentStats;
using AgentLog::Core::EntryType;
using namespace AgentLog::Testing;

namespace
{
    std::vector<AgentStats> sortedByName(std::vector<AgentStats> stats)
    {
        std::sort(stats.begin(), stats.end(),
                  [](const AgentStats &a, const AgentStats &b) { return a.name < b.name; });
        return stats;
    }
}

TEST(AgentAnalyzerTest, AggregatesDurationsPerAgent)
{
    AgentAnalyzer analyzer;
    const auto stats = analyzer.analyze(sessionOf({
        agentEntry(atSeconds(0), "X", 100),
        agentEntry(atSeconds(1), "X", 200),
    }));

    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].name, "X");
    EXPECT_EQ(stats[0].invocationCount, 2u);
    EXPECT_EQ(stats[0].totalDurationMs, 300u);
    EXPECT_DOUBLE_EQ(stats[0].avgDurationMs, 150.0);
}

TEST(AgentAnalyzerTest, EntriesWithoutAgentAreIgnored)
{
    AgentAnalyzer analyzer;
    const auto stats = analyzer.analyze(sessionOf({
        entryAt(atSeconds(0), EntryType::Info),
        entryAt(atSeconds(1), EntryType::AgentInvocation, "agent keyword but no name"),
    }));

    EXPECT_TRUE(stats.empty());
}

TEST(AgentAnalyzerTest, InvocationWithoutDurationOnlyCounts)
{
    AgentAnalyzer analyzer;

    const auto first = analyzer.analyze(sessionOf({
        agentEntry(atSeconds(0), "X", 100),
        agentEntry(atSeconds(1), "X"),
    }));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].invocationCount, 2u);
    EXPECT_EQ(first[0].totalDurationMs, 100u);
    EXPECT_DOUBLE_EQ(first[0].avgDurationMs, 100.0);

    const auto second = analyzer.analyze(sessionOf({
        agentEntry(atSeconds(0), "X", 100),
        agentEntry(atSeconds(1), "X"),
        agentEntry(atSeconds(2), "X", 200),
    }));
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].invocationCount, 3u);
    EXPECT_EQ(second[0].totalDurationMs, 300u);
    EXPECT_DOUBLE_EQ(second[0].avgDurationMs, 100.0);
}

TEST(AgentAnalyzerTest, SeparatesAgents)
{
    AgentAnalyzer analyzer;
    const auto stats = sortedByName(analyzer.analyze(sessionOf({
        agentEntry(atSeconds(0), "builder", 50),
        agentEntry(atSeconds(1), "architect", 10),
        agentEntry(atSeconds(2), "builder", 150),
    })));

    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats[0].name, "architect");
    EXPECT_EQ(stats[0].invocationCount, 1u);
    EXPECT_EQ(stats[1].name, "builder");
    EXPECT_EQ(stats[1].invocationCount, 2u);
    EXPECT_DOUBLE_EQ(stats[1].avgDurationMs, 100.0);
}

TEST(AgentAnalyzerTest, AnalyzeLeavesAccumulatedStateUntouched)
{
    AgentAnalyzer analyzer;
    const auto session = sessionOf({agentEntry(atSeconds(0), "X", 5)});

    const auto a = analyzer.analyze(session);
    const auto b = analyzer.analyze(session);

    EXPECT_EQ(a, b);
    EXPECT_TRUE(analyzer.allStats().empty());
}

TEST(AgentAnalyzerTest, ProcessEntriesAccumulatesAcrossBatches)
{
    AgentAnalyzer analyzer;
    analyzer.processEntries({agentEntry(atSeconds(0), "X", 100)});
    analyzer.processEntries({agentEntry(atSeconds(5), "X", 200), agentEntry(atSeconds(6), "Y")});

    const auto *x = analyzer.agentStats("X");
    ASSERT_NE(x, nullptr);
    EXPECT_EQ(x->invocationCount, 2u);
    EXPECT_DOUBLE_EQ(x->avgDurationMs, 150.0);

    const auto *y = analyzer.agentStats("Y");
    ASSERT_NE(y, nullptr);
    EXPECT_EQ(y->invocationCount, 1u);
    EXPECT_EQ(y->totalDurationMs, 0u);

    EXPECT_EQ(analyzer.agentStats("Z"), nullptr);
    EXPECT_EQ(analyzer.allStats().size(), 2u);

    analyzer.clear();
    EXPECT_EQ(analyzer.agentStats("X"), nullptr);
    EXPECT_TRUE(analyzer.allStats().empty());
}
