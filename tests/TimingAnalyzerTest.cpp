#include <gtest/gtest.h>

#include "TestHelpers.hpp"
#include "analysis/TimingAnalyzer.hpp"

using AgentLog::Analysis::TimingAnalyzer;
using namespace AgentLog::Testing;

TEST(TimingAnalyzerTest, EmptySessionIsZeroed)
{
    TimingAnalyzer analyzer;
    const auto stats = analyzer.analyze(sessionOf({}));

    EXPECT_DOUBLE_EQ(stats.totalDurationSecs, 0.0);
    EXPECT_EQ(stats.entryCount, 0u);
    EXPECT_DOUBLE_EQ(stats.avgTimeBetweenEntries, 0.0);
}

TEST(TimingAnalyzerTest, SingleEntryHasNoDurationOrGap)
{
    TimingAnalyzer analyzer;
    const auto stats = analyzer.analyze(sessionOf({entryAt(atSeconds(0))}));

    EXPECT_DOUBLE_EQ(stats.totalDurationSecs, 0.0);
    EXPECT_EQ(stats.entryCount, 1u);
    EXPECT_DOUBLE_EQ(stats.avgTimeBetweenEntries, 0.0);
}

TEST(TimingAnalyzerTest, EvenlySpacedEntries)
{
    TimingAnalyzer analyzer;
    const auto stats = analyzer.analyze(sessionOf({
        entryAt(atSeconds(0)),
        entryAt(atSeconds(10)),
        entryAt(atSeconds(20)),
        entryAt(atSeconds(30)),
    }));

    EXPECT_DOUBLE_EQ(stats.totalDurationSecs, 30.0);
    EXPECT_EQ(stats.entryCount, 4u);
    EXPECT_DOUBLE_EQ(stats.avgTimeBetweenEntries, 10.0);
}

TEST(TimingAnalyzerTest, MillisecondResolution)
{
    TimingAnalyzer analyzer;
    const auto stats = analyzer.analyze(sessionOf({entryAt(atMillis(0)), entryAt(atMillis(1500))}));

    EXPECT_DOUBLE_EQ(stats.totalDurationSecs, 1.5);
    EXPECT_DOUBLE_EQ(stats.avgTimeBetweenEntries, 1.5);
}

TEST(TimingAnalyzerTest, OutOfOrderEntries)
{
    // Duration spans min..max; gaps are taken in sequence order.
    TimingAnalyzer analyzer;
    const auto stats = analyzer.analyze(sessionOf({
        entryAt(atSeconds(10)),
        entryAt(atSeconds(0)),
        entryAt(atSeconds(20)),
    }));

    EXPECT_DOUBLE_EQ(stats.totalDurationSecs, 20.0);
    EXPECT_DOUBLE_EQ(stats.avgTimeBetweenEntries, 5.0);
}

TEST(TimingAnalyzerTest, RepeatedRunsAgree)
{
    TimingAnalyzer analyzer;
    const auto session = sessionOf({entryAt(atSeconds(0)), entryAt(atSeconds(7))});

    EXPECT_EQ(analyzer.analyze(session), analyzer.analyze(session));
    EXPECT_EQ(analyzer.name(), "TimingAnalyzer");
}
