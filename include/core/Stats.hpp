// File: include/core/Stats.hpp
//
// Aggregates produced by the timing and agent analyzers.

#ifndef AGENTLOG_CORE_STATS_HPP
#define AGENTLOG_CORE_STATS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace AgentLog
{
namespace Core
{

/**
 * @brief Per-agent invocation accumulator.
 *
 * Lives for one analysis pass. The average is recomputed as total/count
 * whenever a duration is folded in; invocations without a duration only
 * bump the count, so they are not reflected in the average until the
 * next addDuration() call.
 */
struct AgentStats
{
    std::string   name;
    std::uint64_t invocationCount = 0;
    std::uint64_t totalDurationMs = 0;
    double        avgDurationMs   = 0.0;

    explicit AgentStats(std::string agentName)
        : name(std::move(agentName))
    {
    }

    /// Count one invocation that took durationMs milliseconds.
    void addDuration(std::uint64_t durationMs) noexcept
    {
        ++invocationCount;
        totalDurationMs += durationMs;
        avgDurationMs = static_cast<double>(totalDurationMs) /
                        static_cast<double>(invocationCount);
    }

    /// Count one invocation with no known duration.
    void addInvocation() noexcept
    {
        ++invocationCount;
    }

    bool operator==(const AgentStats& other) const noexcept
    {
        return name == other.name &&
               invocationCount == other.invocationCount &&
               totalDurationMs == other.totalDurationMs &&
               avgDurationMs == other.avgDurationMs;
    }
};

/**
 * @brief Session timing summary.
 *
 * totalDurationSecs spans the earliest to the latest timestamp;
 * avgTimeBetweenEntries averages the gaps of adjacent entries in
 * sequence order.
 */
struct TimingStats
{
    double      totalDurationSecs     = 0.0;
    std::size_t entryCount            = 0;
    double      avgTimeBetweenEntries = 0.0;

    bool operator==(const TimingStats& other) const noexcept
    {
        return totalDurationSecs == other.totalDurationSecs &&
               entryCount == other.entryCount &&
               avgTimeBetweenEntries == other.avgTimeBetweenEntries;
    }
};

} // namespace Core
} // namespace AgentLog

#endif // AGENTLOG_CORE_STATS_HPP
