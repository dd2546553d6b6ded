// File: include/core/LogPattern.hpp
//
// Behavioral patterns reported by the pattern analyzer.

#ifndef AGENTLOG_CORE_LOG_PATTERN_HPP
#define AGENTLOG_CORE_LOG_PATTERN_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace AgentLog
{
namespace Core
{

/// `count` error entries within `durationSecs` seconds.
struct ErrorBurst
{
    std::size_t count = 0;
    double durationSecs = 0.0;

    bool operator==(const ErrorBurst& o) const noexcept
    {
        return count == o.count && durationSecs == o.durationSecs;
    }
};

/// Silence of `durationSecs` seconds between two adjacent entries.
struct LongGap
{
    double durationSecs = 0.0;

    bool operator==(const LongGap& o) const noexcept
    {
        return durationSecs == o.durationSecs;
    }
};

/// Agent invoked at least the configured number of times.
struct AgentActivity
{
    std::string agent;
    std::size_t count = 0;

    bool operator==(const AgentActivity& o) const noexcept
    {
        return agent == o.agent && count == o.count;
    }
};

/// Non-empty session in which no entry names an agent.
struct NoAgentActivity
{
    bool operator==(const NoAgentActivity&) const noexcept
    {
        return true;
    }
};

using LogPattern = std::variant<ErrorBurst, LongGap, AgentActivity, NoAgentActivity>;

/**
 * @brief Ordered pattern list: error bursts, long gaps, agent activity,
 *        then at most one NoAgentActivity marker.
 */
struct PatternAnalysis
{
    std::vector<LogPattern> patterns;

    bool empty() const noexcept { return patterns.empty(); }

    /// Number of patterns of alternative T.
    template <typename T>
    std::size_t count() const
    {
        return static_cast<std::size_t>(
            std::count_if(patterns.begin(), patterns.end(),
                          [](const LogPattern& p) { return std::holds_alternative<T>(p); }));
    }

    bool operator==(const PatternAnalysis& o) const
    {
        return patterns == o.patterns;
    }
};

/// One-line human readable description, e.g. "ErrorBurst: 3 errors in 0.20s".
std::string describe(const LogPattern& pattern);

} // namespace Core
} // namespace AgentLog

#endif // AGENTLOG_CORE_LOG_PATTERN_HPP
