#include "analysis/TimingAnalyzer.hpp"

#include <algorithm>
#include <cstdint>

#include "utils/TimeUtils.hpp"

namespace AgentLog
{
    namespace Analysis
    {
        Core::TimingStats TimingAnalyzer::analyze(const Core::LogSession &session) const
        {
            Core::TimingStats stats;
            stats.totalDurationSecs     = calculateDuration(session.entries()).value_or(0.0);
            stats.entryCount            = session.size();
            stats.avgTimeBetweenEntries = averageGap(session.entries());
            return stats;
        }

        std::optional<double> TimingAnalyzer::calculateDuration(const std::vector<Core::LogEntry> &entries)
        {
            if (entries.empty())
            {
                return std::nullopt;
            }

            const auto [first, last] = std::minmax_element(
                entries.begin(), entries.end(),
                [](const Core::LogEntry &a, const Core::LogEntry &b) { return a.timestamp() < b.timestamp(); });

            return Utils::secondsBetween(first->timestamp(), last->timestamp());
        }

        double TimingAnalyzer::averageGap(const std::vector<Core::LogEntry> &entries)
        {
            if (entries.size() < 2)
            {
                return 0.0;
            }

            std::int64_t totalMs = 0;
            for (std::size_t i = 1; i < entries.size(); ++i)
            {
                totalMs += Utils::diffMillis(entries[i - 1].timestamp(), entries[i].timestamp());
            }

            const auto gaps = static_cast<double>(entries.size() - 1);
            return (static_cast<double>(totalMs) / 1000.0) / gaps;
        }

    } // namespace Analysis
} // namespace AgentLog
