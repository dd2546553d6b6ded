#pragma once

#include <optional>
#include <vector>

#include "analysis/Analyzer.hpp"
#include "core/LogEntry.hpp"
#include "core/Stats.hpp"

namespace AgentLog
{
    namespace Analysis
    {
        /**
         * TimingAnalyzer
         *
         * Computes session duration (latest minus earliest timestamp) and the
         * average gap between adjacent entries. Gaps are taken in sequence
         * order; entries are not sorted by time first, so out-of-order input
         * shows up in the average (and can make it negative).
         */
        class TimingAnalyzer : public Analyzer<Core::TimingStats>
        {
        public:
            TimingAnalyzer() = default;

            Core::TimingStats analyze(const Core::LogSession &session) const override;

            std::string name() const override { return "TimingAnalyzer"; }

        private:
            /// Seconds from min to max timestamp; std::nullopt for no entries.
            static std::optional<double> calculateDuration(const std::vector<Core::LogEntry> &entries);

            static double averageGap(const std::vector<Core::LogEntry> &entries);
        };

    } // namespace Analysis
} // namespace AgentLog
