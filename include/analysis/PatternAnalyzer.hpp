#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "analysis/Analyzer.hpp"
#include "core/LogEntry.hpp"
#include "core/LogPattern.hpp"
#include "utils/ConfigLoader.hpp"

namespace AgentLog
{
    namespace Analysis
    {
        /**
         * Detection thresholds of the PatternAnalyzer.
         *
         * Configuration keys (see fromConfig):
         *   error_burst_threshold     errors per second (default 5.0)
         *   long_gap_threshold_secs   seconds (default 300.0)
         *   agent_activity_threshold  invocations (default 10)
         */
        struct PatternThresholds
        {
            double      errorBurstRate     = 5.0;
            double      longGapSecs        = 300.0;
            std::size_t agentActivityCount = 10;

            /// Defaults overridden by whichever keys are present and valid.
            static PatternThresholds fromConfig(const Utils::ConfigLoader &config);
        };

        /**
         * PatternAnalyzer
         *
         * Responsibilities:
         *  - Error bursts: slide a window of 3 over the error entries (in
         *    sequence order, other entries filtered out). A window whose first
         *    and last entries are elapsed > 0 seconds apart and whose rate
         *    3 / elapsed reaches the threshold reports one ErrorBurst.
         *    Overlapping windows report separately; nothing is merged.
         *  - Long gaps: every adjacent pair further apart than the threshold.
         *  - Agent activity: every agent invoked at least the threshold count
         *    (order among agents unspecified).
         *  - No agent activity: one marker for a non-empty session where no
         *    entry names an agent.
         *
         * Results are concatenated in that order.
         */
        class PatternAnalyzer : public Analyzer<Core::PatternAnalysis>
        {
        public:
            /// Number of error entries in one burst window.
            static constexpr std::size_t kBurstWindow = 3;

            PatternAnalyzer() = default;

            explicit PatternAnalyzer(PatternThresholds thresholds)
                : m_thresholds(thresholds)
            {
            }

            Core::PatternAnalysis analyze(const Core::LogSession &session) const override;

            std::string name() const override { return "PatternAnalyzer"; }

            const PatternThresholds &thresholds() const noexcept { return m_thresholds; }

        private:
            std::vector<Core::LogPattern> detectErrorBursts(const std::vector<Core::LogEntry> &entries) const;
            std::vector<Core::LogPattern> detectLongGaps(const std::vector<Core::LogEntry> &entries) const;
            std::vector<Core::LogPattern> detectAgentActivity(const std::vector<Core::LogEntry> &entries) const;
            std::optional<Core::LogPattern> detectNoAgentActivity(const std::vector<Core::LogEntry> &entries) const;

        private:
            PatternThresholds m_thresholds;
        };

    } // namespace Analysis
} // namespace AgentLog
