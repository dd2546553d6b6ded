#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "analysis/Analyzer.hpp"
#include "core/LogEntry.hpp"
#include "core/Stats.hpp"

namespace AgentLog
{
    namespace Analysis
    {
        /**
         * AgentAnalyzer
         *
         * Responsibilities:
         *  - One Core::AgentStats per distinct agent name in a session.
         *  - Entries with a duration go through AgentStats::addDuration();
         *    entries without one only count as an invocation.
         *
         * Design notes:
         *  - Results come from an unordered map, so their order is unspecified;
         *    sort by name when a stable order is needed.
         *  - analyze() uses a private accumulator and leaves this object
         *    untouched. processEntries()/agentStats()/clear() offer the same
         *    aggregation incrementally across several entry batches.
         */
        class AgentAnalyzer : public Analyzer<std::vector<Core::AgentStats>>
        {
        public:
            AgentAnalyzer() = default;

            std::vector<Core::AgentStats> analyze(const Core::LogSession &session) const override;

            std::string name() const override { return "AgentAnalyzer"; }

            /// Fold entries into the accumulated per-agent statistics.
            void processEntries(const std::vector<Core::LogEntry> &entries);

            /// Accumulated statistics for one agent, or nullptr if never seen.
            const Core::AgentStats *agentStats(std::string_view agentName) const;

            /// Snapshot of all accumulated statistics (unspecified order).
            std::vector<Core::AgentStats> allStats() const;

            void clear() noexcept;

        private:
            using AgentMap = std::unordered_map<std::string, Core::AgentStats>;

            static void accumulate(AgentMap &agents, const std::vector<Core::LogEntry> &entries);

        private:
            AgentMap m_agents;
        };

    } // namespace Analysis
} // namespace AgentLog
