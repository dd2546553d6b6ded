#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "core/LogEntry.hpp"
#include "core/LogPattern.hpp"
#include "core/Stats.hpp"

namespace AgentLog
{
    namespace Report
    {
        /**
         * ConsoleReporter
         *
         * Responsibilities:
         *  - Human-readable rendering of parsed entries and analyzer results
         *    for the command line front end.
         *
         * Design notes:
         *  - Writes to any std::ostream (std::cout by default) so output can be
         *    captured in tests.
         *  - Agent statistics are printed sorted by name, which makes the
         *    otherwise unordered analyzer output stable.
         */
        class ConsoleReporter
        {
        public:
            explicit ConsoleReporter(std::ostream &output = std::cout);

            ConsoleReporter(const ConsoleReporter &)            = default;
            ConsoleReporter &operator=(const ConsoleReporter &) = default;

            /// "[n] <timestamp> | <kind> | <message>" for the first `limit` entries.
            void printEntries(const std::vector<Core::LogEntry> &entries, std::size_t limit);

            /// Per-kind counts as produced by Analysis::countEntryTypes().
            void printTypeCounts(const std::vector<std::pair<Core::EntryType, std::size_t>> &counts);

            void printTiming(const Core::TimingStats &stats);
            void printAgentStats(const std::vector<Core::AgentStats> &stats);
            void printPatterns(const Core::PatternAnalysis &analysis);

            /// A line of `width` copies of `fill`.
            void printRule(char fill = '=', std::size_t width = 80);

            /// Messages longer than this are cut in entry listings.
            void setMaxMessageWidth(std::size_t width) noexcept { m_maxMessageWidth = width; }

            void flush();

        private:
            std::ostream *m_output;
            std::size_t   m_maxMessageWidth;
        };

        /**
         * Render one analyzer result to a string, in the same layout the
         * reporter prints.
         */
        std::string formatResult(const Core::TimingStats &stats);
        std::string formatResult(const std::vector<Core::AgentStats> &stats);
        std::string formatResult(const Core::PatternAnalysis &analysis);

    } // namespace Report
} // namespace AgentLog
