#pragma once

#include <string>

#include "core/LogSession.hpp"

namespace AgentLog
{
    namespace Analysis
    {
        /**
         * Analyzer
         *
         * Common contract of the session analyzers:
         *  - analyze() reads an immutable, borrowed session and returns a fresh
         *    result; it never modifies the session or any shared state, so
         *    repeated calls on the same session give identical results.
         *  - name() identifies the analyzer in composite runs and reports.
         *
         * Analyzers do not fail on missing data: an empty session yields
         * zeroed or empty results.
         */
        template <typename Output>
        class Analyzer
        {
        public:
            using OutputType = Output;

            virtual ~Analyzer() = default;

            virtual Output analyze(const Core::LogSession &session) const = 0;

            virtual std::string name() const = 0;
        };

    } // namespace Analysis
} // namespace AgentLog
