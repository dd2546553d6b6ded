#pragma once

#include <string>
#include <utility>

#include "analysis/Analyzer.hpp"
#include "report/ConsoleReporter.hpp"

namespace AgentLog
{
    namespace Report
    {
        /**
         * SummaryAnalyzer
         *
         * Adapts an analyzer with a typed result into an Analyzer<std::string>
         * whose output is the console rendering of that result. This lets
         * analyzers with different result types share one
         * Analysis::CompositeAnalyzer<std::string>.
         *
         * Inner must derive from Analysis::Analyzer<T> for a T that
         * formatResult() knows how to render.
         */
        template <typename Inner>
        class SummaryAnalyzer : public Analysis::Analyzer<std::string>
        {
        public:
            SummaryAnalyzer() = default;

            explicit SummaryAnalyzer(Inner inner)
                : m_inner(std::move(inner))
            {
            }

            std::string analyze(const Core::LogSession &session) const override
            {
                return formatResult(m_inner.analyze(session));
            }

            std::string name() const override
            {
                return m_inner.name();
            }

            const Inner &inner() const noexcept { return m_inner; }

        private:
            Inner m_inner;
        };

    } // namespace Report
} // namespace AgentLog
