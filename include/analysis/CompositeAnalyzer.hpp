#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "analysis/Analyzer.hpp"
#include "core/ParseError.hpp"

namespace AgentLog
{
    namespace Analysis
    {
        /**
         * CompositeAnalyzer
         *
         * Fan-out runner over analyzers that share one output type. runAll()
         * invokes each analyzer on the same session, in insertion order, and
         * records its name with either the result or the Core::ParseError it
         * raised. One analyzer failing does not stop the others.
         */
        template <typename Output>
        class CompositeAnalyzer
        {
        public:
            struct RunResult
            {
                std::string                     name;
                std::optional<Output>           result;
                std::optional<Core::ParseError> error;

                bool ok() const noexcept { return result.has_value(); }
            };

            CompositeAnalyzer() = default;

            CompositeAnalyzer(const CompositeAnalyzer &)            = delete;
            CompositeAnalyzer &operator=(const CompositeAnalyzer &) = delete;
            CompositeAnalyzer(CompositeAnalyzer &&)                 = default;
            CompositeAnalyzer &operator=(CompositeAnalyzer &&)      = default;

            void addAnalyzer(std::unique_ptr<Analyzer<Output>> analyzer)
            {
                if (analyzer)
                {
                    m_analyzers.push_back(std::move(analyzer));
                }
            }

            /// Construct an analyzer of type A in place.
            template <typename A, typename... Args>
            A &emplace(Args &&...args)
            {
                auto analyzer = std::make_unique<A>(std::forward<Args>(args)...);
                A &ref = *analyzer;
                m_analyzers.push_back(std::move(analyzer));
                return ref;
            }

            std::size_t size() const noexcept { return m_analyzers.size(); }

            bool empty() const noexcept { return m_analyzers.empty(); }

            std::vector<RunResult> runAll(const Core::LogSession &session) const
            {
                std::vector<RunResult> results;
                results.reserve(m_analyzers.size());

                for (const auto &analyzer : m_analyzers)
                {
                    RunResult run;
                    run.name = analyzer->name();
                    try
                    {
                        run.result = analyzer->analyze(session);
                    }
                    catch (const Core::ParseError &e)
                    {
                        run.error = e;
                    }
                    results.push_back(std::move(run));
                }

                return results;
            }

        private:
            std::vector<std::unique_ptr<Analyzer<Output>>> m_analyzers;
        };

    } // namespace Analysis
} // namespace AgentLog
