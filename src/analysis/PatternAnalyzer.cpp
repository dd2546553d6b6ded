#include "analysis/PatternAnalyzer.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_map>
#include <utility>

#include "utils/TimeUtils.hpp"

namespace AgentLog
{
    namespace Analysis
    {
        PatternThresholds PatternThresholds::fromConfig(const Utils::ConfigLoader &config)
        {
            PatternThresholds t;
            t.errorBurstRate     = config.getDoubleOr("error_burst_threshold", t.errorBurstRate);
            t.longGapSecs        = config.getDoubleOr("long_gap_threshold_secs", t.longGapSecs);
            t.agentActivityCount = config.getCountOr("agent_activity_threshold", t.agentActivityCount);
            return t;
        }

        Core::PatternAnalysis PatternAnalyzer::analyze(const Core::LogSession &session) const
        {
            const auto &entries = session.entries();
            Core::PatternAnalysis analysis;

            auto append = [&analysis](std::vector<Core::LogPattern> found) {
                analysis.patterns.insert(analysis.patterns.end(),
                                         std::make_move_iterator(found.begin()),
                                         std::make_move_iterator(found.end()));
            };

            append(detectErrorBursts(entries));
            append(detectLongGaps(entries));
            append(detectAgentActivity(entries));

            if (auto marker = detectNoAgentActivity(entries))
            {
                analysis.patterns.push_back(std::move(*marker));
            }

            return analysis;
        }

        std::vector<Core::LogPattern> PatternAnalyzer::detectErrorBursts(const std::vector<Core::LogEntry> &entries) const
        {
            std::vector<const Core::LogEntry *> errors;
            for (const auto &entry : entries)
            {
                if (entry.isError())
                {
                    errors.push_back(&entry);
                }
            }

            std::vector<Core::LogPattern> patterns;
            if (errors.size() < kBurstWindow)
            {
                return patterns;
            }

            for (std::size_t start = 0; start + kBurstWindow <= errors.size(); ++start)
            {
                const auto &first = errors[start]->timestamp();
                const auto &last  = errors[start + kBurstWindow - 1]->timestamp();
                const double elapsed = Utils::secondsBetween(first, last);

                if (elapsed > 0.0 &&
                    static_cast<double>(kBurstWindow) / elapsed >= m_thresholds.errorBurstRate)
                {
                    patterns.emplace_back(Core::ErrorBurst{kBurstWindow, elapsed});
                }
            }

            return patterns;
        }

        std::vector<Core::LogPattern> PatternAnalyzer::detectLongGaps(const std::vector<Core::LogEntry> &entries) const
        {
            std::vector<Core::LogPattern> patterns;

            for (std::size_t i = 1; i < entries.size(); ++i)
            {
                const double gap = Utils::secondsBetween(entries[i - 1].timestamp(), entries[i].timestamp());
                if (gap > m_thresholds.longGapSecs)
                {
                    patterns.emplace_back(Core::LongGap{gap});
                }
            }

            return patterns;
        }

        std::vector<Core::LogPattern> PatternAnalyzer::detectAgentActivity(const std::vector<Core::LogEntry> &entries) const
        {
            std::unordered_map<std::string, std::size_t> agentCounts;
            for (const auto &entry : entries)
            {
                if (entry.hasAgent())
                {
                    ++agentCounts[*entry.agentName()];
                }
            }

            std::vector<Core::LogPattern> patterns;
            for (const auto &[agent, count] : agentCounts)
            {
                if (count >= m_thresholds.agentActivityCount)
                {
                    patterns.emplace_back(Core::AgentActivity{agent, count});
                }
            }

            return patterns;
        }

        std::optional<Core::LogPattern> PatternAnalyzer::detectNoAgentActivity(const std::vector<Core::LogEntry> &entries) const
        {
            const bool hasAgents = std::any_of(entries.begin(), entries.end(),
                                               [](const Core::LogEntry &e) { return e.hasAgent(); });

            if (!hasAgents && !entries.empty())
            {
                return Core::LogPattern{Core::NoAgentActivity{}};
            }
            return std::nullopt;
        }

    } // namespace Analysis
} // namespace AgentLog
