#include "analysis/AgentAnalyzer.hpp"

#include <utility>

namespace AgentLog
{
    namespace Analysis
    {
        void AgentAnalyzer::accumulate(AgentMap &agents, const std::vector<Core::LogEntry> &entries)
        {
            for (const auto &entry : entries)
            {
                if (!entry.hasAgent())
                {
                    continue;
                }

                const std::string &agentName = *entry.agentName();
                auto it = agents.find(agentName);
                if (it == agents.end())
                {
                    it = agents.emplace(agentName, Core::AgentStats(agentName)).first;
                }

                if (const auto &duration = entry.durationMs())
                {
                    it->second.addDuration(*duration);
                }
                else
                {
                    it->second.addInvocation();
                }
            }
        }

        std::vector<Core::AgentStats> AgentAnalyzer::analyze(const Core::LogSession &session) const
        {
            AgentMap agents;
            accumulate(agents, session.entries());

            std::vector<Core::AgentStats> out;
            out.reserve(agents.size());
            for (auto &kv : agents)
            {
                out.push_back(std::move(kv.second));
            }
            return out;
        }

        void AgentAnalyzer::processEntries(const std::vector<Core::LogEntry> &entries)
        {
            accumulate(m_agents, entries);
        }

        const Core::AgentStats *AgentAnalyzer::agentStats(std::string_view agentName) const
        {
            auto it = m_agents.find(std::string(agentName));
            return it == m_agents.end() ? nullptr : &it->second;
        }

        std::vector<Core::AgentStats> AgentAnalyzer::allStats() const
        {
            std::vector<Core::AgentStats> out;
            out.reserve(m_agents.size());
            for (const auto &kv : m_agents)
            {
                out.push_back(kv.second);
            }
            return out;
        }

        void AgentAnalyzer::clear() noexcept
        {
            m_agents.clear();
        }

    } // namespace Analysis
} // namespace AgentLog
