#include "report/ConsoleReporter.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace AgentLog
{
namespace Report
{
    namespace
    {
        std::string fixed2(double value)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(2) << value;
            return oss.str();
        }

        constexpr std::size_t kDefaultMessageWidth = 60;
    } // namespace

    ConsoleReporter::ConsoleReporter(std::ostream &output)
        : m_output(&output),
          m_maxMessageWidth(kDefaultMessageWidth)
    {
    }

    void ConsoleReporter::printEntries(const std::vector<Core::LogEntry> &entries, std::size_t limit)
    {
        const std::size_t shown = std::min(limit, entries.size());

        for (std::size_t i = 0; i < shown; ++i)
        {
            const auto &entry = entries[i];
            *m_output << '[' << (i + 1) << "] "
                      << Utils::formatTimestamp(entry.timestamp()) << " | "
                      << Core::toString(entry.type()) << " | "
                      << Utils::truncate(entry.message(), m_maxMessageWidth) << "\n";

            if (entry.agentName())
                *m_output << "    Agent: " << *entry.agentName() << "\n";
            if (entry.durationMs())
                *m_output << "    Duration: " << *entry.durationMs() << "ms\n";
        }

        if (entries.size() > shown)
            *m_output << "\n... and " << (entries.size() - shown) << " more entries\n";
    }

    void ConsoleReporter::printTypeCounts(const std::vector<std::pair<Core::EntryType, std::size_t>> &counts)
    {
        for (const auto &[type, count] : counts)
            *m_output << "  " << Core::toString(type) << ": " << count << "\n";
    }

    void ConsoleReporter::printTiming(const Core::TimingStats &stats)
    {
        *m_output << "Timing Statistics:\n"
                  << "  Total duration: " << fixed2(stats.totalDurationSecs) << " seconds\n"
                  << "  Entry count: " << stats.entryCount << "\n"
                  << "  Avg time between entries: " << fixed2(stats.avgTimeBetweenEntries) << "s\n";
    }

    void ConsoleReporter::printAgentStats(const std::vector<Core::AgentStats> &stats)
    {
        *m_output << "Agent Statistics:\n";
        if (stats.empty())
        {
            *m_output << "  No agent invocations found\n";
            return;
        }

        std::vector<const Core::AgentStats *> sorted;
        sorted.reserve(stats.size());
        for (const auto &s : stats)
            sorted.push_back(&s);

        std::sort(sorted.begin(), sorted.end(),
                  [](const Core::AgentStats *a, const Core::AgentStats *b) { return a->name < b->name; });

        for (const auto *s : sorted)
        {
            *m_output << "  " << s->name << "\n"
                      << "    Invocations: " << s->invocationCount << "\n"
                      << "    Total duration: " << s->totalDurationMs << "ms\n"
                      << "    Avg duration: " << fixed2(s->avgDurationMs) << "ms\n";
        }
    }

    void ConsoleReporter::printPatterns(const Core::PatternAnalysis &analysis)
    {
        *m_output << "Pattern Detection:\n";
        if (analysis.empty())
        {
            *m_output << "  No significant patterns detected\n";
            return;
        }

        for (const auto &pattern : analysis.patterns)
            *m_output << "  - " << Core::describe(pattern) << "\n";
    }

    void ConsoleReporter::printRule(char fill, std::size_t width)
    {
        *m_output << std::string(width, fill) << "\n";
    }

    void ConsoleReporter::flush()
    {
        m_output->flush();
    }

    std::string formatResult(const Core::TimingStats &stats)
    {
        std::ostringstream oss;
        ConsoleReporter(oss).printTiming(stats);
        return oss.str();
    }

    std::string formatResult(const std::vector<Core::AgentStats> &stats)
    {
        std::ostringstream oss;
        ConsoleReporter(oss).printAgentStats(stats);
        return oss.str();
    }

    std::string formatResult(const Core::PatternAnalysis &analysis)
    {
        std::ostringstream oss;
        ConsoleReporter(oss).printPatterns(analysis);
        return oss.str();
    }

} // namespace Report
} // namespace AgentLog
