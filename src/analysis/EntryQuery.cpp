#include "analysis/EntryQuery.hpp"

#include <algorithm>
#include <array>
#include <iterator>

#include "utils/StringUtils.hpp"

namespace AgentLog
{
    namespace Analysis
    {
        namespace
        {
            constexpr std::size_t kEntryTypeCount = static_cast<std::size_t>(Core::EntryType::Unknown) + 1;
        }

        bool EntryFilter::matches(const Core::LogEntry &entry) const
        {
            if (agent)
            {
                const auto &name = entry.agentName();
                if (!name || !Utils::contains(*name, *agent))
                    return false;
            }

            if (contains && !Utils::containsIgnoreCase(entry.message(), *contains))
                return false;

            if (since && entry.timestamp() < *since)
                return false;

            return true;
        }

        std::vector<Core::LogEntry> filterEntries(const std::vector<Core::LogEntry> &entries,
                                                  const EntryFilter &filter)
        {
            std::vector<Core::LogEntry> out;
            std::copy_if(entries.begin(), entries.end(), std::back_inserter(out),
                         [&filter](const Core::LogEntry &e) { return filter.matches(e); });
            return out;
        }

        std::vector<std::pair<Core::EntryType, std::size_t>>
        countEntryTypes(const std::vector<Core::LogEntry> &entries)
        {
            std::array<std::size_t, kEntryTypeCount> counts{};
            for (const auto &entry : entries)
                ++counts[static_cast<std::size_t>(entry.type())];

            std::vector<std::pair<Core::EntryType, std::size_t>> result;
            for (std::size_t i = 0; i < counts.size(); ++i)
            {
                if (counts[i] > 0)
                    result.emplace_back(static_cast<Core::EntryType>(i), counts[i]);
            }

            // Stable sort keeps EntryType order among equal counts.
            std::stable_sort(result.begin(), result.end(),
                             [](const auto &a, const auto &b) { return a.second > b.second; });
            return result;
        }

    } // namespace Analysis
} // namespace AgentLog
