#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/LogEntry.hpp"

namespace AgentLog
{
    namespace Analysis
    {
        /**
         * EntryFilter
         *
         * Selection criteria for querying parsed entries; unset criteria match
         * everything:
         *  - agent:    substring of the entry's agent name (entries without an
         *              agent never match an agent filter).
         *  - contains: case-insensitive substring of the message.
         *  - since:    timestamp at or after this instant.
         */
        struct EntryFilter
        {
            std::optional<std::string>               agent;
            std::optional<std::string>               contains;
            std::optional<Core::LogEntry::TimePoint> since;

            bool matches(const Core::LogEntry &entry) const;

            bool empty() const noexcept
            {
                return !agent && !contains && !since;
            }
        };

        /// Matching entries, in their original order.
        std::vector<Core::LogEntry> filterEntries(const std::vector<Core::LogEntry> &entries,
                                                  const EntryFilter &filter);

        /**
         * Number of entries of each kind, most frequent first (ties in
         * EntryType order). Kinds that do not occur are omitted.
         */
        std::vector<std::pair<Core::EntryType, std::size_t>>
        countEntryTypes(const std::vector<Core::LogEntry> &entries);

    } // namespace Analysis
} // namespace AgentLog
