#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "core/LogEntry.hpp"
#include "core/ParseError.hpp"

namespace AgentLog
{
    namespace Input
    {
        /**
         * LineParser
         *
         * Responsibilities:
         *  - Convert one raw session log line "[<timestamp>] <LEVEL>: <message>"
         *    into a Core::LogEntry.
         *  - Classify failures (MalformedEntry, InvalidTimestamp) without ever
         *    producing a partial entry.
         *
         * Design notes:
         *  - Stateless; all parsing is pure, so one instance can be shared.
         *  - Timestamps go through Utils::parseTimestamp (RFC3339, then naive
         *    ISO-8601 as UTC, then the explicit 'Z' form).
         *  - Agent name and duration are never extracted from the message; the
         *    resulting entries carry neither.
         */
        class LineParser
        {
        public:
            /// Exactly one of entry / error is set.
            struct ParseResult
            {
                std::optional<Core::LogEntry>   entry;
                std::optional<Core::ParseError> error;

                bool ok() const noexcept { return entry.has_value(); }
            };

            LineParser() = default;

            /**
             * Parse a single line.
             *
             * lineNumber is only used to annotate MalformedEntry errors
             * (0 when the line is not part of a file).
             */
            ParseResult parseLine(std::string_view line, std::size_t lineNumber = 0) const;

            /**
             * Parse a single line, throwing the classified Core::ParseError on failure.
             */
            Core::LogEntry parseEntry(std::string_view line, std::size_t lineNumber = 0) const;

            /**
             * Map a level keyword (case-insensitive, surrounding whitespace ignored)
             * onto an entry kind:
             *   INFO -> Info, WARN/WARNING -> Warning, ERROR -> Error,
             *   AGENT -> AgentInvocation, DECISION -> Decision, else Unknown.
             */
            static Core::EntryType classifyLevel(std::string_view level);
        };

    } // namespace Input
} // namespace AgentLog
