#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "core/LogEntry.hpp"
#include "input/LineParser.hpp"
#include "utils/Logger.hpp"

namespace AgentLog
{
    namespace Input
    {
        /**
         * FileParser
         *
         * Responsibilities:
         *  - Read a session log line by line and collect the parsed entries in
         *    source order.
         *  - Apply the resilient parsing policy: blank lines are skipped
         *    silently; a line the LineParser rejects is reported as a warning
         *    ("<source>:<line>: skipping line: <reason>") and dropped, and parsing continues.
         *  - Fail only on file-level problems (missing/unreadable file, read error),
         *    by throwing Core::ParseError.
         *
         * The diagnostic logger is borrowed and must outlive the parser.
         */
        class FileParser
        {
        public:
            /// Line accounting of the most recent parse.
            struct Summary
            {
                std::size_t totalLines   = 0;
                std::size_t blankLines   = 0;
                std::size_t parsedLines  = 0;
                std::size_t skippedLines = 0;
            };

            explicit FileParser(Utils::Logger &diagnostics = Utils::getLogger());

            /**
             * Parse a file from disk.
             *
             * Throws Core::ParseError (FileNotFound) if the file cannot be opened
             * and Core::ParseError (Io) if reading fails midway.
             */
            std::vector<Core::LogEntry> parseFile(const std::string &path);

            /**
             * Parse an already open stream; sourceName labels the warnings.
             *
             * Throws Core::ParseError (Io) if the stream goes bad while reading.
             */
            std::vector<Core::LogEntry> parseStream(std::istream &in, std::string_view sourceName);

            const Summary &lastSummary() const noexcept { return m_summary; }

        private:
            void consumeLine(std::string_view line,
                             std::size_t lineNumber,
                             std::string_view sourceName,
                             std::vector<Core::LogEntry> &out);

        private:
            LineParser      m_lineParser;
            Utils::Logger  *m_diagnostics;
            Summary         m_summary;
        };

    } // namespace Input
} // namespace AgentLog
