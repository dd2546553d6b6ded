#pragma once

#include <filesystem>
#include <vector>

#include "core/LogEntry.hpp"
#include "input/FileParser.hpp"
#include "utils/Logger.hpp"

namespace AgentLog
{
    namespace Input
    {
        /**
         * Regular files with a ".log" extension directly inside dir, sorted by path.
         *
         * Throws Core::ParseError (FileNotFound) if dir does not exist and
         * Core::ParseError (Io) if it cannot be listed.
         */
        std::vector<std::filesystem::path> findLogFiles(const std::filesystem::path &dir);

        /**
         * Parse each file in order and concatenate the entries.
         *
         * A file that fails (missing, unreadable) is reported to diagnostics
         * as a warning and skipped; the rest of the batch still runs.
         */
        std::vector<Core::LogEntry> parseLogFiles(const std::vector<std::filesystem::path> &files,
                                                  FileParser &parser,
                                                  Utils::Logger &diagnostics);

    } // namespace Input
} // namespace AgentLog
