#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "utils/TimeUtils.hpp"

namespace AgentLog
{
    namespace Utils
    {
        /**
         * Severity levels of the tool's own diagnostics.
         *
         * Not to be confused with Core::EntryType, which classifies the
         * lines of the analyzed session logs.
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /**
         * Logger
         *
         * Diagnostic sink for the parsing pipeline and the CLI:
         *  - Per-line parse warnings from the file parser.
         *  - Progress and summary messages from the command front end.
         *
         * Features:
         *  - Minimum level filtering.
         *  - Console stream (stderr by default, any std::ostream for tests).
         *  - Optional append-mode log file in addition to the console.
         *  - UTC timestamp on every line: "[YYYY-MM-DD HH:MM:SS] [LEVEL] message".
         *
         * Writes are serialized by an internal mutex. Non-copyable and non-movable;
         * share it by reference.
         */
        class Logger
        {
        public:
            /// Create a logger that writes to stderr only, at INFO level.
            Logger();

            /// Create a logger that writes to the given stream (must outlive the logger).
            explicit Logger(std::ostream &console, LogLevel level = LogLevel::INFO);

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            /// Set the minimum severity that will be logged.
            void setLevel(LogLevel level) noexcept;

            LogLevel level() const noexcept;

            bool isEnabled(LogLevel level) const noexcept;

            /**
             * Additionally append every line to a file.
             * Returns false (and keeps console-only logging) if the file cannot be opened.
             */
            bool openFile(const std::string &filePath);

            /// Redirect console output; nullptr disables the console sink.
            void setConsole(std::ostream *console) noexcept;

            void log(LogLevel level, std::string_view message);

            void trace(std::string_view message)   { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)   { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)    { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)    { log(LogLevel::WARN,  message); }
            void error(std::string_view message)   { log(LogLevel::ERROR, message); }
            void critical(std::string_view message){ log(LogLevel::CRITICAL, message); }

            /// "INFO", "WARN", ...
            static const char *toString(LogLevel level) noexcept;

        private:
            void writeLine(std::string_view line);

        private:
            LogLevel            m_level;
            std::ofstream       m_file;       // RAII-managed file handle
            std::ostream       *m_console;    // usually &std::cerr
            mutable std::mutex  m_mutex;      // protects all writes and the level
        };

        /**
         * Parse a level name from configuration (case-insensitive).
         * Accepts TRACE, DEBUG, INFO, WARN/WARNING, ERROR, CRITICAL.
         */
        std::optional<LogLevel> parseLogLevel(std::string_view text);

        /**
         * Process-wide logger (stderr, INFO level).
         *
         * Example usage:
         *   Logger &log = getLogger();
         *   log.info("Parsed 120 entries");
         */
        Logger &getLogger();

    } // namespace Utils
} // namespace AgentLog
