#pragma once

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>

namespace AgentLog
{
    namespace Input
    {
        /**
         * FileReader
         *
         * Responsibilities:
         *  - Line-oriented reading of a session log file for the file parser.
         *  - Track the 1-based number of the line last returned, for diagnostics.
         *  - Manage the file handle via RAII.
         *
         * Design notes:
         *  - Uses std::ifstream with its internal read buffer.
         *  - Single owner; not copyable, but movable.
         */
        class FileReader
        {
        public:
            FileReader() = default;

            /**
             * Construct and open a file immediately.
             * If open fails, isOpen() will return false.
             */
            explicit FileReader(const std::string &filePath);

            FileReader(const FileReader &)            = delete;
            FileReader &operator=(const FileReader &) = delete;

            FileReader(FileReader &&other) noexcept;
            FileReader &operator=(FileReader &&other) noexcept;

            ~FileReader();

            /**
             * Open a file for reading. Any previously open file is closed first.
             * Returns false if opening fails.
             */
            bool open(const std::string &filePath);

            void close() noexcept;

            bool isOpen() const noexcept;

            const std::string &filePath() const noexcept;

            /**
             * Read the next line, without the trailing '\n' (and '\r' for
             * Windows line endings).
             *
             * Returns std::nullopt at end of file or on a read error; use
             * hasError() to tell the two apart.
             */
            std::optional<std::string> nextLine();

            /// Number of the line last returned by nextLine() (0 before the first).
            std::size_t lineNumber() const noexcept { return m_lineNumber; }

            /// True if the underlying stream hit an unrecoverable read error.
            bool hasError() const noexcept;

        private:
            std::ifstream m_stream;       // RAII-managed file stream
            std::string   m_filePath;     // path to the currently open file
            std::size_t   m_lineNumber = 0;
        };

    } // namespace Input
} // namespace AgentLog
