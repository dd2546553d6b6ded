#include "input/FileParser.hpp"

#include <filesystem>
#include <sstream>
#include <system_error>

#include "core/ParseError.hpp"
#include "input/FileReader.hpp"
#include "utils/StringUtils.hpp"

namespace AgentLog
{
    namespace Input
    {
        FileParser::FileParser(Utils::Logger &diagnostics)
            : m_lineParser(),
              m_diagnostics(&diagnostics),
              m_summary()
        {
        }

        std::vector<Core::LogEntry> FileParser::parseFile(const std::string &path)
        {
            m_summary = Summary{};

            std::error_code ec;
            if (std::filesystem::is_directory(path, ec))
            {
                throw Core::ParseError::io(path, "is a directory");
            }

            FileReader reader(path);
            if (!reader.isOpen())
            {
                throw Core::ParseError::fileNotFound(path);
            }

            m_diagnostics->debug("Parsing " + path);

            std::vector<Core::LogEntry> entries;
            while (auto line = reader.nextLine())
            {
                consumeLine(*line, reader.lineNumber(), path, entries);
            }

            if (reader.hasError())
            {
                throw Core::ParseError::io(path, "read failed after line " +
                                                 std::to_string(reader.lineNumber()));
            }

            m_diagnostics->debug("Parsed " + std::to_string(entries.size()) + " entries from " + path +
                                 " (" + std::to_string(m_summary.skippedLines) + " skipped)");
            return entries;
        }

        std::vector<Core::LogEntry> FileParser::parseStream(std::istream &in, std::string_view sourceName)
        {
            m_summary = Summary{};

            std::vector<Core::LogEntry> entries;
            std::string line;
            std::size_t lineNumber = 0;
            while (std::getline(in, line))
            {
                ++lineNumber;
                if (!line.empty() && line.back() == '\r')
                {
                    line.pop_back();
                }
                consumeLine(line, lineNumber, sourceName, entries);
            }

            if (in.bad())
            {
                throw Core::ParseError::io(std::string(sourceName), "read failed after line " +
                                                                   std::to_string(lineNumber));
            }
            return entries;
        }

        void FileParser::consumeLine(std::string_view line,
                                     std::size_t lineNumber,
                                     std::string_view sourceName,
                                     std::vector<Core::LogEntry> &out)
        {
            ++m_summary.totalLines;

            if (Utils::isBlank(line))
            {
                ++m_summary.blankLines;
                return;
            }

            auto result = m_lineParser.parseLine(line, lineNumber);
            if (result.entry)
            {
                ++m_summary.parsedLines;
                out.push_back(std::move(*result.entry));
                return;
            }

            ++m_summary.skippedLines;

            std::ostringstream oss;
            oss << sourceName << ':' << lineNumber << ": skipping line: " << result.error->what();
            m_diagnostics->warn(oss.str());
        }

    } // namespace Input
} // namespace AgentLog
