#include "input/LogDirectory.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

#include "core/ParseError.hpp"

namespace AgentLog
{
    namespace Input
    {
        namespace fs = std::filesystem;

        std::vector<fs::path> findLogFiles(const fs::path &dir)
        {
            std::error_code ec;
            const bool exists = fs::exists(dir, ec);
            if (ec)
            {
                throw Core::ParseError::io(dir.string(), ec.message());
            }
            if (!exists)
            {
                throw Core::ParseError::fileNotFound(dir.string());
            }

            // Non-throwing iteration; a failed step is reported as ParseError.
            std::vector<fs::path> files;
            for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
            {
                std::error_code typeEc;
                if (it->is_regular_file(typeEc) && it->path().extension() == ".log")
                {
                    files.push_back(it->path());
                }
            }
            if (ec)
            {
                throw Core::ParseError::io(dir.string(), ec.message());
            }

            std::sort(files.begin(), files.end());
            return files;
        }

        std::vector<Core::LogEntry> parseLogFiles(const std::vector<fs::path> &files,
                                                  FileParser &parser,
                                                  Utils::Logger &diagnostics)
        {
            std::vector<Core::LogEntry> all;

            for (const auto &file : files)
            {
                try
                {
                    auto entries = parser.parseFile(file.string());
                    diagnostics.info("Parsed " + file.string() + ": " +
                                     std::to_string(entries.size()) + " entries");
                    all.insert(all.end(),
                               std::make_move_iterator(entries.begin()),
                               std::make_move_iterator(entries.end()));
                }
                catch (const Core::ParseError &e)
                {
                    diagnostics.warn(std::string("Failed to parse ") + file.string() + ": " + e.what());
                }
            }

            return all;
        }

    } // namespace Input
} // namespace AgentLog
