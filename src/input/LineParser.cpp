#include "input/LineParser.hpp"

#include <string>
#include <utility>

#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace AgentLog
{
    namespace Input
    {
        using Core::EntryType;
        using Core::ParseError;

        namespace
        {
            LineParser::ParseResult failure(ParseError error)
            {
                LineParser::ParseResult r;
                r.error = std::move(error);
                return r;
            }
        } // anonymous namespace

        LineParser::ParseResult LineParser::parseLine(std::string_view line,
                                                      std::size_t lineNumber) const
        {
            if (line.empty() || line.front() != '[')
            {
                return failure(ParseError::malformedEntry(lineNumber, "Line must start with '['"));
            }

            // First ']' closes the timestamp, even if the message has brackets of its own.
            const auto close = line.find(']');
            if (close == std::string_view::npos)
            {
                return failure(ParseError::malformedEntry(lineNumber, "Missing closing ']' after timestamp"));
            }

            const std::string_view tsText = line.substr(1, close - 1);
            const auto timestamp = Utils::parseTimestamp(tsText);
            if (!timestamp)
            {
                return failure(ParseError::invalidTimestamp(std::string(tsText)));
            }

            const std::string_view rest = Utils::trim(line.substr(close + 1));

            EntryType type = EntryType::Unknown;
            std::string_view message = rest;

            const auto colon = rest.find(':');
            if (colon != std::string_view::npos)
            {
                type    = classifyLevel(rest.substr(0, colon));
                message = Utils::trim(rest.substr(colon + 1));
            }

            ParseResult r;
            r.entry.emplace(*timestamp, type, std::string(message));
            return r;
        }

        Core::LogEntry LineParser::parseEntry(std::string_view line, std::size_t lineNumber) const
        {
            auto result = parseLine(line, lineNumber);
            if (!result.entry)
            {
                throw *result.error;
            }
            return std::move(*result.entry);
        }

        Core::EntryType LineParser::classifyLevel(std::string_view level)
        {
            static const struct
            {
                std::string_view keyword;
                EntryType type;
            } levelMap[] = {
                {"INFO",     EntryType::Info},
                {"WARN",     EntryType::Warning},
                {"WARNING",  EntryType::Warning},
                {"ERROR",    EntryType::Error},
                {"AGENT",    EntryType::AgentInvocation},
                {"DECISION", EntryType::Decision},
            };

            // Keep the upper-cased copy alive while comparing against it.
            const std::string upper = Utils::toUpper(Utils::trim(level));

            for (const auto &mapping : levelMap)
            {
                if (upper == mapping.keyword)
                {
                    return mapping.type;
                }
            }

            return EntryType::Unknown;
        }

    } // namespace Input
} // namespace AgentLog
