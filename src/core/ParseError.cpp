#include "core/ParseError.hpp"

#include <utility>

namespace AgentLog
{
namespace Core
{

ParseError::ParseError(Kind kind,
                       std::string subject,
                       std::size_t lineNumber,
                       std::string details,
                       const std::string& what)
    : std::runtime_error(what),
      m_kind(kind),
      m_subject(std::move(subject)),
      m_lineNumber(lineNumber),
      m_details(std::move(details))
{
}

ParseError ParseError::fileNotFound(const std::string& path)
{
    return ParseError(Kind::FileNotFound, path, 0, {}, "File not found: " + path);
}

ParseError ParseError::invalidTimestamp(const std::string& text)
{
    return ParseError(Kind::InvalidTimestamp, text, 0, {},
                      "Invalid timestamp format: " + text);
}

ParseError ParseError::malformedEntry(std::size_t lineNumber, const std::string& details)
{
    std::string what = "Malformed entry";
    if (lineNumber > 0)
    {
        what += " at line " + std::to_string(lineNumber);
    }
    what += ": " + details;
    return ParseError(Kind::MalformedEntry, {}, lineNumber, details, what);
}

ParseError ParseError::io(const std::string& path, const std::string& details)
{
    return ParseError(Kind::Io, path, 0, details, "I/O error reading " + path + ": " + details);
}

const char* toString(ParseError::Kind kind) noexcept
{
    switch (kind)
    {
    case ParseError::Kind::FileNotFound:     return "FileNotFound";
    case ParseError::Kind::InvalidTimestamp: return "InvalidTimestamp";
    case ParseError::Kind::MalformedEntry:   return "MalformedEntry";
    case ParseError::Kind::Io:               return "Io";
    }
    return "Unknown";
}

} // namespace Core
} // namespace AgentLog
