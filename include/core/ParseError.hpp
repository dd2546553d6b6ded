// File: include/core/ParseError.hpp
//
// Typed failures of the parsing pipeline.

#ifndef AGENTLOG_CORE_PARSE_ERROR_HPP
#define AGENTLOG_CORE_PARSE_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace AgentLog
{
namespace Core
{

/**
 * @brief Classified parse failure.
 *
 * Line-level kinds (InvalidTimestamp, MalformedEntry) are returned by the
 * line parser and downgraded to warnings by the file parser. File-level
 * kinds (FileNotFound, Io) are thrown to the caller.
 */
class ParseError : public std::runtime_error
{
public:
    enum class Kind
    {
        FileNotFound,
        InvalidTimestamp,
        MalformedEntry,
        Io
    };

    static ParseError fileNotFound(const std::string& path);
    static ParseError invalidTimestamp(const std::string& text);

    /// lineNumber is 1-based; 0 when the line is not part of a file.
    static ParseError malformedEntry(std::size_t lineNumber, const std::string& details);

    static ParseError io(const std::string& path, const std::string& details);

    Kind kind() const noexcept { return m_kind; }

    /// Path for file-level errors, timestamp text for InvalidTimestamp.
    const std::string& subject() const noexcept { return m_subject; }

    std::size_t lineNumber() const noexcept { return m_lineNumber; }

    const std::string& details() const noexcept { return m_details; }

    bool isLineLevel() const noexcept
    {
        return m_kind == Kind::InvalidTimestamp || m_kind == Kind::MalformedEntry;
    }

private:
    ParseError(Kind kind,
               std::string subject,
               std::size_t lineNumber,
               std::string details,
               const std::string& what);

    Kind        m_kind;
    std::string m_subject;
    std::size_t m_lineNumber = 0;
    std::string m_details;
};

const char* toString(ParseError::Kind kind) noexcept;

} // namespace Core
} // namespace AgentLog

#endif // AGENTLOG_CORE_PARSE_ERROR_HPP
