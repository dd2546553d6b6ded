// File: include/core/LogEntry.hpp
//
// Core data model representing a single parsed session log line.
// Value type: cheap to store in std::vector and to pass between the
// parser and the analyzers.

#ifndef AGENTLOG_CORE_LOG_ENTRY_HPP
#define AGENTLOG_CORE_LOG_ENTRY_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace AgentLog
{
namespace Core
{

/**
 * @brief Closed set of entry kinds recognized in session logs.
 *
 * The line parser maps the level keyword of a line onto this set;
 * anything it does not recognize becomes Unknown.
 */
enum class EntryType : std::uint8_t
{
    AgentInvocation = 0,
    Info,
    Warning,
    Error,
    Decision,
    Unknown
};

/// Display name of an entry kind ("AgentInvocation", "Info", ...).
inline const char* toString(EntryType type) noexcept
{
    switch (type)
    {
    case EntryType::AgentInvocation: return "AgentInvocation";
    case EntryType::Info:            return "Info";
    case EntryType::Warning:         return "Warning";
    case EntryType::Error:           return "Error";
    case EntryType::Decision:        return "Decision";
    case EntryType::Unknown:         return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Immutable representation of one parsed log line.
 *
 * Responsibilities:
 *  - Store the fields extracted by the input layer.
 *  - Provide read-only accessors for the analyzers.
 *
 * Design notes:
 *  - Timestamps are UTC instants on std::chrono::system_clock.
 *  - Agent name and duration are optional; the line parser never fills
 *    them, but entries built by other producers (and tests) may.
 *  - There are no setters; an entry never changes after construction.
 */
class LogEntry
{
public:
    using Clock      = std::chrono::system_clock;
    using TimePoint  = std::chrono::time_point<Clock>;

    /**
     * @param timestamp  Parsed instant (UTC).
     * @param type       Entry kind.
     * @param message    Message body, already trimmed by the parser.
     * @param agentName  Agent the entry refers to, if known.
     * @param durationMs Duration reported for the entry in milliseconds, if known.
     */
    LogEntry(TimePoint timestamp,
             EntryType type,
             std::string message,
             std::optional<std::string> agentName = std::nullopt,
             std::optional<std::uint64_t> durationMs = std::nullopt)
        : m_timestamp(timestamp),
          m_type(type),
          m_message(std::move(message)),
          m_agentName(std::move(agentName)),
          m_durationMs(durationMs)
    {
    }

    const TimePoint& timestamp() const noexcept
    {
        return m_timestamp;
    }

    EntryType type() const noexcept
    {
        return m_type;
    }

    const std::string& message() const noexcept
    {
        return m_message;
    }

    const std::optional<std::string>& agentName() const noexcept
    {
        return m_agentName;
    }

    const std::optional<std::uint64_t>& durationMs() const noexcept
    {
        return m_durationMs;
    }

    bool hasAgent() const noexcept
    {
        return m_agentName.has_value();
    }

    bool isError() const noexcept
    {
        return m_type == EntryType::Error;
    }

private:
    TimePoint                     m_timestamp{};
    EntryType                     m_type{EntryType::Unknown};
    std::string                   m_message;
    std::optional<std::string>    m_agentName;
    std::optional<std::uint64_t>  m_durationMs;
};

} // namespace Core
} // namespace AgentLog

#endif // AGENTLOG_CORE_LOG_ENTRY_HPP
