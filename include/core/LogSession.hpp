// File: include/core/LogSession.hpp
//
// A session is the unit every analyzer consumes: an identifier plus the
// entries of one or more log files in the order they were read.

#ifndef AGENTLOG_CORE_LOG_SESSION_HPP
#define AGENTLOG_CORE_LOG_SESSION_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/LogEntry.hpp"

namespace AgentLog
{
namespace Core
{

/**
 * @brief Ordered collection of entries with a start and optional end time.
 *
 * Entries keep their source order; they are never re-sorted by timestamp.
 * The start/end instants are supplied by the caller and are not checked
 * against the entries. Analyzers borrow the session through const
 * references and never modify it.
 */
class LogSession
{
public:
    using TimePoint = LogEntry::TimePoint;

    LogSession(std::string id,
               std::vector<LogEntry> entries,
               TimePoint startTime,
               std::optional<TimePoint> endTime = std::nullopt)
        : m_id(std::move(id)),
          m_entries(std::move(entries)),
          m_startTime(startTime),
          m_endTime(endTime)
    {
    }

    const std::string& id() const noexcept { return m_id; }

    const std::vector<LogEntry>& entries() const noexcept { return m_entries; }

    const TimePoint& startTime() const noexcept { return m_startTime; }

    const std::optional<TimePoint>& endTime() const noexcept { return m_endTime; }

    std::size_t size() const noexcept { return m_entries.size(); }

    bool empty() const noexcept { return m_entries.empty(); }

private:
    std::string              m_id;
    std::vector<LogEntry>    m_entries;
    TimePoint                m_startTime;
    std::optional<TimePoint> m_endTime;
};

/**
 * @brief Wrap parsed entries into a session.
 *
 * Start time is the first entry's timestamp (the current time when there
 * are no entries); end time is the last entry's timestamp, absent when
 * there are no entries.
 */
LogSession makeSession(std::string id, std::vector<LogEntry> entries);

} // namespace Core
} // namespace AgentLog

#endif // AGENTLOG_CORE_LOG_SESSION_HPP
