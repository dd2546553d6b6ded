#include "core/LogSession.hpp"

#include "utils/TimeUtils.hpp"

namespace AgentLog
{
namespace Core
{

LogSession makeSession(std::string id, std::vector<LogEntry> entries)
{
    if (entries.empty())
    {
        return LogSession(std::move(id), std::move(entries), Utils::now(), std::nullopt);
    }

    const auto start = entries.front().timestamp();
    const auto end   = entries.back().timestamp();
    return LogSession(std::move(id), std::move(entries), start, end);
}

} // namespace Core
} // namespace AgentLog
