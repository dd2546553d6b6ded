#include "core/LogPattern.hpp"

#include <iomanip>
#include <sstream>

namespace AgentLog
{
namespace Core
{

namespace
{
    struct PatternDescriber
    {
        std::ostringstream& os;

        void operator()(const ErrorBurst& p) const
        {
            os << "ErrorBurst: " << p.count << " errors in "
               << std::fixed << std::setprecision(2) << p.durationSecs << "s";
        }

        void operator()(const LongGap& p) const
        {
            os << "LongGap: " << std::fixed << std::setprecision(2)
               << p.durationSecs << "s without entries";
        }

        void operator()(const AgentActivity& p) const
        {
            os << "AgentActivity: " << p.agent << " invoked " << p.count << " times";
        }

        void operator()(const NoAgentActivity&) const
        {
            os << "NoAgentActivity: no agent invocations in session";
        }
    };
} // namespace

std::string describe(const LogPattern& pattern)
{
    std::ostringstream oss;
    std::visit(PatternDescriber{oss}, pattern);
    return oss.str();
}

} // namespace Core
} // namespace AgentLog
