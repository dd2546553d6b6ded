// File: src/utils/StringUtils.cpp

#include "utils/StringUtils.hpp"

namespace
{
    bool equalsIgnoreCase(char a, char b) noexcept
    {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    }
}

namespace AgentLog::Utils
{

bool containsIgnoreCase(std::string_view haystack, std::string_view needle)
{
    if (needle.empty())
        return true;

    const auto it = std::search(haystack.begin(), haystack.end(),
                                needle.begin(), needle.end(),
                                equalsIgnoreCase);
    return it != haystack.end();
}

std::string truncate(std::string_view text, std::size_t maxChars)
{
    if (text.size() <= maxChars)
        return std::string(text);

    std::string out(text.substr(0, maxChars));
    out += "...";
    return out;
}

} // namespace AgentLog::Utils
