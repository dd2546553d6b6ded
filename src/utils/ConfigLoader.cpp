#include "utils/ConfigLoader.hpp"

#include <fstream>
#include <stdexcept>

#include "utils/StringUtils.hpp"

namespace AgentLog
{
    namespace Utils
    {
        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
            {
                return false;
            }

            loadFromStream(in);
            return true;
        }

        void ConfigLoader::loadFromStream(std::istream &in)
        {
            std::unordered_map<std::string, std::string> newValues;

            std::string line;
            while (std::getline(in, line))
            {
                const std::string_view content = trim(line);
                if (content.empty() || content.front() == '#' || content.front() == ';')
                {
                    continue;
                }

                const auto pos = content.find('=');
                if (pos == std::string_view::npos)
                {
                    // Malformed line; ignore for robustness.
                    continue;
                }

                const std::string_view key   = trim(content.substr(0, pos));
                const std::string_view value = trim(content.substr(pos + 1));
                if (key.empty())
                {
                    continue;
                }

                newValues[std::string(key)] = std::string(value);
            }

            m_values = std::move(newValues);
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            m_values[std::move(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            return m_values.find(std::string(key)) != m_values.end();
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            auto it = m_values.find(std::string(key));
            if (it == m_values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view defaultValue) const
        {
            auto v = getString(key);
            return v ? *v : std::string(defaultValue);
        }

        std::optional<long long> ConfigLoader::getInt(std::string_view key) const
        {
            auto v = getString(key);
            if (!v || v->empty())
            {
                return std::nullopt;
            }

            try
            {
                std::size_t idx = 0;
                const long long value = std::stoll(*v, &idx);
                if (idx != v->size())
                {
                    // Trailing characters make this invalid.
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::logic_error &)
            {
                // std::invalid_argument or std::out_of_range
                return std::nullopt;
            }
        }

        long long ConfigLoader::getIntOr(std::string_view key, long long defaultValue) const
        {
            auto v = getInt(key);
            return v ? *v : defaultValue;
        }

        std::optional<std::size_t> ConfigLoader::getCount(std::string_view key) const
        {
            auto v = getInt(key);
            if (!v || *v < 0)
            {
                return std::nullopt;
            }
            return static_cast<std::size_t>(*v);
        }

        std::size_t ConfigLoader::getCountOr(std::string_view key, std::size_t defaultValue) const
        {
            auto v = getCount(key);
            return v ? *v : defaultValue;
        }

        std::optional<double> ConfigLoader::getDouble(std::string_view key) const
        {
            auto v = getString(key);
            if (!v || v->empty())
            {
                return std::nullopt;
            }

            try
            {
                std::size_t idx = 0;
                const double value = std::stod(*v, &idx);
                if (idx != v->size())
                {
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::logic_error &)
            {
                return std::nullopt;
            }
        }

        double ConfigLoader::getDoubleOr(std::string_view key, double defaultValue) const
        {
            auto v = getDouble(key);
            return v ? *v : defaultValue;
        }

    } // namespace Utils
} // namespace AgentLog
