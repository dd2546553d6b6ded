#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace AgentLog
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a simple text configuration file (key = value format).
         *  - Provide typed getters with defaults for analyzer thresholds and
         *    logging settings.
         *
         * Format:
         *  - Each line is: key = value
         *  - Lines starting with '#' or ';' are comments.
         *  - Empty lines and lines without '=' are ignored.
         *  - Whitespace around key and value is trimmed; the last occurrence of a key wins.
         *
         * Example:
         *   log_level               = DEBUG
         *   error_burst_threshold   = 5.0
         *   long_gap_threshold_secs = 300
         *   agent_activity_threshold = 10
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            /**
             * Load configuration from a file path.
             *
             * Returns false if the file cannot be opened; existing values are kept.
             */
            bool loadFromFile(const std::string &filePath);

            /// Replace the configuration with the key/value lines read from a stream.
            void loadFromStream(std::istream &in);

            /// Set a key directly (tests, command-line overrides).
            void set(std::string key, std::string value);

            bool hasKey(std::string_view key) const;

            std::optional<std::string> getString(std::string_view key) const;
            std::string getStringOr(std::string_view key, std::string_view defaultValue) const;

            /// Integer value; std::nullopt if missing or not a whole integer.
            std::optional<long long> getInt(std::string_view key) const;
            long long getIntOr(std::string_view key, long long defaultValue) const;

            /// Non-negative count; std::nullopt if missing, invalid or negative.
            std::optional<std::size_t> getCount(std::string_view key) const;
            std::size_t getCountOr(std::string_view key, std::size_t defaultValue) const;

            /// Floating point value; std::nullopt if missing or invalid.
            std::optional<double> getDouble(std::string_view key) const;
            double getDoubleOr(std::string_view key, double defaultValue) const;

            std::size_t size() const noexcept { return m_values.size(); }

        private:
            std::unordered_map<std::string, std::string> m_values;
        };

    } // namespace Utils
} // namespace AgentLog
