#pragma once

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <string_view>

namespace AgentLog
{
    namespace Utils
    {
        /**
         * String utility helpers for parsing and querying log text.
         *
         * All functions are stateless and thread-safe, and take std::string_view
         * where possible to avoid unnecessary copies.
         */

        inline bool isSpace(char ch) noexcept
        {
            return std::isspace(static_cast<unsigned char>(ch)) != 0;
        }

        /// Trim whitespace (space, tab, CR, LF) from the left side of the string view.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            while (!sv.empty() && isSpace(sv.front()))
            {
                sv.remove_prefix(1);
            }
            return sv;
        }

        /// Trim whitespace from the right side of the string view.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            while (!sv.empty() && isSpace(sv.back()))
            {
                sv.remove_suffix(1);
            }
            return sv;
        }

        /// Trim whitespace from both ends of the string view.
        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        /// Convert a string to lowercase (returns a new std::string).
        inline std::string toLower(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(sv.begin(), sv.end(), std::back_inserter(result),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
            return result;
        }

        /// Convert a string to uppercase (returns a new std::string).
        inline std::string toUpper(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(sv.begin(), sv.end(), std::back_inserter(result),
                           [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
            return result;
        }

        /// True when the string is empty or only whitespace.
        inline bool isBlank(std::string_view sv) noexcept
        {
            return trim(sv).empty();
        }

        /// Case-sensitive substring test.
        inline bool contains(std::string_view haystack, std::string_view needle) noexcept
        {
            return haystack.find(needle) != std::string_view::npos;
        }

        /// ASCII case-insensitive substring test. An empty needle always matches.
        bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

        /**
         * Shorten text for one-line display.
         * Strings longer than maxChars are cut and suffixed with "...".
         */
        std::string truncate(std::string_view text, std::size_t maxChars);

    } // namespace Utils
} // namespace AgentLog
