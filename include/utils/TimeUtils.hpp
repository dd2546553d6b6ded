#pragma once

#include <chrono>
#include <ctime>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace AgentLog
{
    namespace Utils
    {
        /**
         * Time utilities for log parsing and session timing analysis.
         *
         * Design goals:
         *  - Use std::chrono types for strong typing and precision.
         *  - All log timestamps are interpreted and formatted as UTC, so results
         *    never depend on the host time zone.
         *  - Parsing functions return std::optional to signal failures instead of throwing.
         */

        using Clock        = std::chrono::system_clock;
        using TimePoint    = std::chrono::time_point<Clock>;
        using milliseconds = std::chrono::milliseconds;
        using seconds      = std::chrono::seconds;

        /// Current wall-clock time.
        TimePoint now() noexcept;

        /**
         * Build a UTC TimePoint from civil date/time fields.
         * No range validation is done here; callers validate fields first.
         * Text from a log goes through parseTimestamp, which also rejects
         * instants outside Clock's range.
         */
        TimePoint fromCivilUtc(int year, int month, int day,
                               int hour, int minute, int second,
                               std::int64_t nanos = 0) noexcept;

        /**
         * tp moved back by secs seconds.
         * std::nullopt if secs is negative or not finite, or if the result
         * would fall outside Clock's range.
         */
        std::optional<TimePoint> subtractSeconds(TimePoint tp, double secs) noexcept;

        /**
         * Format a TimePoint (UTC) with a strftime-style format.
         *
         * Default format: "YYYY-MM-DD HH:MM:SS"
         */
        std::string formatTimestamp(TimePoint tp,
                                    std::string_view format = "%Y-%m-%d %H:%M:%S");

        /// "YYYY-MM-DDTHH:MM:SS.mmmZ"
        std::string toIso8601(TimePoint tp);

        /**
         * RFC3339 timestamp with mandatory offset.
         *
         * Accepts "YYYY-MM-DD(T|t| )HH:MM:SS[.fraction](Z|z|+HH:MM|-HH:MM)".
         * The result is normalized to UTC.
         */
        std::optional<TimePoint> parseRfc3339(std::string_view sv);

        /// Naive "YYYY-MM-DDTHH:MM:SS[.fraction]" without offset, assumed UTC.
        std::optional<TimePoint> parseNaiveIso(std::string_view sv);

        /// "YYYY-MM-DDTHH:MM:SS[.fraction]Z", explicit zero offset.
        std::optional<TimePoint> parseZuluIso(std::string_view sv);

        /**
         * Parse a log timestamp with the layered fallback used by the line parser:
         * RFC3339 first, then the naive form, then the explicit 'Z' form.
         */
        std::optional<TimePoint> parseTimestamp(std::string_view sv);

        /**
         * Milliseconds between two points (end - start), truncated toward zero.
         * Exact for any pair of representable points.
         */
        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept;

        /// Seconds between two points at millisecond resolution.
        double secondsBetween(TimePoint start, TimePoint end) noexcept;

        /**
         * RAII wall-clock timer for benchmarks.
         *
         * Usage:
         *  {
         *      ScopedTimer timer(elapsed);
         *      // work...
         *  }
         *  // elapsed now holds the duration of the scope.
         */
        class ScopedTimer
        {
        public:
            using Duration = std::chrono::duration<double, std::milli>;

            explicit ScopedTimer(Duration &target) noexcept;
            ScopedTimer(const ScopedTimer &)            = delete;
            ScopedTimer &operator=(const ScopedTimer &) = delete;
            ~ScopedTimer() noexcept;

        private:
            Duration                              &target_;
            std::chrono::steady_clock::time_point  start_;
        };

        /// Running count, total, minimum and maximum of timed samples.
        class DurationStats
        {
        public:
            using Duration = ScopedTimer::Duration;

            void add(Duration sample) noexcept;

            std::size_t count() const noexcept { return m_count; }
            Duration total() const noexcept { return m_total; }
            Duration min() const noexcept { return m_min; }
            Duration max() const noexcept { return m_max; }

            /// Zero when no samples were added.
            Duration average() const noexcept;

        private:
            std::size_t m_count = 0;
            Duration    m_total{0};
            Duration    m_min{0};
            Duration    m_max{0};
        };

    } // namespace Utils
} // namespace AgentLog
