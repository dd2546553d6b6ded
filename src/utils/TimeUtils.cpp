#include "utils/TimeUtils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace AgentLog
{
    namespace Utils
    {
        namespace
        {
            struct DateTimeFields
            {
                int year   = 0;
                int month  = 0;
                int day    = 0;
                int hour   = 0;
                int minute = 0;
                int second = 0;
                std::int64_t nanos = 0;
            };

            // Read exactly `count` decimal digits starting at pos.
            bool readDigits(std::string_view sv, std::size_t &pos, std::size_t count, int &out)
            {
                if (pos + count > sv.size())
                {
                    return false;
                }

                int value = 0;
                for (std::size_t i = 0; i < count; ++i)
                {
                    const char c = sv[pos + i];
                    if (c < '0' || c > '9')
                    {
                        return false;
                    }
                    value = value * 10 + (c - '0');
                }
                pos += count;
                out = value;
                return true;
            }

            bool expect(std::string_view sv, std::size_t &pos, char c)
            {
                if (pos >= sv.size() || sv[pos] != c)
                {
                    return false;
                }
                ++pos;
                return true;
            }

            bool isLeapYear(int year) noexcept
            {
                return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            }

            int daysInMonth(int year, int month) noexcept
            {
                static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (month == 2 && isLeapYear(year))
                {
                    return 29;
                }
                return kDays[month - 1];
            }

            bool fieldsInRange(const DateTimeFields &f) noexcept
            {
                if (f.month < 1 || f.month > 12) return false;
                if (f.day < 1 || f.day > daysInMonth(f.year, f.month)) return false;
                if (f.hour > 23 || f.minute > 59 || f.second > 60) return false;
                return true;
            }

            /**
             * Parse "YYYY-MM-DD<sep>HH:MM:SS[.fraction]" from the start of sv.
             * On success pos points just past the last consumed character.
             * Fractions longer than nanosecond precision are truncated.
             */
            std::optional<DateTimeFields> parseDateTime(std::string_view sv,
                                                        std::size_t &pos,
                                                        std::string_view separators)
            {
                DateTimeFields f;
                pos = 0;

                if (!readDigits(sv, pos, 4, f.year) || !expect(sv, pos, '-') ||
                    !readDigits(sv, pos, 2, f.month) || !expect(sv, pos, '-') ||
                    !readDigits(sv, pos, 2, f.day))
                {
                    return std::nullopt;
                }

                if (pos >= sv.size() || separators.find(sv[pos]) == std::string_view::npos)
                {
                    return std::nullopt;
                }
                ++pos;

                if (!readDigits(sv, pos, 2, f.hour) || !expect(sv, pos, ':') ||
                    !readDigits(sv, pos, 2, f.minute) || !expect(sv, pos, ':') ||
                    !readDigits(sv, pos, 2, f.second))
                {
                    return std::nullopt;
                }

                if (pos < sv.size() && sv[pos] == '.')
                {
                    ++pos;
                    std::size_t digits = 0;
                    std::int64_t nanos = 0;
                    while (pos < sv.size() && sv[pos] >= '0' && sv[pos] <= '9')
                    {
                        if (digits < 9)
                        {
                            nanos = nanos * 10 + (sv[pos] - '0');
                        }
                        ++digits;
                        ++pos;
                    }
                    if (digits == 0)
                    {
                        return std::nullopt;
                    }
                    for (std::size_t i = digits; i < 9; ++i)
                    {
                        nanos *= 10;
                    }
                    f.nanos = nanos;
                }

                if (!fieldsInRange(f))
                {
                    return std::nullopt;
                }

                // A leap second becomes the last representable instant of second 59.
                if (f.second == 60)
                {
                    f.second = 59;
                    f.nanos  = 999999999;
                }
                return f;
            }

            // Days since 1970-01-01 for a proleptic Gregorian date.
            std::int64_t daysFromCivil(int y, int m, int d) noexcept
            {
                y -= m <= 2 ? 1 : 0;
                const int era = (y >= 0 ? y : y - 399) / 400;
                const int yoe = y - era * 400;
                const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return static_cast<std::int64_t>(era) * 146097 + doe - 719468;
            }

            std::int64_t civilToEpochSeconds(int year, int month, int day,
                                             int hour, int minute, int second) noexcept
            {
                return daysFromCivil(year, month, day) * 86400 +
                       static_cast<std::int64_t>(hour) * 3600 + minute * 60 + second;
            }

            // Whole epoch seconds Clock can hold together with a sub-second part.
            constexpr std::int64_t kMinEpochSeconds =
                std::chrono::duration_cast<seconds>(TimePoint::min().time_since_epoch()).count();
            constexpr std::int64_t kMaxEpochSeconds =
                std::chrono::duration_cast<seconds>(TimePoint::max().time_since_epoch()).count() - 1;

            TimePoint fromEpochSeconds(std::int64_t secs, std::int64_t nanos) noexcept
            {
                return TimePoint(std::chrono::duration_cast<Clock::duration>(seconds(secs))) +
                       std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos));
            }

            /**
             * UTC instant of parsed local fields whose zone is utcOffsetSecs ahead
             * of UTC; std::nullopt if Clock cannot represent it.
             */
            std::optional<TimePoint> toTimePoint(const DateTimeFields &f, std::int64_t utcOffsetSecs = 0) noexcept
            {
                const std::int64_t secs =
                    civilToEpochSeconds(f.year, f.month, f.day, f.hour, f.minute, f.second) - utcOffsetSecs;
                if (secs < kMinEpochSeconds || secs > kMaxEpochSeconds)
                {
                    return std::nullopt;
                }
                return fromEpochSeconds(secs, f.nanos);
            }
        } // anonymous namespace

        TimePoint now() noexcept
        {
            return Clock::now();
        }

        TimePoint fromCivilUtc(int year, int month, int day,
                               int hour, int minute, int second,
                               std::int64_t nanos) noexcept
        {
            return fromEpochSeconds(civilToEpochSeconds(year, month, day, hour, minute, second), nanos);
        }

        std::optional<TimePoint> subtractSeconds(TimePoint tp, double secs) noexcept
        {
            using FloatSeconds = std::chrono::duration<double>;

            if (!std::isfinite(secs) || secs < 0.0)
            {
                return std::nullopt;
            }

            // Keep a second of margin for the rounding of the double arithmetic.
            const double toMin = FloatSeconds(tp.time_since_epoch()).count() -
                                 FloatSeconds(TimePoint::min().time_since_epoch()).count();
            const double maxSpan = FloatSeconds(Clock::duration::max()).count();
            if (secs >= std::min(toMin, maxSpan) - 1.0)
            {
                return std::nullopt;
            }

            return tp - std::chrono::duration_cast<Clock::duration>(FloatSeconds(secs));
        }

        // -------- Formatting helpers --------

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            const auto whole = std::chrono::floor<seconds>(tp);
            const std::time_t t = Clock::to_time_t(whole);
            std::tm tm_buf{};
        #if defined(_WIN32)
            gmtime_s(&tm_buf, &t);
        #else
            gmtime_r(&t, &tm_buf);
        #endif

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, std::string(format).c_str());
            return oss.str();
        }

        std::string toIso8601(TimePoint tp)
        {
            const auto whole  = std::chrono::floor<seconds>(tp);
            const auto millis = std::chrono::duration_cast<milliseconds>(tp - whole).count();

            std::ostringstream oss;
            oss << formatTimestamp(whole, "%Y-%m-%dT%H:%M:%S")
                << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
            return oss.str();
        }

        // -------- Parsing helpers --------

        std::optional<TimePoint> parseRfc3339(std::string_view sv)
        {
            std::size_t pos = 0;
            const auto fields = parseDateTime(sv, pos, "Tt ");
            if (!fields || pos >= sv.size())
            {
                return std::nullopt;
            }

            const char tz = sv[pos];
            if (tz == 'Z' || tz == 'z')
            {
                if (pos + 1 != sv.size())
                {
                    return std::nullopt;
                }
                return toTimePoint(*fields);
            }

            if (tz != '+' && tz != '-')
            {
                return std::nullopt;
            }
            ++pos;

            int offHours = 0;
            int offMinutes = 0;
            if (!readDigits(sv, pos, 2, offHours) || !expect(sv, pos, ':') ||
                !readDigits(sv, pos, 2, offMinutes) || pos != sv.size())
            {
                return std::nullopt;
            }
            if (offHours > 23 || offMinutes > 59)
            {
                return std::nullopt;
            }

            // Local time = UTC + offset, so UTC = local - offset.
            const std::int64_t offsetSecs = offHours * 3600 + offMinutes * 60;
            return toTimePoint(*fields, tz == '+' ? offsetSecs : -offsetSecs);
        }

        std::optional<TimePoint> parseNaiveIso(std::string_view sv)
        {
            std::size_t pos = 0;
            const auto fields = parseDateTime(sv, pos, "T");
            if (!fields || pos != sv.size())
            {
                return std::nullopt;
            }
            return toTimePoint(*fields);
        }

        std::optional<TimePoint> parseZuluIso(std::string_view sv)
        {
            std::size_t pos = 0;
            const auto fields = parseDateTime(sv, pos, "T");
            if (!fields || pos + 1 != sv.size() || sv[pos] != 'Z')
            {
                return std::nullopt;
            }
            return toTimePoint(*fields);
        }

        std::optional<TimePoint> parseTimestamp(std::string_view sv)
        {
            if (auto tp = parseRfc3339(sv))
            {
                return tp;
            }
            if (auto tp = parseNaiveIso(sv))
            {
                return tp;
            }
            return parseZuluIso(sv);
        }

        // -------- Differences --------

        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept
        {
            // Split each point into whole milliseconds and a sub-millisecond rest
            // so that no intermediate exceeds the range of Clock::duration.
            const auto startSince = start.time_since_epoch();
            const auto endSince   = end.time_since_epoch();
            const auto startMs    = std::chrono::duration_cast<milliseconds>(startSince);
            const auto endMs      = std::chrono::duration_cast<milliseconds>(endSince);

            auto rest           = (endSince - endMs) - (startSince - startMs);
            const auto restMs   = std::chrono::duration_cast<milliseconds>(rest);
            std::int64_t whole  = (endMs - startMs + restMs).count();
            rest               -= restMs;

            if (whole > 0 && rest.count() < 0)
            {
                --whole;
            }
            else if (whole < 0 && rest.count() > 0)
            {
                ++whole;
            }
            return whole;
        }

        double secondsBetween(TimePoint start, TimePoint end) noexcept
        {
            return static_cast<double>(diffMillis(start, end)) / 1000.0;
        }

        // -------- ScopedTimer (RAII) --------

        ScopedTimer::ScopedTimer(Duration &target) noexcept
            : target_(target),
              start_(std::chrono::steady_clock::now())
        {
        }

        ScopedTimer::~ScopedTimer() noexcept
        {
            target_ = std::chrono::steady_clock::now() - start_;
        }

        // -------- DurationStats --------

        void DurationStats::add(Duration sample) noexcept
        {
            if (m_count == 0)
            {
                m_min = sample;
                m_max = sample;
            }
            else
            {
                m_min = std::min(m_min, sample);
                m_max = std::max(m_max, sample);
            }
            m_total += sample;
            ++m_count;
        }

        DurationStats::Duration DurationStats::average() const noexcept
        {
            if (m_count == 0)
            {
                return Duration{0};
            }
            return m_total / static_cast<double>(m_count);
        }

    } // namespace Utils
} // namespace AgentLog
