#include "utils/TimeUtils.hpp"

#include <iomanip>
#include <sstream>

namespace ErrorWatch
{
    namespace Utils
    {
        TimePoint now() noexcept
        {
            return Clock::now();
        }

        // -------- Formatting helpers --------

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            std::time_t t = Clock::to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            localtime_s(&tm_buf, &t);
        #else
            localtime_r(&t, &tm_buf);
        #endif

            const std::string fmt(format);
            std::ostringstream oss;
            oss << std::put_time(&tm_buf, fmt.c_str());
            return oss.str();
        }

        std::string toIso8601(TimePoint tp)
        {
            return formatTimestamp(tp, "%Y-%m-%dT%H:%M:%S");
        }

        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept
        {
            return std::chrono::duration_cast<milliseconds>(end - start).count();
        }

        // -------- CivilDate --------

        namespace
        {
            // Parse a fixed-width run of ASCII digits; nullopt on any non-digit.
            std::optional<int> parseDigits(std::string_view sv)
            {
                int value = 0;
                for (char c : sv)
                {
                    if (c < '0' || c > '9')
                    {
                        return std::nullopt;
                    }
                    value = value * 10 + (c - '0');
                }
                return value;
            }

            bool isLeapYear(int y) noexcept
            {
                return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
            }

            unsigned daysInMonth(int y, unsigned m) noexcept
            {
                static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (m == 2 && isLeapYear(y))
                {
                    return 29;
                }
                return kDays[m - 1];
            }
        } // anonymous namespace

        std::optional<CivilDate> CivilDate::parse(std::string_view sv)
        {
            // Expected format: "YYYY-MM-DD" (exactly 10 characters)
            if (sv.size() != 10 || sv[4] != '-' || sv[7] != '-')
            {
                return std::nullopt;
            }

            const auto y = parseDigits(sv.substr(0, 4));
            const auto m = parseDigits(sv.substr(5, 2));
            const auto d = parseDigits(sv.substr(8, 2));
            if (!y || !m || !d)
            {
                return std::nullopt;
            }
            if (*m < 1 || *m > 12)
            {
                return std::nullopt;
            }
            if (*d < 1 || static_cast<unsigned>(*d) > daysInMonth(*y, static_cast<unsigned>(*m)))
            {
                return std::nullopt;
            }

            CivilDate date;
            date.year  = *y;
            date.month = static_cast<unsigned>(*m);
            date.day   = static_cast<unsigned>(*d);
            return date;
        }

        // Serial day conversions use the era-based algorithm (400-year cycles
        // of 146097 days) with March as the first month of the computational year.
        std::int64_t CivilDate::toSerial() const noexcept
        {
            const std::int64_t y   = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
            const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
            const std::int64_t yoe = y - era * 400;
            const std::int64_t mp  = (static_cast<std::int64_t>(month) + 9) % 12;
            const std::int64_t doy = (153 * mp + 2) / 5 + static_cast<std::int64_t>(day) - 1;
            const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + doe - 719468;
        }

        CivilDate CivilDate::fromSerial(std::int64_t days) noexcept
        {
            const std::int64_t z   = days + 719468;
            const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
            const std::int64_t doe = z - era * 146097;
            const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const std::int64_t mp  = (5 * doy + 2) / 153;
            const std::int64_t d   = doy - (153 * mp + 2) / 5 + 1;
            const std::int64_t m   = mp < 10 ? mp + 3 : mp - 9;

            CivilDate date;
            date.year  = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
            date.month = static_cast<unsigned>(m);
            date.day   = static_cast<unsigned>(d);
            return date;
        }

        CivilDate CivilDate::fromTimePoint(TimePoint tp, int offsetHours) noexcept
        {
            const auto shifted = tp + std::chrono::hours(offsetHours);
            const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                                  shifted.time_since_epoch()).count();

            std::int64_t days = secs / 86400;
            if (secs % 86400 < 0)
            {
                --days; // floor for instants before the epoch
            }
            return fromSerial(days);
        }

        std::string CivilDate::toString() const
        {
            std::ostringstream oss;
            oss << std::setfill('0')
                << std::setw(4) << year << '-'
                << std::setw(2) << month << '-'
                << std::setw(2) << day;
            return oss.str();
        }

        CivilDate today(int offsetHours) noexcept
        {
            return CivilDate::fromTimePoint(now(), offsetHours);
        }

    } // namespace Utils
} // namespace ErrorWatch
