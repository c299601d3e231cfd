#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

namespace ErrorWatch
{
    namespace Utils
    {
        /**
         * Time utilities for logging, report timestamps and history dates.
         *
         * Design goals:
         *  - Use std::chrono types for wall-clock timestamps.
         *  - Avoid global mutable state; all functions are thread-safe.
         *  - Parsing functions return std::optional to signal failures instead of throwing.
         */

        using Clock        = std::chrono::system_clock;
        using TimePoint    = std::chrono::time_point<Clock>;
        using milliseconds = std::chrono::milliseconds;

        /// Current system time.
        TimePoint now() noexcept;

        /**
         * Format a TimePoint (local time) into a human-readable timestamp string.
         *
         * Default format: "YYYY-MM-DD HH:MM:SS"
         */
        std::string formatTimestamp(TimePoint tp,
                                    std::string_view format = "%Y-%m-%d %H:%M:%S");

        /// Format a TimePoint as "YYYY-MM-DDTHH:MM:SS" (local time).
        std::string toIso8601(TimePoint tp);

        /// Duration between two time points in milliseconds.
        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept;

        /**
         * CivilDate
         *
         * A proleptic Gregorian calendar date without time or zone, used for
         * history lifecycle dates ("first seen", "last seen") and the run date.
         * Day arithmetic goes through a serial day number so month and year
         * boundaries (and leap years) are handled exactly.
         */
        struct CivilDate
        {
            int      year  = 1970;
            unsigned month = 1;
            unsigned day   = 1;

            /// Parse strict "YYYY-MM-DD". Returns std::nullopt for anything else
            /// (wrong shape, month 13, February 30, ...).
            static std::optional<CivilDate> parse(std::string_view sv);

            /// Date from a serial day number (days since 1970-01-01).
            static CivilDate fromSerial(std::int64_t days) noexcept;

            /**
             * Calendar date of a wall-clock instant shifted by a fixed UTC offset.
             * Example: offsetHours = 9 gives the date in UTC+9.
             */
            static CivilDate fromTimePoint(TimePoint tp, int offsetHours) noexcept;

            /// Days since 1970-01-01 (negative before the epoch).
            std::int64_t toSerial() const noexcept;

            /// "YYYY-MM-DD"
            std::string toString() const;

            CivilDate addDays(std::int64_t days) const noexcept
            {
                return fromSerial(toSerial() + days);
            }

            friend bool operator==(const CivilDate &a, const CivilDate &b) noexcept
            {
                return a.year == b.year && a.month == b.month && a.day == b.day;
            }
            friend bool operator!=(const CivilDate &a, const CivilDate &b) noexcept
            {
                return !(a == b);
            }
            friend bool operator<(const CivilDate &a, const CivilDate &b) noexcept
            {
                return a.toSerial() < b.toSerial();
            }
        };

        /// Today's date in the given UTC offset.
        CivilDate today(int offsetHours) noexcept;

    } // namespace Utils
} // namespace ErrorWatch
