/**
 * @file calendar.hpp
 * @brief Timestamps and proleptic Gregorian calendar arithmetic.
 *
 * Timestamps have minute resolution and are interpreted as wall-clock time
 * of the location of the index they belong to. Conversion between
 * timestamps and civil dates uses the days-from-civil algorithm, so no
 * dependency on the C library's local time zone exists.
 */

#pragma once

#include <chrono>
#include <string>

namespace powerfolio
{
    namespace tools
    {

        using Minutes = std::chrono::minutes;
        using Timestamp = std::chrono::time_point<std::chrono::system_clock, Minutes>;

        /**
         * @struct CivilTime
         * @brief Broken-down calendar representation of a Timestamp.
         */
        struct CivilTime
        {
            int year;
            unsigned month; ///< 1..12
            unsigned day;   ///< 1..31
            int hour;       ///< 0..23
            int minute;     ///< 0..59
        };

        /**
         * @brief Days since 1970-01-01 of a civil date.
         */
        long long days_from_civil(int year, unsigned month, unsigned day);

        /**
         * @brief Check if year is a leap year.
         */
        bool is_leap_year(int year);

        /**
         * @brief Number of days in a month.
         */
        unsigned days_in_month(int year, unsigned month);

        /**
         * @brief Build a timestamp from its civil components.
         * @throws std::invalid_argument if a component is out of range.
         */
        Timestamp make_timestamp(int year, unsigned month, unsigned day, int hour = 0, int minute = 0);

        /**
         * @brief Break a timestamp into civil components.
         */
        CivilTime to_civil(Timestamp ts);

        /**
         * @brief Time elapsed since midnight of the timestamp's day.
         */
        Minutes time_of_day(Timestamp ts);

        /**
         * @brief Midnight of the timestamp's day.
         */
        Timestamp midnight(Timestamp ts);

        /**
         * @brief Shift a timestamp by whole calendar months, keeping day and time of day.
         *
         * Days past the end of the target month are clamped to its last day.
         */
        Timestamp add_months(Timestamp ts, int months);

        /**
         * @brief Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM" or "YYYY-MM-DDTHH:MM".
         * @throws std::invalid_argument on malformed input.
         */
        Timestamp parse_timestamp(const std::string &text);

        /**
         * @brief Format as "YYYY-MM-DD HH:MM".
         */
        std::string format_timestamp(Timestamp ts);

    } // namespace tools
} // namespace powerfolio
