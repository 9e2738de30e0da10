/**
 * @file frequency.hpp
 * @brief Supported index frequencies and period-boundary arithmetic.
 *
 * Frequencies nest perfectly: a year holds 4 quarters, a quarter 3 months,
 * a month 28-31 days, a day 24 hours and an hour 4 quarter-hours. Periods
 * of one day or longer start at the commercial start-of-day offset, not
 * necessarily at midnight.
 */

#ifndef POWERFOLIO_TOOLS_FREQUENCY_HPP
#define POWERFOLIO_TOOLS_FREQUENCY_HPP

#include "tools/calendar.hpp"

#include <string>
#include <vector>

namespace powerfolio
{
    namespace tools
    {

        /**
         * @enum Frequency
         * @brief Length of the delivery periods of an index, shortest first.
         */
        enum class Frequency
        {
            QUARTERHOUR, /**< 15 minutes ("15T") */
            HOUR,        /**< 1 hour ("H") */
            DAY,         /**< 1 day ("D") */
            MONTH,       /**< Month start ("MS") */
            QUARTER,     /**< Quarter start ("QS") */
            YEAR         /**< Year start ("AS") */
        };

        /**
         * @brief All supported frequencies, shortest first.
         */
        const std::vector<Frequency> &all_frequencies();

        /**
         * @brief Parse a frequency code.
         *
         * Accepts "15T"/"15min"/"quarterhour", "H"/"h"/"hour", "D"/"day",
         * "MS"/"month", "QS"/"quarter", "AS"/"YS"/"year" (case-insensitive
         * for the long names).
         *
         * @throws std::invalid_argument for unknown codes.
         */
        Frequency parse_frequency(const std::string &code);

        /**
         * @brief Canonical code of a frequency ("15T", "H", "D", "MS", "QS", "AS").
         */
        std::string to_string(Frequency freq);

        /**
         * @brief Compare source and target frequency.
         * @return 1 if source is longer (must upsample), 0 if equal,
         *         -1 if source is shorter (must downsample).
         */
        int up_or_down(Frequency source, Frequency target);

        /**
         * @brief True for frequencies shorter than a day.
         */
        bool is_subdaily(Frequency freq);

        /**
         * @brief Timestamp of the start of the period following the one starting at ts.
         */
        Timestamp next_stamp(Timestamp ts, Frequency freq);

        /**
         * @brief Start of the period of frequency freq that contains ts.
         * @param start_of_day Offset of the delivery day from midnight.
         */
        Timestamp floor_stamp(Timestamp ts, Frequency freq, Minutes start_of_day);

        /**
         * @brief Start of the first period of frequency freq that starts at or after ts.
         */
        Timestamp ceil_stamp(Timestamp ts, Frequency freq, Minutes start_of_day);

        /**
         * @brief True if ts is the start of a period of frequency freq.
         */
        bool is_boundary(Timestamp ts, Frequency freq, Minutes start_of_day);

    } // namespace tools
} // namespace powerfolio

#endif // POWERFOLIO_TOOLS_FREQUENCY_HPP
