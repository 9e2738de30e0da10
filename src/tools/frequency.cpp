/**
 * @file frequency.cpp
 * @brief Implementation of frequency helpers.
 */

#include "tools/frequency.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace powerfolio
{
    namespace tools
    {

        namespace
        {
            std::string to_lower(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return s;
            }

            long long floor_mod(long long a, long long b)
            {
                long long r = a % b;
                return r < 0 ? r + b : r;
            }

            Minutes fixed_length(Frequency freq)
            {
                switch (freq)
                {
                case Frequency::QUARTERHOUR:
                    return Minutes(15);
                case Frequency::HOUR:
                    return Minutes(60);
                case Frequency::DAY:
                    return Minutes(24 * 60);
                default:
                    return Minutes(0);
                }
            }

            int months_per_period(Frequency freq)
            {
                switch (freq)
                {
                case Frequency::MONTH:
                    return 1;
                case Frequency::QUARTER:
                    return 3;
                case Frequency::YEAR:
                    return 12;
                default:
                    return 0;
                }
            }
        }

        const std::vector<Frequency> &all_frequencies()
        {
            static const std::vector<Frequency> frequencies = {
                Frequency::QUARTERHOUR, Frequency::HOUR, Frequency::DAY,
                Frequency::MONTH, Frequency::QUARTER, Frequency::YEAR};
            return frequencies;
        }

        Frequency parse_frequency(const std::string &code)
        {
            for (Frequency freq : all_frequencies())
            {
                if (code == to_string(freq))
                    return freq;
            }
            if (code == "15min")
                return Frequency::QUARTERHOUR;
            if (code == "h")
                return Frequency::HOUR;
            if (code == "YS")
                return Frequency::YEAR;

            auto s = to_lower(code);
            if (s == "quarterhour" || s == "quarterhourly")
                return Frequency::QUARTERHOUR;
            if (s == "hour" || s == "hourly")
                return Frequency::HOUR;
            if (s == "day" || s == "daily")
                return Frequency::DAY;
            if (s == "month" || s == "monthly")
                return Frequency::MONTH;
            if (s == "quarter" || s == "quarterly")
                return Frequency::QUARTER;
            if (s == "year" || s == "yearly" || s == "annual")
                return Frequency::YEAR;
            std::string known;
            for (Frequency freq : all_frequencies())
            {
                known += (known.empty() ? "" : ", ") + to_string(freq);
            }
            throw std::invalid_argument("Unknown frequency: " + code + " (expected one of " + known + ")");
        }

        std::string to_string(Frequency freq)
        {
            switch (freq)
            {
            case Frequency::QUARTERHOUR:
                return "15T";
            case Frequency::HOUR:
                return "H";
            case Frequency::DAY:
                return "D";
            case Frequency::MONTH:
                return "MS";
            case Frequency::QUARTER:
                return "QS";
            case Frequency::YEAR:
                return "AS";
            }
            return "?";
        }

        int up_or_down(Frequency source, Frequency target)
        {
            if (source == target)
            {
                return 0;
            }
            return static_cast<int>(source) > static_cast<int>(target) ? 1 : -1;
        }

        bool is_subdaily(Frequency freq)
        {
            return freq == Frequency::QUARTERHOUR || freq == Frequency::HOUR;
        }

        Timestamp next_stamp(Timestamp ts, Frequency freq)
        {
            int months = months_per_period(freq);
            if (months > 0)
            {
                return add_months(ts, months);
            }
            return ts + fixed_length(freq);
        }

        Timestamp floor_stamp(Timestamp ts, Frequency freq, Minutes start_of_day)
        {
            if (is_subdaily(freq))
            {
                const long long step = fixed_length(freq).count();
                const long long offset = floor_mod(start_of_day.count(), step);
                const long long t = ts.time_since_epoch().count();
                return Timestamp(Minutes(t - floor_mod(t - offset, step)));
            }

            // Calendar date of the delivery day that contains ts.
            Timestamp day = midnight(ts - start_of_day);
            if (freq == Frequency::DAY)
            {
                return day + start_of_day;
            }

            CivilTime c = to_civil(day);
            unsigned month = c.month;
            if (freq == Frequency::QUARTER)
            {
                month = ((c.month - 1) / 3) * 3 + 1;
            }
            else if (freq == Frequency::YEAR)
            {
                month = 1;
            }
            return make_timestamp(c.year, month, 1) + start_of_day;
        }

        Timestamp ceil_stamp(Timestamp ts, Frequency freq, Minutes start_of_day)
        {
            Timestamp floored = floor_stamp(ts, freq, start_of_day);
            return floored == ts ? ts : next_stamp(floored, freq);
        }

        bool is_boundary(Timestamp ts, Frequency freq, Minutes start_of_day)
        {
            return floor_stamp(ts, freq, start_of_day) == ts;
        }

    } // namespace tools
} // namespace powerfolio
