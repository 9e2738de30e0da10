/**
 * @file calendar.cpp
 * @brief Implementation of the calendar helpers.
 */

#include "tools/calendar.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace powerfolio
{
    namespace tools
    {

        namespace
        {
            constexpr long long MINUTES_PER_DAY = 24 * 60;

            long long floor_div(long long a, long long b)
            {
                long long q = a / b;
                if ((a % b != 0) && ((a < 0) != (b < 0)))
                {
                    --q;
                }
                return q;
            }

            int parse_digits(const std::string &text, size_t pos, size_t count)
            {
                if (pos + count > text.size())
                {
                    throw std::invalid_argument("Timestamp too short: '" + text + "'");
                }
                int value = 0;
                for (size_t i = pos; i < pos + count; ++i)
                {
                    if (!std::isdigit(static_cast<unsigned char>(text[i])))
                    {
                        throw std::invalid_argument("Expected digit in timestamp: '" + text + "'");
                    }
                    value = value * 10 + (text[i] - '0');
                }
                return value;
            }
        }

        long long days_from_civil(int year, unsigned month, unsigned day)
        {
            long long y = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
            const long long era = floor_div(y, 400);
            const long long yoe = y - era * 400;                                          // [0, 399]
            const long long mp = (static_cast<long long>(month) + 9) % 12;                // March = 0
            const long long doy = (153 * mp + 2) / 5 + static_cast<long long>(day) - 1;   // [0, 365]
            const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;                  // [0, 146096]
            return era * 146097 + doe - 719468;
        }

        bool is_leap_year(int year)
        {
            return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        }

        unsigned days_in_month(int year, unsigned month)
        {
            static const unsigned days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month < 1 || month > 12)
            {
                throw std::invalid_argument("Month out of range: " + std::to_string(month));
            }
            if (month == 2 && is_leap_year(year))
            {
                return 29;
            }
            return days[month - 1];
        }

        Timestamp make_timestamp(int year, unsigned month, unsigned day, int hour, int minute)
        {
            if (month < 1 || month > 12)
            {
                throw std::invalid_argument("Month out of range: " + std::to_string(month));
            }
            if (day < 1 || day > days_in_month(year, month))
            {
                throw std::invalid_argument("Day out of range: " + std::to_string(day));
            }
            if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
            {
                throw std::invalid_argument("Time of day out of range");
            }
            long long minutes = days_from_civil(year, month, day) * MINUTES_PER_DAY + hour * 60 + minute;
            return Timestamp(Minutes(minutes));
        }

        CivilTime to_civil(Timestamp ts)
        {
            const long long total = ts.time_since_epoch().count();
            const long long days = floor_div(total, MINUTES_PER_DAY);
            const long long tod = total - days * MINUTES_PER_DAY;

            // civil-from-days
            const long long z = days + 719468;
            const long long era = floor_div(z, 146097);
            const long long doe = z - era * 146097;
            const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const long long mp = (5 * doy + 2) / 153;
            const long long d = doy - (153 * mp + 2) / 5 + 1;
            const long long m = mp < 10 ? mp + 3 : mp - 9;
            const long long y = yoe + era * 400 + (m <= 2 ? 1 : 0);

            CivilTime civil;
            civil.year = static_cast<int>(y);
            civil.month = static_cast<unsigned>(m);
            civil.day = static_cast<unsigned>(d);
            civil.hour = static_cast<int>(tod / 60);
            civil.minute = static_cast<int>(tod % 60);
            return civil;
        }

        Minutes time_of_day(Timestamp ts)
        {
            const long long total = ts.time_since_epoch().count();
            return Minutes(total - floor_div(total, MINUTES_PER_DAY) * MINUTES_PER_DAY);
        }

        Timestamp midnight(Timestamp ts)
        {
            return ts - time_of_day(ts);
        }

        Timestamp add_months(Timestamp ts, int months)
        {
            CivilTime c = to_civil(ts);
            long long index = static_cast<long long>(c.year) * 12 + (c.month - 1) + months;
            int year = static_cast<int>(floor_div(index, 12));
            unsigned month = static_cast<unsigned>(index - static_cast<long long>(year) * 12 + 1);
            unsigned day = std::min(c.day, days_in_month(year, month));
            return make_timestamp(year, month, day, c.hour, c.minute);
        }

        Timestamp parse_timestamp(const std::string &text)
        {
            if (text.size() < 10 || text[4] != '-' || text[7] != '-')
            {
                throw std::invalid_argument("Expected timestamp as YYYY-MM-DD[ HH:MM], got: '" + text + "'");
            }
            int year = parse_digits(text, 0, 4);
            int month = parse_digits(text, 5, 2);
            int day = parse_digits(text, 8, 2);
            int hour = 0;
            int minute = 0;
            if (text.size() > 10)
            {
                if ((text[10] != ' ' && text[10] != 'T') || text.size() < 16 || text[13] != ':')
                {
                    throw std::invalid_argument("Expected timestamp as YYYY-MM-DD[ HH:MM], got: '" + text + "'");
                }
                hour = parse_digits(text, 11, 2);
                minute = parse_digits(text, 14, 2);
            }
            return make_timestamp(year, static_cast<unsigned>(month), static_cast<unsigned>(day), hour, minute);
        }

        std::string format_timestamp(Timestamp ts)
        {
            CivilTime c = to_civil(ts);
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u %02d:%02d",
                          c.year, c.month, c.day, c.hour, c.minute);
            return std::string(buffer);
        }

    } // namespace tools
} // namespace powerfolio
