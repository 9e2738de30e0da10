/**
 * @file test_calendar.cpp
 * @brief Unit tests for civil-date helpers and frequencies
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "tools/calendar.hpp"
#include "tools/frequency.hpp"

#include <stdexcept>

using namespace powerfolio::tools;

TEST_CASE("Civil date arithmetic", "[Calendar]")
{
    SECTION("Epoch and known dates")
    {
        REQUIRE(days_from_civil(1970, 1, 1) == 0);
        REQUIRE(days_from_civil(1970, 1, 2) == 1);
        REQUIRE(days_from_civil(2000, 3, 1) == 11017);
        REQUIRE(days_from_civil(1969, 12, 31) == -1);
    }

    SECTION("Leap years")
    {
        REQUIRE(is_leap_year(2000));
        REQUIRE(is_leap_year(2024));
        REQUIRE_FALSE(is_leap_year(1900));
        REQUIRE_FALSE(is_leap_year(2023));
        REQUIRE(days_in_month(2023, 2) == 28);
        REQUIRE(days_in_month(2024, 2) == 29);
        REQUIRE(days_in_month(2024, 4) == 30);
    }

    SECTION("Round trip through civil time")
    {
        Timestamp ts = make_timestamp(2024, 2, 29, 6, 15);
        CivilTime c = to_civil(ts);
        REQUIRE(c.year == 2024);
        REQUIRE(c.month == 2);
        REQUIRE(c.day == 29);
        REQUIRE(c.hour == 6);
        REQUIRE(c.minute == 15);
        REQUIRE(time_of_day(ts) == Minutes(6 * 60 + 15));
        REQUIRE(midnight(ts) == make_timestamp(2024, 2, 29));
    }

    SECTION("Adding months keeps time of day and clamps the day")
    {
        REQUIRE(add_months(make_timestamp(2023, 11, 1, 6), 3) == make_timestamp(2024, 2, 1, 6));
        REQUIRE(add_months(make_timestamp(2024, 1, 31), 1) == make_timestamp(2024, 2, 29));
        REQUIRE(add_months(make_timestamp(2024, 1, 1), -1) == make_timestamp(2023, 12, 1));
    }

    SECTION("Error: invalid dates")
    {
        REQUIRE_THROWS_AS(make_timestamp(2023, 2, 29), std::invalid_argument);
        REQUIRE_THROWS_AS(make_timestamp(2023, 13, 1), std::invalid_argument);
        REQUIRE_THROWS_AS(make_timestamp(2023, 1, 1, 24), std::invalid_argument);
    }
}

TEST_CASE("Timestamp parsing and formatting", "[Calendar]")
{
    SECTION("Date only")
    {
        REQUIRE(parse_timestamp("2023-04-01") == make_timestamp(2023, 4, 1));
    }

    SECTION("Date and time, space or T separator")
    {
        REQUIRE(parse_timestamp("2023-04-01 06:00") == make_timestamp(2023, 4, 1, 6));
        REQUIRE(parse_timestamp("2023-04-01T06:30") == make_timestamp(2023, 4, 1, 6, 30));
    }

    SECTION("Format")
    {
        REQUIRE(format_timestamp(make_timestamp(2023, 4, 1, 6)) == "2023-04-01 06:00");
    }

    SECTION("Error: malformed text")
    {
        REQUIRE_THROWS_AS(parse_timestamp("2023/04/01"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_timestamp("2023-04-0x"), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_timestamp("2023-04-01 6"), std::invalid_argument);
    }
}

TEST_CASE("Frequencies", "[Calendar][Frequency]")
{
    SECTION("Parse codes and long names")
    {
        REQUIRE(parse_frequency("15T") == Frequency::QUARTERHOUR);
        REQUIRE(parse_frequency("H") == Frequency::HOUR);
        REQUIRE(parse_frequency("D") == Frequency::DAY);
        REQUIRE(parse_frequency("MS") == Frequency::MONTH);
        REQUIRE(parse_frequency("QS") == Frequency::QUARTER);
        REQUIRE(parse_frequency("AS") == Frequency::YEAR);
        REQUIRE(parse_frequency("Monthly") == Frequency::MONTH);
        REQUIRE_THROWS_AS(parse_frequency("W"), std::invalid_argument);
        REQUIRE_THROWS_WITH(parse_frequency("W"), Catch::Matchers::ContainsSubstring("15T, H, D, MS, QS, AS"));
    }

    SECTION("Codes round trip")
    {
        for (Frequency f : all_frequencies())
        {
            REQUIRE(parse_frequency(to_string(f)) == f);
        }
    }

    SECTION("Up or down")
    {
        REQUIRE(up_or_down(Frequency::YEAR, Frequency::MONTH) == 1);
        REQUIRE(up_or_down(Frequency::HOUR, Frequency::DAY) == -1);
        REQUIRE(up_or_down(Frequency::QUARTER, Frequency::QUARTER) == 0);
    }

    SECTION("Period boundaries with a start-of-day offset")
    {
        const Minutes six_am(6 * 60);
        Timestamp ts = make_timestamp(2023, 5, 1, 3);

        // 03:00 on May 1 still belongs to the gas day of April 30.
        REQUIRE(floor_stamp(ts, Frequency::DAY, six_am) == make_timestamp(2023, 4, 30, 6));
        REQUIRE(floor_stamp(ts, Frequency::MONTH, six_am) == make_timestamp(2023, 4, 1, 6));
        REQUIRE(floor_stamp(ts, Frequency::QUARTER, six_am) == make_timestamp(2023, 4, 1, 6));
        REQUIRE(floor_stamp(ts, Frequency::YEAR, six_am) == make_timestamp(2023, 1, 1, 6));
        REQUIRE(ceil_stamp(ts, Frequency::MONTH, six_am) == make_timestamp(2023, 5, 1, 6));

        REQUIRE(is_boundary(make_timestamp(2023, 7, 1, 6), Frequency::QUARTER, six_am));
        REQUIRE_FALSE(is_boundary(make_timestamp(2023, 7, 1), Frequency::QUARTER, six_am));
    }

    SECTION("Next stamp")
    {
        REQUIRE(next_stamp(make_timestamp(2023, 1, 1), Frequency::QUARTERHOUR) == make_timestamp(2023, 1, 1, 0, 15));
        REQUIRE(next_stamp(make_timestamp(2023, 12, 1), Frequency::MONTH) == make_timestamp(2024, 1, 1));
        REQUIRE(next_stamp(make_timestamp(2023, 10, 1), Frequency::QUARTER) == make_timestamp(2024, 1, 1));
    }
}
