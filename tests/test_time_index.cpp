/**
 * @file test_time_index.cpp
 * @brief Unit tests for TimeIndex and Series
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "errors.hpp"
#include "tools/series.hpp"
#include "tools/time_index.hpp"

#include <cmath>

using namespace powerfolio;
using namespace powerfolio::tools;

TEST_CASE("TimeIndex construction", "[TimeIndex]")
{
    SECTION("Happy path: quarters of 2023")
    {
        TimeIndex idx(parse_timestamp("2023-01-01"), 4, Frequency::QUARTER);
        REQUIRE(idx.size() == 4);
        REQUIRE(idx.start() == make_timestamp(2023, 1, 1));
        REQUIRE(idx.end() == make_timestamp(2024, 1, 1));
        REQUIRE(idx.stamp(2) == make_timestamp(2023, 7, 1));
        REQUIRE(idx.right(2) == make_timestamp(2023, 10, 1));

        Eigen::VectorXd hours = idx.duration_hours();
        REQUIRE(hours(0) == Catch::Approx(2160.0));
        REQUIRE(hours(1) == Catch::Approx(2184.0));
        REQUIRE(hours(2) == Catch::Approx(2208.0));
        REQUIRE(hours(3) == Catch::Approx(2208.0));
    }

    SECTION("Happy path: from range with start-of-day")
    {
        TimeIndex idx = TimeIndex::from_range(make_timestamp(2023, 1, 1, 6), make_timestamp(2023, 2, 1, 6),
                                              Frequency::DAY, Minutes(360), "Europe/Berlin");
        REQUIRE(idx.size() == 31);
        REQUIRE(idx.start_of_day() == Minutes(360));
        REQUIRE(idx.tz() == "Europe/Berlin");
    }

    SECTION("Edge case: empty index")
    {
        TimeIndex idx(parse_timestamp("2023-01-01"), 0, Frequency::HOUR);
        REQUIRE(idx.empty());
        REQUIRE(idx.start() == idx.end());
    }

    SECTION("Error: start not on the frequency grid")
    {
        REQUIRE_THROWS_AS(TimeIndex(make_timestamp(2023, 2, 1), 2, Frequency::QUARTER), IndexError);
        REQUIRE_THROWS_AS(TimeIndex(make_timestamp(2023, 1, 1), 2, Frequency::DAY, Minutes(360)), IndexError);
        REQUIRE_THROWS_AS(TimeIndex(make_timestamp(2023, 1, 1, 0, 10), 2, Frequency::QUARTERHOUR), IndexError);
    }

    SECTION("Error: invalid start-of-day")
    {
        REQUIRE_THROWS_AS(TimeIndex(make_timestamp(2023, 1, 1), 2, Frequency::DAY, Minutes(24 * 60)), IndexError);
        REQUIRE_THROWS_AS(TimeIndex(make_timestamp(2023, 1, 1), 2, Frequency::DAY, Minutes(-60)), IndexError);
    }

    SECTION("Error: position out of range")
    {
        TimeIndex idx(parse_timestamp("2023-01-01"), 3, Frequency::DAY);
        REQUIRE_THROWS_AS(idx.stamp(3), IndexError);
        REQUIRE_THROWS_AS(idx.right(3), IndexError);
    }
}

TEST_CASE("TimeIndex sub-indices", "[TimeIndex]")
{
    TimeIndex months(parse_timestamp("2023-01-01"), 12, Frequency::MONTH);

    SECTION("Slice")
    {
        TimeIndex q2 = months.slice(3, 3);
        REQUIRE(q2.start() == make_timestamp(2023, 4, 1));
        REQUIRE(q2.end() == make_timestamp(2023, 7, 1));
        REQUIRE_THROWS_AS(months.slice(10, 3), IndexError);
    }

    SECTION("Loc keeps only periods that lie entirely within the range")
    {
        TimeIndex sub = months.loc(make_timestamp(2023, 3, 15), make_timestamp(2023, 8, 1));
        REQUIRE(sub.start() == make_timestamp(2023, 4, 1));
        REQUIRE(sub.end() == make_timestamp(2023, 8, 1));
        REQUIRE(sub.size() == 4);
    }

    SECTION("Loc beyond the index is clipped")
    {
        TimeIndex sub = months.loc(make_timestamp(2022, 1, 1), make_timestamp(2030, 1, 1));
        REQUIRE(sub == months);
    }

    SECTION("Position")
    {
        REQUIRE(months.position(make_timestamp(2023, 5, 1)) == 4u);
        REQUIRE_FALSE(months.position(make_timestamp(2023, 5, 2)).has_value());
        REQUIRE_FALSE(months.position(make_timestamp(2024, 1, 1)).has_value());
    }

    SECTION("Intersection")
    {
        TimeIndex later(parse_timestamp("2023-07-01"), 12, Frequency::MONTH);
        TimeIndex common = months.intersect(later);
        REQUIRE(common.start() == make_timestamp(2023, 7, 1));
        REQUIRE(common.size() == 6);

        TimeIndex disjoint(parse_timestamp("2025-01-01"), 2, Frequency::MONTH);
        REQUIRE(months.intersect(disjoint).empty());
    }

    SECTION("Error: intersecting incompatible indices")
    {
        TimeIndex days(parse_timestamp("2023-01-01"), 10, Frequency::DAY);
        TimeIndex other_tz(parse_timestamp("2023-01-01"), 12, Frequency::MONTH, Minutes(0), "Europe/Berlin");
        REQUIRE_FALSE(months.is_compatible(days));
        REQUIRE_THROWS_AS(months.intersect(days), IndexError);
        REQUIRE_THROWS_AS(months.intersect(other_tz), IndexError);
    }
}

TEST_CASE("Series", "[Series]")
{
    TimeIndex idx(parse_timestamp("2023-01-01"), 4, Frequency::QUARTER);
    Eigen::VectorXd v(4);
    v << 1.0, 2.0, 3.0, 4.0;

    SECTION("Happy path: access by position and timestamp")
    {
        Series s(idx, v, "MWh");
        REQUIRE(s.size() == 4);
        REQUIRE(s[1] == Catch::Approx(2.0));
        REQUIRE(s.at(make_timestamp(2023, 7, 1)) == Catch::Approx(3.0));
        REQUIRE(s.unit() == std::optional<std::string>("MWh"));
        REQUIRE_THROWS_AS(s.at(make_timestamp(2023, 7, 2)), KeyError);
    }

    SECTION("Reindex and loc")
    {
        Series s(idx, v);
        Series h2 = s.loc(make_timestamp(2023, 7, 1), make_timestamp(2024, 1, 1));
        REQUIRE(h2.size() == 2);
        REQUIRE(h2[0] == Catch::Approx(3.0));

        TimeIndex outside(parse_timestamp("2024-01-01"), 1, Frequency::QUARTER);
        REQUIRE_THROWS_AS(s.reindex(outside), IndexError);
    }

    SECTION("Approximate equality treats NaN as equal")
    {
        Eigen::VectorXd a(2), b(2);
        a << 1.0, std::nan("");
        b << 1.0 + 1e-12, std::nan("");
        REQUIRE(all_close(a, b));
        b(1) = 0.0;
        REQUIRE_FALSE(all_close(a, b));
    }

    SECTION("Error: size mismatch")
    {
        REQUIRE_THROWS_AS(Series(idx, Eigen::VectorXd::Zero(3)), IndexError);
    }
}
