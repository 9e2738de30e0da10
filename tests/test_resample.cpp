/**
 * @file test_resample.cpp
 * @brief Unit tests for the resampling engine
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "errors.hpp"
#include "tools/resample.hpp"

#include <cmath>

using namespace powerfolio;
using namespace powerfolio::tools;
using Catch::Matchers::WithinAbs;

// Quarters of a non-leap year with prices that differ strongly between quarters
class QuarterlyFixture
{
protected:
    TimeIndex quarters_;
    Series prices_;
    Series energies_;

    QuarterlyFixture()
        : quarters_(parse_timestamp("2023-01-01"), 4, Frequency::QUARTER),
          prices_(quarters_, values({37.77, 25.30, 21.30, 30.80}), "Eur/MWh"),
          energies_(quarters_, values({300.0, 180.0, 200.0, 320.0}), "MWh")
    {
    }

    static Eigen::VectorXd values(std::initializer_list<double> list)
    {
        Eigen::VectorXd v(static_cast<Eigen::Index>(list.size()));
        Eigen::Index i = 0;
        for (double x : list)
            v(i++) = x;
        return v;
    }
};

TEST_CASE_METHOD(QuarterlyFixture, "Price weighting", "[Resample]")
{
    SECTION("Energy-weighted price differs from duration-weighted price")
    {
        Series weighted = resample::weighted(prices_, energies_, Frequency::YEAR);
        Series plain = resample::averagable(prices_, Frequency::YEAR);

        REQUIRE(weighted.size() == 1);
        REQUIRE(weighted[0] == Catch::Approx(30.0).margin(0.01));
        REQUIRE(plain[0] == Catch::Approx(28.7529).margin(0.001));
        REQUIRE(std::abs(weighted[0] - plain[0]) > 1.0);
    }

    SECTION("Upsampling copies prices")
    {
        Series monthly = resample::averagable(prices_, Frequency::MONTH);
        REQUIRE(monthly.size() == 12);
        REQUIRE(monthly[0] == Catch::Approx(37.77));
        REQUIRE(monthly[2] == Catch::Approx(37.77));
        REQUIRE(monthly[3] == Catch::Approx(25.30));
        REQUIRE(monthly.unit() == prices_.unit());
    }

    SECTION("Weights summing to zero")
    {
        Series zero = Series::constant(quarters_, 0.0, "MWh");
        Series flat = Series::constant(quarters_, 42.0, "Eur/MWh");
        REQUIRE(resample::weighted(flat, zero, Frequency::YEAR)[0] == Catch::Approx(42.0));
        REQUIRE(std::isnan(resample::weighted(prices_, zero, Frequency::YEAR)[0]));
    }

    SECTION("Error: values and weights on different indices")
    {
        Series short_energies = energies_.reindex(quarters_.slice(0, 2));
        REQUIRE_THROWS_AS(resample::weighted(prices_, short_energies, Frequency::YEAR), IndexError);
    }
}

TEST_CASE_METHOD(QuarterlyFixture, "Summable resampling", "[Resample]")
{
    SECTION("Downsampling sums")
    {
        Series yearly = resample::summable(energies_, Frequency::YEAR);
        REQUIRE(yearly.size() == 1);
        REQUIRE(yearly[0] == Catch::Approx(1000.0));
        REQUIRE(yearly.index().start() == make_timestamp(2023, 1, 1));
    }

    SECTION("Upsampling distributes by duration")
    {
        Series yearly = resample::summable(energies_, Frequency::YEAR);
        Series back = resample::summable(yearly, Frequency::QUARTER);
        REQUIRE(back[0] == Catch::Approx(1000.0 * 2160.0 / 8760.0));
        REQUIRE(back[1] == Catch::Approx(1000.0 * 2184.0 / 8760.0));
        REQUIRE_THAT(back.values().sum(), WithinAbs(1000.0, 1e-9));
    }

    SECTION("Round trip over unequal quarters")
    {
        Series monthly = resample::summable(energies_, Frequency::MONTH);
        Series back = resample::summable(monthly, Frequency::QUARTER);
        REQUIRE(back.approx_equal(energies_));

        // January holds 31 of the 90 days of Q1.
        REQUIRE(monthly[0] == Catch::Approx(300.0 * 31.0 / 90.0));
    }

    SECTION("Same frequency is a no-op")
    {
        REQUIRE(resample::general(resample::Semantic::SUMMABLE, energies_, Frequency::QUARTER).approx_equal(energies_));
    }
}

TEST_CASE("Incomplete periods are trimmed", "[Resample]")
{
    SECTION("Partial months at both ends are dropped")
    {
        TimeIndex days = TimeIndex::from_range(make_timestamp(2023, 1, 15), make_timestamp(2023, 4, 10), Frequency::DAY);
        Series q = Series::constant(days, 24.0, "MWh");
        Series monthly = resample::summable(q, Frequency::MONTH);

        REQUIRE(monthly.size() == 2);
        REQUIRE(monthly.index().start() == make_timestamp(2023, 2, 1));
        REQUIRE(monthly[0] == Catch::Approx(28 * 24.0));
        REQUIRE(monthly[1] == Catch::Approx(31 * 24.0));
    }

    SECTION("Duration-weighted average of the trimmed part")
    {
        TimeIndex days = TimeIndex::from_range(make_timestamp(2023, 1, 30), make_timestamp(2023, 3, 1), Frequency::DAY);
        Eigen::VectorXd v = Eigen::VectorXd::LinSpaced(static_cast<Eigen::Index>(days.size()), 1.0, 30.0);
        Series p(days, v);
        Series monthly = resample::averagable(p, Frequency::MONTH);

        REQUIRE(monthly.size() == 1);
        // Days Feb 1..28 carry the values 3..30.
        REQUIRE(monthly[0] == Catch::Approx(16.5));
    }

    SECTION("Error: no complete target period")
    {
        TimeIndex days = TimeIndex::from_range(make_timestamp(2023, 1, 5), make_timestamp(2023, 1, 20), Frequency::DAY);
        Series q = Series::constant(days, 1.0);
        REQUIRE_THROWS_AS(resample::summable(q, Frequency::MONTH), IndexError);
        REQUIRE_THROWS_AS(resample::index(days, Frequency::MONTH), IndexError);
    }
}

TEST_CASE("Start-of-day is carried through resampling", "[Resample]")
{
    const Minutes six_am(6 * 60);

    SECTION("Hours to gas days")
    {
        TimeIndex hours(make_timestamp(2023, 1, 1, 6), 48, Frequency::HOUR, six_am);
        Series q = Series::constant(hours, 2.0);
        Series daily = resample::summable(q, Frequency::DAY);

        REQUIRE(daily.size() == 2);
        REQUIRE(daily.index().start() == make_timestamp(2023, 1, 1, 6));
        REQUIRE(daily.index().start_of_day() == six_am);
        REQUIRE(daily[0] == Catch::Approx(48.0));
    }

    SECTION("Months to quarter-hours and back")
    {
        TimeIndex months(make_timestamp(2023, 1, 1, 6), 1, Frequency::MONTH, six_am, "Europe/Berlin");
        Series w = Series::constant(months, 10.0, "MW");
        Series qh = resample::averagable(w, Frequency::QUARTERHOUR);

        REQUIRE(qh.size() == 31 * 96);
        REQUIRE(qh.index().start() == make_timestamp(2023, 1, 1, 6));
        REQUIRE(qh.index().tz() == "Europe/Berlin");
        REQUIRE(resample::averagable(qh, Frequency::MONTH).approx_equal(w));
    }
}
