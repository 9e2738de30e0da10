/**
 * @file test_pfline_asfreq.cpp
 * @brief Unit tests for resampling portfolio lines
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/pfline.hpp"
#include "errors.hpp"

#include <cmath>

using namespace powerfolio;
using namespace powerfolio::core;
using Catch::Matchers::WithinAbs;
using powerfolio::tools::Frequency;
using powerfolio::tools::TimeIndex;

// Quarters of 2023 with prices of 37.77, 25.30, 21.30, 30.80 Eur/MWh and energies
// of 300, 180, 200, 320 MWh.
class QuarterlyLineFixture
{
protected:
    TimeIndex quarters_;
    Eigen::VectorXd q_;
    Eigen::VectorXd p_;

    QuarterlyLineFixture()
        : quarters_(tools::parse_timestamp("2023-01-01"), 4, Frequency::QUARTER),
          q_(4),
          p_(4)
    {
        q_ << 300.0, 180.0, 200.0, 320.0;
        p_ << 37.77, 25.30, 21.30, 30.80;
    }

    PfLine complete() const
    {
        return PfLine::flat_complete(quarters_, q_, p_, q_.cwiseProduct(p_));
    }
};

TEST_CASE_METHOD(QuarterlyLineFixture, "Downsampling portfolio lines", "[PfLine][Resample]")
{
    SECTION("Volumes are summed")
    {
        PfLine year = PfLine::flat_volume(quarters_, q_).asfreq(Frequency::YEAR);
        REQUIRE(year.index().size() == 1);
        REQUIRE(year.q()[0] == Catch::Approx(1000.0));
        REQUIRE(year.w()[0] == Catch::Approx(1000.0 / 8760.0));
    }

    SECTION("Prices are weighted with duration")
    {
        PfLine year = PfLine::flat_price(quarters_, p_).asfreq(Frequency::YEAR);
        REQUIRE_THAT(year.p()[0], WithinAbs(28.7529, 0.001));
    }

    SECTION("Complete lines weight prices with energy")
    {
        PfLine year = complete().asfreq(Frequency::YEAR);
        REQUIRE(year.kind() == Kind::COMPLETE);
        REQUIRE(year.q()[0] == Catch::Approx(1000.0));
        REQUIRE_THAT(year.p()[0], WithinAbs(30.0, 0.01));
        REQUIRE(year.r()[0] == Catch::Approx(year.p()[0] * year.q()[0]));
    }

    SECTION("Complete price is revenue over energy")
    {
        PfLine year = complete().asfreq(Frequency::YEAR);
        REQUIRE(year.p()[0] == year.r()[0] / year.q()[0]);
    }

    SECTION("Complete price without net energy")
    {
        Eigen::VectorXd q(4);
        q << 100.0, -100.0, 100.0, -100.0;
        Eigen::VectorXd p = Eigen::VectorXd::Constant(4, 30.0);
        PfLine netted = PfLine::flat_complete(quarters_, q, p, q * 30.0).asfreq(Frequency::YEAR);
        REQUIRE(netted.q()[0] == 0.0);
        REQUIRE(netted.r()[0] == 0.0);
        REQUIRE(netted.p()[0] == Catch::Approx(30.0));

        Eigen::VectorXd zero = Eigen::VectorXd::Zero(4);
        PfLine idle = PfLine::flat_complete(quarters_, zero, p_, zero).asfreq(Frequency::YEAR);
        REQUIRE(std::isnan(idle.p()[0]));
    }

    SECTION("Revenues are summed")
    {
        PfLine year = complete().revenue().asfreq(Frequency::YEAR);
        REQUIRE(year.kind() == Kind::REVENUE);
        REQUIRE(year.r()[0] == Catch::Approx(complete().r().values().sum()));
    }

    SECTION("Same frequency returns an equal line")
    {
        REQUIRE(complete().asfreq(Frequency::QUARTER) == complete());
    }
}

TEST_CASE_METHOD(QuarterlyLineFixture, "Upsampling portfolio lines", "[PfLine][Resample]")
{
    SECTION("Volume is spread by duration")
    {
        PfLine months = PfLine::flat_volume(quarters_, q_).asfreq(Frequency::MONTH);
        REQUIRE(months.index().size() == 12);
        REQUIRE(months.q()[0] == Catch::Approx(300.0 * 744.0 / 2160.0));
        REQUIRE(months.w()[0] == Catch::Approx(months.w()[2]));
        REQUIRE(months.asfreq(Frequency::QUARTER).q()[0] == Catch::Approx(300.0));
    }

    SECTION("Complete lines keep their price")
    {
        PfLine months = complete().asfreq(Frequency::MONTH);
        REQUIRE(months.p()[4] == Catch::Approx(25.30));
        REQUIRE(months.r()[4] == Catch::Approx(months.p()[4] * months.q()[4]));
        REQUIRE(months.asfreq(Frequency::QUARTER) == complete());
    }
}

TEST_CASE_METHOD(QuarterlyLineFixture, "Resampling nested lines", "[PfLine][Resample][Children]")
{
    PfLine other = PfLine::flat_complete(quarters_, Eigen::VectorXd::Constant(4, 100.0),
                                         Eigen::VectorXd::Constant(4, 50.0), Eigen::VectorXd::Constant(4, 5000.0));
    PfLine tree = PfLine::nested({{"forward", complete()}, {"spot", other}});

    SECTION("Children are resampled and the aggregate rebuilt")
    {
        PfLine year = tree.asfreq(Frequency::YEAR);
        REQUIRE(year.is_nested());
        REQUIRE(year.child("spot").q()[0] == Catch::Approx(400.0));
        REQUIRE(year.q()[0] == Catch::Approx(1400.0));
        REQUIRE(year.p()[0] == Catch::Approx(tree.flatten().asfreq(Frequency::YEAR).p()[0]));
    }

    SECTION("Resampling commutes with flattening")
    {
        REQUIRE(tree.asfreq(Frequency::MONTH).flatten() == tree.flatten().asfreq(Frequency::MONTH));
    }
}

TEST_CASE("Resampling partial periods", "[PfLine][Resample]")
{
    SECTION("Incomplete months are dropped")
    {
        TimeIndex days = TimeIndex::from_range(tools::parse_timestamp("2024-01-15"), tools::parse_timestamp("2024-04-10"),
                                               Frequency::DAY);
        PfLine line = PfLine::flat_volume(days, Eigen::VectorXd::Ones(static_cast<Eigen::Index>(days.size())));
        PfLine months = line.asfreq(Frequency::MONTH);
        REQUIRE(months.index().size() == 2);
        REQUIRE(months.q()[0] == Catch::Approx(29.0));
    }

    SECTION("Error: no complete period")
    {
        TimeIndex days(tools::parse_timestamp("2024-01-15"), 10, Frequency::DAY);
        PfLine line = PfLine::flat_volume(days, Eigen::VectorXd::Ones(10));
        REQUIRE_THROWS_AS(line.asfreq(Frequency::MONTH), IndexError);
    }
}
