/**
 * @file test_pfstate.cpp
 * @brief Unit tests for PfState
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/arithmetic.hpp"
#include "core/concat.hpp"
#include "core/pfstate.hpp"
#include "errors.hpp"

#include <cmath>
#include <memory>

using namespace powerfolio;
using namespace powerfolio::core;
using Catch::Matchers::WithinAbs;
using powerfolio::tools::Frequency;
using powerfolio::tools::HedgeMethod;
using powerfolio::tools::TimeIndex;

// January 2024 in days: offtake of 10 MW, 4 MW sourced at 80 Eur/MWh, market
// price of 100 Eur/MWh for 15 days and 50 Eur/MWh after.
class StateFixture
{
protected:
    TimeIndex days_;
    PfLine offtake_;
    PfLine prices_;
    PfLine sourced_;

    StateFixture()
        : days_(tools::parse_timestamp("2024-01-01"), 31, Frequency::DAY),
          offtake_(PfLine::flat_volume(days_, Eigen::VectorXd::Constant(31, -240.0))),
          prices_(PfLine::flat_price(days_, step(100.0, 50.0))),
          sourced_(PfLine::flat_complete(days_, Eigen::VectorXd::Constant(31, 96.0), Eigen::VectorXd::Constant(31, 80.0),
                                         Eigen::VectorXd::Constant(31, 7680.0)))
    {
    }

    static Eigen::VectorXd step(double first, double second)
    {
        Eigen::VectorXd v(31);
        v.head(15).setConstant(first);
        v.tail(16).setConstant(second);
        return v;
    }

    PfState state() const
    {
        return PfState(offtake_, prices_, sourced_);
    }
};

TEST_CASE_METHOD(StateFixture, "Derived lines of a state", "[PfState]")
{
    PfState s = state();

    SECTION("Unsourced volume closes the position")
    {
        PfLine open = s.unsourced();
        REQUIRE(open.kind() == Kind::COMPLETE);
        REQUIRE(open.q()[0] == Catch::Approx(144.0));
        REQUIRE(open.p()[0] == Catch::Approx(100.0));
        REQUIRE(open.p()[20] == Catch::Approx(50.0));
        REQUIRE(s.net_position().q()[0] == Catch::Approx(-144.0));
    }

    SECTION("Procurement cost covers the offtake")
    {
        PfLine cost = s.pnl_cost();
        REQUIRE(cost.is_nested());
        REQUIRE(cost.child_names() == std::vector<std::string>{"sourced", "unsourced"});
        REQUIRE(cost.flatten().q().approx_equal(tools::Series(days_, -s.offtake().q().values())));
        REQUIRE(cost.r()[0] == Catch::Approx(7680.0 + 14400.0));
    }

    SECTION("Sourced fractions")
    {
        REQUIRE(s.sourced_fraction()[3] == Catch::Approx(0.4));
        REQUIRE(s.unsourced_fraction()[3] == Catch::Approx(0.6));
        REQUIRE(s.sourced_fraction().unit() == std::optional<std::string>("1"));
    }

    SECTION("Mark-to-market of the sourced volume")
    {
        PfLine mtm = s.mtm_of_sourced();
        REQUIRE(mtm.kind() == Kind::REVENUE);
        REQUIRE(mtm.r()[0] == Catch::Approx(1920.0));
        REQUIRE(mtm.r()[30] == Catch::Approx(-2880.0));
    }
}

TEST_CASE_METHOD(StateFixture, "State without sourced volume", "[PfState]")
{
    PfState s(offtake_, prices_);

    SECTION("Sourced is an empty complete line")
    {
        REQUIRE_FALSE(s.has_sourced());
        PfLine sourced = s.sourced();
        REQUIRE(sourced.kind() == Kind::COMPLETE);
        REQUIRE(sourced.is_zero());
        REQUIRE(std::isnan(sourced.p()[0]));
    }

    SECTION("Everything is unsourced")
    {
        REQUIRE(s.unsourced().q()[0] == Catch::Approx(240.0));
        REQUIRE(s.sourced_fraction()[0] == Catch::Approx(0.0));
        REQUIRE(s.mtm_of_sourced().is_zero());
    }

    SECTION("Unsourced price is kept where nothing is open")
    {
        PfState full(offtake_, prices_, PfLine::flat_complete(days_, Eigen::VectorXd::Constant(31, 240.0),
                                                              Eigen::VectorXd::Constant(31, 70.0),
                                                              Eigen::VectorXd::Constant(31, 16800.0)));
        REQUIRE(full.unsourced().q()[0] == Catch::Approx(0.0));
        REQUIRE(full.unsourced().p()[0] == Catch::Approx(100.0));
        REQUIRE(full.unsourced_fraction()[0] == Catch::Approx(0.0));
    }
}

TEST_CASE_METHOD(StateFixture, "Constructing a state", "[PfState]")
{
    SECTION("Longer lines are cut to the offtake")
    {
        PfLine short_offtake = offtake_.reindex(days_.slice(5, 10));
        PfState s(short_offtake, prices_, sourced_);
        REQUIRE(s.index() == short_offtake.index());
        REQUIRE(s.unsourced_price().index() == s.index());
        REQUIRE(s.sourced().index() == s.index());
    }

    SECTION("Complete inputs lose a dimension with a warning")
    {
        auto sink = std::make_shared<CollectingDiagnosticSink>();
        Context ctx = Context::standard().with_sink(sink);
        PfState s(sourced_ * -1.0, sourced_, std::nullopt, ctx);
        REQUIRE(s.offtake().kind() == Kind::VOLUME);
        REQUIRE(s.unsourced_price().kind() == Kind::PRICE);
        REQUIRE(s.unsourced_price().p()[0] == Catch::Approx(80.0));
        REQUIRE(sink->count(DiagnosticCode::DISCARDED_DIMENSION) == 2);
    }

    SECTION("Error: wrong kinds")
    {
        REQUIRE_THROWS_AS(PfState(prices_, prices_), ShapeError);
        REQUIRE_THROWS_AS(PfState(offtake_, offtake_), ShapeError);
        REQUIRE_THROWS_AS(PfState(offtake_, prices_, offtake_), ShapeError);
    }

    SECTION("Error: prices do not cover the offtake")
    {
        REQUIRE_THROWS_AS(PfState(offtake_, prices_.reindex(days_.slice(0, 20))), InvariantError);
        REQUIRE_THROWS_AS(PfState(offtake_, prices_, sourced_.reindex(days_.slice(1, 30))), InvariantError);
    }

    SECTION("Error: incompatible indices")
    {
        TimeIndex hours(tools::parse_timestamp("2024-01-01"), 31 * 24, Frequency::HOUR);
        PfLine hourly = PfLine::flat_price(hours, Eigen::VectorXd::Constant(31 * 24, 60.0));
        REQUIRE_THROWS_AS(PfState(offtake_, hourly), IndexError);
    }
}

TEST_CASE_METHOD(StateFixture, "Modified copies of a state", "[PfState]")
{
    PfState s = state();

    SECTION("Setters")
    {
        PfState more = s.set_offtake(offtake_ * 2.0);
        REQUIRE(more.unsourced().q()[0] == Catch::Approx(384.0));
        REQUIRE(s.unsourced().q()[0] == Catch::Approx(144.0));

        PfState cheaper = s.set_unsourced_price(prices_ * 0.5);
        REQUIRE(cheaper.unsourced().p()[0] == Catch::Approx(50.0));

        PfState other = s.set_sourced(sourced_ * 0.5);
        REQUIRE(other.sourced_fraction()[0] == Catch::Approx(0.2));
    }

    SECTION("Adding sourced volume")
    {
        PfState more = s.add_sourced(sourced_ * 0.5);
        REQUIRE(more.sourced().q()[0] == Catch::Approx(144.0));
        REQUIRE(more.sourced().p()[0] == Catch::Approx(80.0));
        REQUIRE(PfState(offtake_, prices_).add_sourced(sourced_) == s);
    }

    SECTION("Selecting periods")
    {
        PfState part = s.loc(tools::parse_timestamp("2024-01-10"), tools::parse_timestamp("2024-01-20"));
        REQUIRE(part.index().size() == 10);
        REQUIRE(part.sourced().index() == part.index());
        REQUIRE_THROWS_AS(s.loc(tools::parse_timestamp("2025-01-01"), tools::parse_timestamp("2025-02-01")),
                          IndexError);
    }

    SECTION("Concatenating states")
    {
        tools::Timestamp mid = tools::parse_timestamp("2024-01-16");
        PfState first = s.loc(days_.start(), mid);
        PfState second = s.loc(mid, days_.end());
        REQUIRE(concat(std::vector<PfState>{second, first}) == s);
    }
}

TEST_CASE_METHOD(StateFixture, "Resampling a state", "[PfState][Resample]")
{
    PfState s = state();

    SECTION("Lines are resampled according to their kind")
    {
        PfState month = s.asfreq(Frequency::MONTH);
        REQUIRE(month.index().size() == 1);
        REQUIRE(month.offtake().q()[0] == Catch::Approx(-7440.0));
        REQUIRE(month.sourced().p()[0] == Catch::Approx(80.0));
        REQUIRE(month.unsourced().q()[0] == Catch::Approx(144.0 * 31));
        REQUIRE_THAT(month.unsourced_price().p()[0], WithinAbs(2300.0 / 31.0, 1e-9));
    }

    SECTION("Unsourced value is preserved")
    {
        PfState month = s.asfreq(Frequency::MONTH);
        REQUIRE(month.unsourced().r()[0] == Catch::Approx(s.unsourced().r().values().sum()));
    }

    SECTION("Without unsourced volume the price is duration-weighted")
    {
        PfState full = s.set_sourced(-offtake_ | PfLine::flat_price(days_, Eigen::VectorXd::Constant(31, 70.0)));
        PfState month = full.asfreq(Frequency::MONTH);
        REQUIRE_THAT(month.unsourced_price().p()[0], WithinAbs(2300.0 / 31.0, 1e-9));
    }
}

TEST_CASE_METHOD(StateFixture, "Hedging the unsourced volume", "[PfState][Hedge]")
{
    PfState s = state();

    SECTION("Base hedge of the open volume")
    {
        PfLine hedge = s.hedge_of_unsourced(HedgeMethod::VOLUME, Frequency::MONTH);
        REQUIRE(hedge.kind() == Kind::COMPLETE);
        REQUIRE(hedge.w()[0] == Catch::Approx(6.0));
        REQUIRE(hedge.p()[0] == Catch::Approx(2300.0 / 31.0));
        REQUIRE(s.hedge_of_unsourced(HedgeMethod::VALUE).w()[10] == Catch::Approx(6.0));
    }

    SECTION("Sourcing the hedge closes the position")
    {
        PfState hedged = s.source_unsourced();
        REQUIRE(hedged.unsourced().volume().is_zero(1e-6));
        REQUIRE(hedged.sourced().q()[0] == Catch::Approx(240.0));
        REQUIRE(hedged.unsourced_price() == s.unsourced_price());
        REQUIRE(hedged.sourced_fraction()[0] == Catch::Approx(1.0));
    }

    SECTION("A closed position needs no sourcing")
    {
        PfState full = s.set_sourced(-offtake_ | PfLine::flat_price(days_, Eigen::VectorXd::Constant(31, 70.0)));
        REQUIRE(full.hedge_of_unsourced(HedgeMethod::VOLUME, Frequency::MONTH).is_zero());

        PfState again = full.source_unsourced();
        REQUIRE(again == full);
        REQUIRE(again.sourced().p()[0] == 70.0);
    }

    SECTION("Error: state does not consist of complete products")
    {
        PfState part = s.loc(days_.start(), tools::parse_timestamp("2024-01-20"));
        REQUIRE_THROWS_AS(part.source_unsourced(), IndexError);

        PfState extra(PfLine::flat_volume(TimeIndex(days_.start(), 40, Frequency::DAY), Eigen::VectorXd::Ones(40)),
                      PfLine::flat_price(TimeIndex(days_.start(), 40, Frequency::DAY), Eigen::VectorXd::Ones(40)));
        REQUIRE_THROWS_AS(extra.source_unsourced(), IndexError);
    }
}
