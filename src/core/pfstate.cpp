/**
 * @file pfstate.cpp
 * @brief Implementation of PfState
 */

#include "core/pfstate.hpp"
#include "errors.hpp"
#include "tools/resample.hpp"

#include <cmath>
#include <limits>
#include <variant>

namespace powerfolio
{
    namespace core
    {

        namespace
        {
            PfLine as_offtake(const PfLine &line, const Context &ctx)
            {
                switch (line.kind())
                {
                case Kind::VOLUME:
                    return line;
                case Kind::COMPLETE:
                    ctx.warn(DiagnosticCode::DISCARDED_DIMENSION,
                             "Offtake has price and revenue information; only its volume is used");
                    return line.volume();
                default:
                    throw ShapeError("Offtake must be a volume line, got a " + to_string(line.kind()) + " line");
                }
            }

            PfLine as_unsourced_price(const PfLine &line, const Context &ctx)
            {
                switch (line.kind())
                {
                case Kind::PRICE:
                    return line;
                case Kind::COMPLETE:
                    ctx.warn(DiagnosticCode::DISCARDED_DIMENSION,
                             "Unsourced price has volume and revenue information; only its price is used");
                    return line.price();
                default:
                    throw ShapeError("Unsourced price must be a price line, got a " + to_string(line.kind()) +
                                     " line");
                }
            }

            // Cut line to index, which it must cover completely.
            PfLine cover(const PfLine &line, const tools::TimeIndex &index, const std::string &what)
            {
                if (!line.index().is_compatible(index))
                {
                    throw IndexError(what + " has index " + line.index().describe() +
                                     ", incompatible with the offtake index " + index.describe());
                }
                if (line.index().start() > index.start() || line.index().end() < index.end())
                {
                    throw InvariantError(what + " (" + line.index().describe() +
                                         ") does not cover the offtake period (" + index.describe() + ")");
                }
                return line.reindex(index);
            }
        }

        PfState::PfState(const PfLine &offtake, const PfLine &unsourced_price,
                         const std::optional<PfLine> &sourced, const Context &ctx)
            : offtake_(as_offtake(offtake, ctx)),
              unsourced_price_(cover(as_unsourced_price(unsourced_price, ctx), offtake.index(), "Unsourced price")),
              sourced_(),
              ctx_(ctx)
        {
            if (sourced)
            {
                if (sourced->kind() != Kind::COMPLETE)
                {
                    throw ShapeError("Sourced must be a complete line, got a " + to_string(sourced->kind()) + " line");
                }
                sourced_ = cover(*sourced, offtake_.index(), "Sourced");
            }
        }

        // ============================================================================
        // Lines
        // ============================================================================

        PfLine PfState::sourced() const
        {
            if (sourced_)
            {
                return *sourced_;
            }
            const auto n = static_cast<Eigen::Index>(index().size());
            return PfLine::flat_complete(index(), Eigen::VectorXd::Zero(n),
                                         Eigen::VectorXd::Constant(n, std::numeric_limits<double>::quiet_NaN()),
                                         Eigen::VectorXd::Zero(n));
        }

        PfLine PfState::unsourced() const
        {
            Eigen::VectorXd q = -(offtake_.q().values() + sourced().q().values());
            Eigen::VectorXd p = unsourced_price_.p().values();
            Eigen::VectorXd r = q.cwiseProduct(p);
            return PfLine::flat_complete(index(), q, p, r);
        }

        PfLine PfState::net_position() const
        {
            return Arithmetic(ctx_).negate(unsourced());
        }

        PfLine PfState::pnl_cost() const
        {
            return PfLine::nested({{"sourced", sourced()}, {"unsourced", unsourced()}});
        }

        tools::Series PfState::sourced_fraction() const
        {
            Eigen::VectorXd fraction = -sourced().q().values().cwiseQuotient(offtake_.q().values());
            return tools::Series(index(), fraction, "1");
        }

        tools::Series PfState::unsourced_fraction() const
        {
            Eigen::VectorXd fraction = (1.0 - sourced_fraction().values().array()).matrix();
            return tools::Series(index(), fraction, "1");
        }

        // ============================================================================
        // Modified copies
        // ============================================================================

        PfState PfState::set_offtake(const PfLine &offtake) const
        {
            return PfState(offtake, unsourced_price_, sourced_, ctx_);
        }

        PfState PfState::set_unsourced_price(const PfLine &unsourced_price) const
        {
            return PfState(offtake_, unsourced_price, sourced_, ctx_);
        }

        PfState PfState::set_sourced(const PfLine &sourced) const
        {
            return PfState(offtake_, unsourced_price_, sourced, ctx_);
        }

        PfState PfState::add_sourced(const PfLine &sourced) const
        {
            if (!sourced_)
            {
                return set_sourced(sourced);
            }
            return set_sourced(Arithmetic(ctx_).add(*sourced_, sourced));
        }

        PfState PfState::asfreq(tools::Frequency freq) const
        {
            namespace rs = tools::resample;

            PfLine open = unsourced();
            tools::Series p_weighted = rs::weighted(open.p(), open.q(), freq);
            tools::Series p_plain = rs::averagable(open.p(), freq);

            Eigen::VectorXd p = p_weighted.values();
            for (Eigen::Index i = 0; i < p.size(); ++i)
            {
                if (std::isnan(p(i)))
                {
                    p(i) = p_plain.values()(i);
                }
            }

            std::optional<PfLine> sourced;
            if (sourced_)
            {
                sourced = sourced_->asfreq(freq);
            }
            return PfState(offtake_.asfreq(freq), PfLine::flat_price(p_weighted.index(), p), sourced, ctx_);
        }

        PfState PfState::loc(tools::Timestamp from, tools::Timestamp to) const
        {
            std::optional<PfLine> sourced;
            if (sourced_)
            {
                sourced = sourced_->loc(from, to);
            }
            return PfState(offtake_.loc(from, to), unsourced_price_.loc(from, to), sourced, ctx_);
        }

        PfLine PfState::hedge_of_unsourced(tools::HedgeMethod how, tools::Frequency freq) const
        {
            return unsourced().volume().hedge_with(unsourced_price_, how, freq);
        }

        PfState PfState::source_unsourced(tools::HedgeMethod how, tools::Frequency freq) const
        {
            PfLine hedge = hedge_of_unsourced(how, freq);
            if (hedge.index() != index())
            {
                throw IndexError("Can only source the unsourced volume if the state consists of complete " +
                                 tools::to_string(freq) + " periods; state has " + index().describe());
            }
            if (hedge.is_zero(ctx_.atol()))
            {
                return *this;
            }
            return add_sourced(hedge);
        }

        PfLine PfState::mtm_of_sourced() const
        {
            const PfLine s = sourced();
            const Eigen::VectorXd q = s.q().values();
            const Eigen::VectorXd spread = unsourced_price_.p().values() - s.p().values();

            Eigen::VectorXd r(q.size());
            for (Eigen::Index i = 0; i < q.size(); ++i)
            {
                r(i) = q(i) == 0.0 ? 0.0 : q(i) * spread(i);
            }
            return PfLine::flat_revenue(index(), r);
        }

        // ============================================================================
        // Comparison
        // ============================================================================

        bool PfState::equals(const PfState &other, double rtol, double atol) const
        {
            return offtake_.equals(other.offtake_, rtol, atol) &&
                   unsourced_price_.equals(other.unsourced_price_, rtol, atol) &&
                   sourced().equals(other.sourced(), rtol, atol);
        }

        std::string PfState::describe() const
        {
            return "portfolio state on " + index().describe() + (sourced_ ? " with sourced volume" : "");
        }

        // ============================================================================
        // Arithmetic
        // ============================================================================

        PfState operator+(const PfState &a, const PfState &b)
        {
            Arithmetic calc(a.context());
            PfLine offtake = calc.add(a.offtake(), b.offtake());
            const tools::TimeIndex &idx = offtake.index();

            std::optional<PfLine> sourced;
            if (a.has_sourced() && b.has_sourced())
                sourced = calc.add(a.sourced(), b.sourced());
            else if (a.has_sourced())
                sourced = a.sourced();
            else if (b.has_sourced())
                sourced = b.sourced();

            const PfLine open_a = a.unsourced().reindex(idx);
            const PfLine open_b = b.unsourced().reindex(idx);
            const Eigen::VectorXd qa = open_a.q().values();
            const Eigen::VectorXd qb = open_b.q().values();
            const Eigen::VectorXd pa = open_a.p().values();
            const Eigen::VectorXd pb = open_b.p().values();

            // Volume-weighted; an operand without unsourced volume does not count.
            const Eigen::VectorXd q = qa + qb;
            Eigen::VectorXd r(q.size());
            for (Eigen::Index i = 0; i < r.size(); ++i)
            {
                r(i) = (qa(i) != 0.0 ? pa(i) * qa(i) : 0.0) + (qb(i) != 0.0 ? pb(i) * qb(i) : 0.0);
            }
            const Eigen::VectorXd p = combined_price(q, r, {pa, pb});

            return PfState(offtake, PfLine::flat_price(idx, p), sourced, a.context());
        }

        PfState operator-(const PfState &a)
        {
            return a * -1.0;
        }

        PfState operator-(const PfState &a, const PfState &b)
        {
            return a + (-b);
        }

        PfState operator*(const PfState &a, double factor)
        {
            Arithmetic calc(a.context());
            std::optional<PfLine> sourced;
            if (a.has_sourced())
            {
                sourced = calc.scale(a.sourced(), factor);
            }
            return PfState(calc.scale(a.offtake(), factor), a.unsourced_price(), sourced, a.context());
        }

        PfState operator*(double factor, const PfState &a)
        {
            return a * factor;
        }

        PfState operator*(const PfState &a, const tools::Series &factor)
        {
            Arithmetic calc(a.context());
            std::optional<PfLine> sourced;
            if (a.has_sourced())
            {
                sourced = calc.scale(a.sourced(), factor);
            }
            return PfState(calc.scale(a.offtake(), factor), a.unsourced_price(), sourced, a.context());
        }

        PfState operator/(const PfState &a, double factor)
        {
            return a * (1.0 / factor);
        }

        PfState operator/(const PfState &a, const tools::Series &factor)
        {
            return a * tools::Series(factor.index(), factor.values().cwiseInverse(), factor.unit());
        }

        StateRatios operator/(const PfState &a, const PfState &b)
        {
            Arithmetic calc(a.context());
            auto ratio = [&calc](const PfLine &top, const PfLine &bottom)
            { return std::get<tools::Series>(calc.divide(top, bottom)); };

            const PfLine sourced_a = a.sourced().flatten();
            const PfLine sourced_b = b.sourced().flatten();
            StateRatios ratios;
            ratios.emplace_back("offtake.volume", ratio(a.offtake().flatten(), b.offtake().flatten()));
            ratios.emplace_back("sourced.volume", ratio(sourced_a.volume(), sourced_b.volume()));
            ratios.emplace_back("sourced.price", ratio(sourced_a.price(), sourced_b.price()));
            ratios.emplace_back("unsourced.volume", ratio(a.unsourced().volume(), b.unsourced().volume()));
            ratios.emplace_back("unsourced.price", ratio(a.unsourced_price().flatten(), b.unsourced_price().flatten()));
            ratios.emplace_back("pnl_cost.price", ratio(a.pnl_cost().flatten().price(), b.pnl_cost().flatten().price()));
            return ratios;
        }

    } // namespace core
} // namespace powerfolio
