/**
 * @file pfstate.hpp
 * @brief Portfolio state: offtake, sourced volume and market prices.
 *
 * A PfState combines three lines on one index:
 * - offtake: the volume the customers take (negative by convention);
 * - unsourced_price: the market price at which open volume is valued;
 * - sourced: the volume already bought, with its price.
 *
 * From these it derives the unsourced (still open) volume, the net position,
 * and the procurement cost split into sourced and unsourced parts.
 */

#ifndef POWERFOLIO_CORE_PFSTATE_HPP
#define POWERFOLIO_CORE_PFSTATE_HPP

#include "core/arithmetic.hpp"
#include "core/context.hpp"
#include "core/pfline.hpp"
#include "tools/hedge.hpp"
#include "tools/series.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace powerfolio
{
    namespace core
    {

        /**
         * @class PfState
         * @brief Immutable state of a portfolio.
         *
         * Usage:
         * @code
         *   PfState state(offtake, market_prices, sourced);
         *   PfLine open = state.unsourced();              // still to be bought
         *   PfLine cost = state.pnl_cost();               // nested {sourced, unsourced}
         *   PfState hedged = state.source_unsourced(HedgeMethod::VALUE, Frequency::MONTH);
         * @endcode
         */
        class PfState
        {
        public:
            /**
             * @brief Construct a portfolio state.
             *
             * A COMPLETE offtake loses its price, a COMPLETE unsourced_price its
             * volume; both report DISCARDED_DIMENSION. unsourced_price and sourced
             * are cut to the offtake's index.
             *
             * @param offtake VOLUME line.
             * @param unsourced_price PRICE line covering the offtake period.
             * @param sourced COMPLETE line covering the offtake period, if any.
             * @param ctx Calculation context.
             * @throws ShapeError if a line has the wrong kind.
             * @throws IndexError if the indices differ in frequency, start-of-day or timezone.
             * @throws InvariantError if unsourced_price or sourced do not cover the offtake.
             */
            PfState(const PfLine &offtake, const PfLine &unsourced_price,
                    const std::optional<PfLine> &sourced = std::nullopt,
                    const Context &ctx = Context::standard());

            // ========================================================================
            // Lines
            // ========================================================================

            const PfLine &offtake() const { return offtake_; }
            const PfLine &unsourced_price() const { return unsourced_price_; }

            /**
             * @brief Sourced volume and price; all-zero (with NaN price) if none.
             */
            PfLine sourced() const;

            bool has_sourced() const { return sourced_.has_value(); }
            const tools::TimeIndex &index() const { return offtake_.index(); }
            const Context &context() const { return ctx_; }

            /**
             * @brief Volume still to be sourced, valued at the unsourced price.
             *
             * Flat COMPLETE line with q = -(offtake + sourced) and p = unsourced price,
             * also where q is zero.
             */
            PfLine unsourced() const;

            /** @brief -unsourced */
            PfLine net_position() const;

            /**
             * @brief Procurement cost: nested COMPLETE line {sourced, unsourced}.
             *
             * Its volume equals -offtake.
             */
            PfLine pnl_cost() const;

            /** @brief Fraction of the offtake that is sourced (dimensionless). */
            tools::Series sourced_fraction() const;

            /** @brief 1 - sourced_fraction */
            tools::Series unsourced_fraction() const;

            // ========================================================================
            // Modified copies
            // ========================================================================

            PfState set_offtake(const PfLine &offtake) const;
            PfState set_unsourced_price(const PfLine &unsourced_price) const;
            PfState set_sourced(const PfLine &sourced) const;

            /**
             * @brief State with additional sourced volume.
             */
            PfState add_sourced(const PfLine &sourced) const;

            /**
             * @brief Resample all lines.
             *
             * The unsourced price is resampled with the unsourced volume as
             * weights; where those weights cancel, the duration-weighted price
             * is used.
             */
            PfState asfreq(tools::Frequency freq) const;

            /**
             * @brief Periods lying entirely within [from, to).
             * @throws IndexError if no period remains.
             */
            PfState loc(tools::Timestamp from, tools::Timestamp to) const;

            /**
             * @brief Hedge of the unsourced volume with standard products.
             * @return Flat COMPLETE line, valued at the unsourced price.
             */
            PfLine hedge_of_unsourced(tools::HedgeMethod how = tools::HedgeMethod::VALUE,
                                      tools::Frequency freq = tools::Frequency::MONTH) const;

            /**
             * @brief State after buying the hedge of the unsourced volume.
             *
             * A state whose hedge is zero is returned unchanged.
             * @throws IndexError if the state does not consist of complete product periods.
             */
            PfState source_unsourced(tools::HedgeMethod how = tools::HedgeMethod::VALUE,
                                     tools::Frequency freq = tools::Frequency::MONTH) const;

            /**
             * @brief Mark-to-market value of the sourced volume: q_sourced * (p_unsourced - p_sourced).
             */
            PfLine mtm_of_sourced() const;

            // ========================================================================
            // Comparison
            // ========================================================================

            bool equals(const PfState &other, double rtol = 1e-7, double atol = 1e-9) const;
            bool operator==(const PfState &other) const { return equals(other); }
            bool operator!=(const PfState &other) const { return !equals(other); }

            std::string describe() const;

        private:
            PfLine offtake_;
            PfLine unsourced_price_;
            std::optional<PfLine> sourced_;
            Context ctx_;
        };

        /**
         * @brief Sum of two states.
         *
         * Offtake and sourced add like lines; the unsourced price is the
         * average weighted with the unsourced volumes. Where those volumes
         * sum to zero the price is kept if both states agree on it, and is
         * NaN otherwise.
         */
        PfState operator+(const PfState &a, const PfState &b);
        PfState operator-(const PfState &a, const PfState &b);

        /** @brief Negated offtake and sourced; unsourced price unchanged. */
        PfState operator-(const PfState &a);

        PfState operator*(const PfState &a, double factor);
        PfState operator*(double factor, const PfState &a);
        PfState operator*(const PfState &a, const tools::Series &factor);
        PfState operator/(const PfState &a, double factor);
        PfState operator/(const PfState &a, const tools::Series &factor);

        /**
         * @brief Dimensionless ratios of two states, keyed "<line>.<dimension>".
         *
         * Keys, in this order: offtake.volume, sourced.volume, sourced.price,
         * unsourced.volume, unsourced.price and pnl_cost.price. Lines are
         * flattened before dividing.
         */
        using StateRatios = std::vector<std::pair<std::string, tools::Series>>;

        StateRatios operator/(const PfState &a, const PfState &b);

    } // namespace core
} // namespace powerfolio

#endif // POWERFOLIO_CORE_PFSTATE_HPP
