/**
 * @file hedge.hpp
 * @brief Hedge a power profile with standard (base) products.
 */

#pragma once

#include "tools/series.hpp"

#include <string>
#include <utility>

namespace powerfolio
{
    namespace tools
    {

        /**
         * @enum HedgeMethod
         * @brief Constraint that the hedge satisfies within each product period.
         */
        enum class HedgeMethod
        {
            VOLUME, /**< sum(w * duration) is preserved */
            VALUE   /**< sum(w * duration * p) is preserved */
        };

        /**
         * @brief Parse "vol"/"volume" or "val"/"value".
         * @throws std::invalid_argument for anything else.
         */
        HedgeMethod parse_hedge_method(const std::string &text);

        /**
         * @brief Hedge power timeseries w with prices p.
         *
         * Every product period (of frequency freq) gets one constant power and
         * one price: the duration-weighted average price of the period, and
         * the power that preserves volume or value. Incomplete product periods
         * at the edges are dropped.
         *
         * @param w Power [MW], daily or shorter frequency.
         * @param p Price [Eur/MWh] on the same index as w.
         * @param how Hedge constraint.
         * @param freq Product frequency (D, MS, QS or AS).
         * @return Hedge power and hedge price, on the index of w (trimmed to
         *         complete product periods).
         * @throws IndexError if the indices differ, the source frequency is
         *         longer than daily, or freq is shorter than daily or shorter
         *         than the source frequency.
         */
        std::pair<Series, Series> hedge(const Series &w, const Series &p,
                                        HedgeMethod how = HedgeMethod::VALUE,
                                        Frequency freq = Frequency::MONTH);

    } // namespace tools
} // namespace powerfolio
