/**
 * @file resample.hpp
 * @brief Change the frequency of a series according to its semantic class.
 *
 * Three classes of quantities are distinguished:
 *
 * - Summable (energy [MWh], revenue [Eur]): upsampling distributes the
 *   value over the sub-periods in proportion to their duration;
 *   downsampling sums.
 * - Averagable (power [MW], prices without associated volume): upsampling
 *   copies the value to every sub-period; downsampling takes the
 *   duration-weighted average.
 * - Weighted / derived (prices of a known volume): upsampling copies;
 *   downsampling takes the average weighted with the associated energy.
 *
 * Downsampling keeps only complete target periods. Every resampled index
 * keeps the start-of-day offset and timezone label of its source, so a
 * gas day starting at 06:00 stays a gas day through up- and downsampling.
 *
 * For example, a price of 37.77, 25.30, 21.30 and 30.80 Eur/MWh in the
 * quarters of 2023 averages to 28.75 Eur/MWh when weighted by duration, but
 * to 30.0 Eur/MWh when weighted with quarterly volumes of 300, 180, 200 and
 * 320 MWh.
 */

#ifndef POWERFOLIO_TOOLS_RESAMPLE_HPP
#define POWERFOLIO_TOOLS_RESAMPLE_HPP

#include "tools/series.hpp"
#include "tools/time_index.hpp"

#include <Eigen/Dense>

namespace powerfolio
{
    namespace tools
    {
        namespace resample
        {

            /**
             * @enum Semantic
             * @brief Resampling class of a quantity.
             */
            enum class Semantic
            {
                SUMMABLE,
                AVERAGABLE
            };

            /**
             * @brief Index obtained by resampling source to freq.
             *
             * Downsampling drops incomplete target periods at both ends.
             * @throws IndexError if no complete target period remains.
             */
            TimeIndex index(const TimeIndex &source, Frequency freq);

            /**
             * @brief Resample a summable series (energy, revenue).
             * @throws IndexError if no complete target period remains.
             */
            Series summable(const Series &s, Frequency freq);

            /**
             * @brief Resample an averagable series (power, price without volume).
             * @throws IndexError if no complete target period remains.
             */
            Series averagable(const Series &s, Frequency freq);

            /**
             * @brief Resample a series of the given semantic class.
             */
            Series general(Semantic semantic, const Series &s, Frequency freq);

            /**
             * @brief Resample values that belong to the (summable) weights.
             *
             * Upsampling copies the values; downsampling returns the
             * weight-averaged value of each target period. Where the weights of
             * a target period sum to zero, the value is kept if it is the same in
             * all sub-periods and NaN otherwise.
             *
             * @param values E.g. prices [Eur/MWh].
             * @param weights E.g. energies [MWh], on the same index.
             * @throws IndexError if values and weights have different indices.
             */
            Series weighted(const Series &values, const Series &weights, Frequency freq);

        } // namespace resample
    } // namespace tools
} // namespace powerfolio

#endif // POWERFOLIO_TOOLS_RESAMPLE_HPP
