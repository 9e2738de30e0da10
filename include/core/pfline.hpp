/**
 * @file pfline.hpp
 * @brief Portfolio line: a timeseries of volume, price, revenue, or all three.
 *
 * A PfLine is either flat (one set of values) or nested (named children of
 * one kind on one index, whose aggregate is computed, never supplied).
 * Values are stored in canonical units: q [MWh], p [Eur/MWh] and r [Eur];
 * power w [MW] is derived as q / duration.
 *
 * Instances are immutable. Every "modifying" operation returns a new line;
 * copies share their internals.
 *
 * Lines are usually built with the functions in pfline_create.hpp and
 * combined with the operators in arithmetic.hpp.
 */

#ifndef POWERFOLIO_CORE_PFLINE_HPP
#define POWERFOLIO_CORE_PFLINE_HPP

#include "core/kind.hpp"
#include "tools/hedge.hpp"
#include "tools/series.hpp"
#include "tools/time_index.hpp"

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace powerfolio
{
    namespace core
    {

        class PfLine;

        /** @brief Ordered (name, child) pairs of a nested line. */
        using Children = std::vector<std::pair<std::string, PfLine>>;

        /**
         * @class PfLine
         * @brief Immutable portfolio line.
         *
         * Usage:
         * @code
         *   TimeIndex idx(parse_timestamp("2023-01-01"), 4, Frequency::QUARTER);
         *   PfLine offtake = PfLine::flat_volume(idx, q);
         *   PfLine yearly = offtake.asfreq(Frequency::YEAR);
         *   double total = yearly.q()[0];
         * @endcode
         */
        class PfLine
        {
        public:
            // ========================================================================
            // Construction
            // ========================================================================

            /**
             * @brief Flat volume line from energies [MWh].
             * @throws IndexError if sizes differ.
             */
            static PfLine flat_volume(const tools::TimeIndex &index, const Eigen::VectorXd &q);

            /**
             * @brief Flat price line from prices [Eur/MWh].
             * @throws IndexError if sizes differ.
             */
            static PfLine flat_price(const tools::TimeIndex &index, const Eigen::VectorXd &p);

            /**
             * @brief Flat revenue line from revenues [Eur].
             * @throws IndexError if sizes differ.
             */
            static PfLine flat_revenue(const tools::TimeIndex &index, const Eigen::VectorXd &r);

            /**
             * @brief Flat complete line.
             *
             * No consistency check is done; use create_flat() for unchecked input.
             * @throws IndexError if sizes differ.
             */
            static PfLine flat_complete(const tools::TimeIndex &index, const Eigen::VectorXd &q,
                                        const Eigen::VectorXd &p, const Eigen::VectorXd &r);

            /**
             * @brief Nested line from named children.
             * @throws InvariantError if children is empty, a name is invalid or repeated.
             * @throws ShapeError if the children differ in kind or index.
             */
            static PfLine nested(Children children);

            // ========================================================================
            // Properties
            // ========================================================================

            Kind kind() const;
            Structure structure() const;
            bool is_flat() const { return structure() == Structure::FLAT; }
            bool is_nested() const { return structure() == Structure::NESTED; }
            const tools::TimeIndex &index() const;

            /**
             * @brief Power [MW] of the (aggregate) line.
             * @throws ShapeError if the kind carries no volume.
             */
            tools::Series w() const;

            /** @brief Energy [MWh]. @throws ShapeError if the kind carries no volume. */
            tools::Series q() const;

            /** @brief Price [Eur/MWh]. @throws ShapeError if the kind carries no price. */
            tools::Series p() const;

            /** @brief Revenue [Eur]. @throws ShapeError if the kind carries no revenue. */
            tools::Series r() const;

            /**
             * @brief Series of a dimension tag ('w', 'q', 'p' or 'r').
             * @throws ShapeError if the kind lacks the dimension.
             * @throws AmbiguousDimensionError for unknown tags.
             */
            tools::Series column(char tag) const;

            /**
             * @brief Volume part (VOLUME or COMPLETE lines); keeps nesting.
             * @throws ShapeError for PRICE and REVENUE lines.
             */
            PfLine volume() const;

            /**
             * @brief Price part (PRICE or COMPLETE lines).
             *
             * Nested PRICE lines are returned as they are; nested COMPLETE lines
             * are flattened first, as their price is an aggregate.
             * @throws ShapeError for VOLUME and REVENUE lines.
             */
            PfLine price() const;

            /**
             * @brief Revenue part (REVENUE or COMPLETE lines); keeps nesting.
             * @throws ShapeError for VOLUME and PRICE lines.
             */
            PfLine revenue() const;

            // ========================================================================
            // Children
            // ========================================================================

            /**
             * @brief Child with the given name.
             * @throws KeyError if there is no such child (or the line is flat).
             */
            const PfLine &child(const std::string &name) const;

            bool has_child(const std::string &name) const;

            /** @brief Children in insertion order; empty for flat lines. */
            const Children &children() const;

            std::vector<std::string> child_names() const;
            size_t num_children() const { return children().size(); }

            /**
             * @brief Line with a child added or replaced.
             * @throws ShapeError if this line is flat or the kinds or indices differ.
             * @throws InvariantError for invalid names.
             */
            PfLine set_child(const std::string &name, const PfLine &child) const;

            /**
             * @brief Line without the named child.
             * @throws KeyError if there is no such child.
             * @throws InvariantError if it is the only child.
             */
            PfLine drop_child(const std::string &name) const;

            /**
             * @brief Flat line with the values of the aggregate.
             */
            PfLine flatten() const;

            // ========================================================================
            // Time
            // ========================================================================

            /**
             * @brief Resample to another frequency.
             *
             * Energy and revenue are summable; prices of PRICE lines are averaged
             * by duration; prices of COMPLETE lines are averaged by energy.
             * Nested lines resample every child.
             *
             * @throws IndexError if downsampling leaves no complete period.
             */
            PfLine asfreq(tools::Frequency freq) const;

            /**
             * @brief Periods lying entirely within [from, to).
             * @throws IndexError if no period remains.
             */
            PfLine loc(tools::Timestamp from, tools::Timestamp to) const;

            /**
             * @brief Values on a sub-index.
             * @throws IndexError if sub is not part of this line's index.
             */
            PfLine reindex(const tools::TimeIndex &sub) const;

            /**
             * @brief Hedge this line's volume with standard products.
             * @param prices Line with prices (PRICE or COMPLETE).
             * @param how Preserve volume or value.
             * @param freq Product frequency (D, MS, QS or AS).
             * @return Flat COMPLETE line with the hedge volumes and prices.
             * @throws ShapeError if this line has no volume or prices has no price.
             * @throws IndexError if the frequencies are unsuitable.
             */
            PfLine hedge_with(const PfLine &prices, tools::HedgeMethod how = tools::HedgeMethod::VALUE,
                              tools::Frequency freq = tools::Frequency::MONTH) const;

            // ========================================================================
            // Comparison
            // ========================================================================

            /**
             * @brief Same kind, structure, index, children and values within tolerance.
             */
            bool equals(const PfLine &other, double rtol = 1e-7, double atol = 1e-9) const;

            bool operator==(const PfLine &other) const { return equals(other); }
            bool operator!=(const PfLine &other) const { return !equals(other); }

            /**
             * @brief True if all summable values are zero (within atol).
             */
            bool is_zero(double atol = 1e-9) const;

            /**
             * @brief Short description, used in error and diagnostic messages.
             */
            std::string describe() const;

        private:
            struct FlatData;
            struct NestedData;
            struct Impl;

            explicit PfLine(std::shared_ptr<const Impl> impl);

            static PfLine make_flat(const tools::TimeIndex &index, FlatData data);
            static FlatData aggregate(const Children &children);
            static void check_child_name(const std::string &name);

            const FlatData &values() const;

            std::shared_ptr<const Impl> impl_;
        };

        /**
         * @brief Price belonging to total energies q and revenues r.
         *
         * r / q where q is non-zero. Where q is zero the price is the common
         * price of all parts, or NaN if the parts disagree.
         *
         * @param part_prices Prices of the parts that were summed into q and r.
         */
        Eigen::VectorXd combined_price(const Eigen::VectorXd &q, const Eigen::VectorXd &r,
                                       const std::vector<Eigen::VectorXd> &part_prices);

    } // namespace core
} // namespace powerfolio

#endif // POWERFOLIO_CORE_PFLINE_HPP
