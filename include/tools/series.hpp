/**
 * @file series.hpp
 * @brief Values on a TimeIndex, optionally tagged with a unit.
 */

#pragma once

#include "tools/time_index.hpp"

#include <Eigen/Dense>
#include <optional>
#include <string>

namespace powerfolio
{
    namespace tools
    {

        /**
         * @class Series
         * @brief One value per period of a TimeIndex.
         *
         * The unit is optional: a Series without unit is "untagged" and its
         * dimension must come from context (a dimension key, an operator).
         * A unit of "1" (or "") tags the values as explicitly dimensionless.
         */
        class Series
        {
        public:
            /**
             * @brief Construct from index and values.
             * @throws IndexError if values and index differ in size.
             */
            Series(TimeIndex index, Eigen::VectorXd values,
                   std::optional<std::string> unit = std::nullopt);

            /**
             * @brief Series with the same value in every period.
             */
            static Series constant(const TimeIndex &index, double value,
                                   std::optional<std::string> unit = std::nullopt);

            const TimeIndex &index() const { return index_; }
            const Eigen::VectorXd &values() const { return values_; }
            const std::optional<std::string> &unit() const { return unit_; }

            size_t size() const { return index_.size(); }

            /** @brief Value of period i (unchecked). */
            double operator[](size_t i) const { return values_(static_cast<Eigen::Index>(i)); }

            /**
             * @brief Value of the period starting at ts.
             * @throws KeyError if no period starts at ts.
             */
            double at(Timestamp ts) const;

            /**
             * @brief Part of the series on a sub-index.
             * @throws IndexError if sub is not contained in this series' index.
             */
            Series reindex(const TimeIndex &sub) const;

            /**
             * @brief Periods lying entirely within [from, to).
             */
            Series loc(Timestamp from, Timestamp to) const;

            /**
             * @brief Same series with another unit tag.
             */
            Series with_unit(std::optional<std::string> unit) const;

            /**
             * @brief Element-wise comparison within tolerance; indices must be equal.
             *
             * NaN compares equal to NaN.
             */
            bool approx_equal(const Series &other, double rtol = 1e-7, double atol = 1e-9) const;

        private:
            TimeIndex index_;
            Eigen::VectorXd values_;
            std::optional<std::string> unit_;
        };

        /**
         * @brief Element-wise closeness of two vectors; NaN equals NaN.
         */
        bool all_close(const Eigen::VectorXd &a, const Eigen::VectorXd &b,
                       double rtol = 1e-7, double atol = 1e-9);

    } // namespace tools
} // namespace powerfolio
