/**
 * @file kind.hpp
 * @brief Kind and structure of portfolio lines.
 */

#ifndef POWERFOLIO_CORE_KIND_HPP
#define POWERFOLIO_CORE_KIND_HPP

#include "units/unit_registry.hpp"

#include <string>
#include <vector>

namespace powerfolio
{
    namespace core
    {

        /**
         * @enum Kind
         * @brief Which dimensions a portfolio line carries.
         */
        enum class Kind
        {
            VOLUME,  /**< w [MW] and q [MWh] */
            PRICE,   /**< p [Eur/MWh] */
            REVENUE, /**< r [Eur] */
            COMPLETE /**< w, q, p and r with r = p * q */
        };

        /**
         * @enum Structure
         * @brief Flat (values only) or nested (named children).
         */
        enum class Structure
        {
            FLAT,
            NESTED
        };

        std::string to_string(Kind kind);
        std::string to_string(Structure structure);

        /**
         * @brief Dimension tags ('w', 'q', 'p', 'r') available on lines of a kind.
         */
        const std::vector<char> &available_columns(Kind kind);

        /**
         * @brief Dimension tags that are summed when children are aggregated.
         */
        const std::vector<char> &summable_columns(Kind kind);

        /**
         * @brief True if lines of this kind carry the dimension tag.
         */
        bool has_column(Kind kind, char column);

        /**
         * @brief Dimension belonging to a tag.
         * @throws AmbiguousDimensionError if column is not one of w, q, p, r.
         */
        units::Dimension column_dimension(char column);

        /**
         * @brief Kind of a line that only carries the given dimension.
         * @throws AmbiguousDimensionError for DIMENSIONLESS.
         */
        Kind kind_of_dimension(units::Dimension dimension);

    } // namespace core
} // namespace powerfolio

#endif // POWERFOLIO_CORE_KIND_HPP
