/**
 * @file kind.cpp
 * @brief Implementation of kind helpers
 */

#include "core/kind.hpp"
#include "errors.hpp"

#include <algorithm>

namespace powerfolio
{
    namespace core
    {

        std::string to_string(Kind kind)
        {
            switch (kind)
            {
            case Kind::VOLUME:
                return "volume";
            case Kind::PRICE:
                return "price";
            case Kind::REVENUE:
                return "revenue";
            case Kind::COMPLETE:
                return "complete";
            }
            return "unknown";
        }

        std::string to_string(Structure structure)
        {
            return structure == Structure::FLAT ? "flat" : "nested";
        }

        const std::vector<char> &available_columns(Kind kind)
        {
            static const std::vector<char> volume = {'w', 'q'};
            static const std::vector<char> price = {'p'};
            static const std::vector<char> revenue = {'r'};
            static const std::vector<char> complete = {'w', 'q', 'p', 'r'};

            switch (kind)
            {
            case Kind::VOLUME:
                return volume;
            case Kind::PRICE:
                return price;
            case Kind::REVENUE:
                return revenue;
            case Kind::COMPLETE:
                break;
            }
            return complete;
        }

        const std::vector<char> &summable_columns(Kind kind)
        {
            static const std::vector<char> volume = {'q'};
            static const std::vector<char> price = {'p'};
            static const std::vector<char> revenue = {'r'};
            static const std::vector<char> complete = {'q', 'r'};

            switch (kind)
            {
            case Kind::VOLUME:
                return volume;
            case Kind::PRICE:
                return price;
            case Kind::REVENUE:
                return revenue;
            case Kind::COMPLETE:
                break;
            }
            return complete;
        }

        bool has_column(Kind kind, char column)
        {
            const auto &cols = available_columns(kind);
            return std::find(cols.begin(), cols.end(), column) != cols.end();
        }

        units::Dimension column_dimension(char column)
        {
            switch (column)
            {
            case 'w':
                return units::Dimension::POWER;
            case 'q':
                return units::Dimension::ENERGY;
            case 'p':
                return units::Dimension::PRICE;
            case 'r':
                return units::Dimension::REVENUE;
            default:
                throw AmbiguousDimensionError(std::string("Unknown dimension tag '") + column +
                                              "'; expected one of w, q, p, r");
            }
        }

        Kind kind_of_dimension(units::Dimension dimension)
        {
            switch (dimension)
            {
            case units::Dimension::POWER:
            case units::Dimension::ENERGY:
                return Kind::VOLUME;
            case units::Dimension::PRICE:
                return Kind::PRICE;
            case units::Dimension::REVENUE:
                return Kind::REVENUE;
            case units::Dimension::DIMENSIONLESS:
                break;
            }
            throw AmbiguousDimensionError("A dimensionless value does not describe a portfolio line");
        }

    } // namespace core
} // namespace powerfolio
