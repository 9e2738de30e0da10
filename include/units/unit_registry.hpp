/**
 * @file unit_registry.hpp
 * @brief Physical and financial dimensions and their units.
 *
 * Every dimension has exactly one canonical unit (MW, MWh, Eur/MWh, Eur and
 * "1"). Values entering the library are converted to the canonical unit of
 * their dimension once; all internal arithmetic is done on canonical values.
 *
 * The registry is an explicit, immutable-after-construction object that is
 * handed around via the calculation Context. There is no process-wide
 * registry.
 */

#ifndef POWERFOLIO_UNITS_UNIT_REGISTRY_HPP
#define POWERFOLIO_UNITS_UNIT_REGISTRY_HPP

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace powerfolio
{
    namespace units
    {

        /**
         * @enum Dimension
         * @brief Dimensions known to the library.
         */
        enum class Dimension
        {
            POWER,        /**< MW */
            ENERGY,       /**< MWh */
            PRICE,        /**< Eur/MWh */
            REVENUE,      /**< Eur */
            DIMENSIONLESS /**< 1 */
        };

        /**
         * @brief Lower-case name of a dimension ("power", "energy", ...).
         */
        std::string to_string(Dimension dimension);

        /**
         * @brief Parse a dimension name.
         * @throws std::invalid_argument for unknown names.
         */
        Dimension parse_dimension(const std::string &name);

        /**
         * @enum Operation
         * @brief Binary operations whose result dimension can be derived.
         */
        enum class Operation
        {
            MULTIPLY,
            DIVIDE
        };

        /**
         * @struct Quantity
         * @brief A single magnitude, optionally tagged with a unit.
         */
        struct Quantity
        {
            double magnitude;
            std::optional<std::string> unit; ///< nullopt = untagged
        };

        /**
         * @struct UnitDefinition
         * @brief One unit: name, dimension and size in canonical units.
         */
        struct UnitDefinition
        {
            std::string name;
            Dimension dimension;
            double factor; ///< 1 unit = factor canonical units

            static UnitDefinition from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @class UnitRegistry
         * @brief Lookup of unit names to dimension and conversion factor.
         *
         * Usage:
         * @code
         *   auto registry = UnitRegistry::standard();
         *   registry.dimension_of("kWh");           // ENERGY
         *   registry.to_canonical(250.0, "kWh");    // 0.25 (MWh)
         * @endcode
         */
        class UnitRegistry
        {
        public:
            /**
             * @brief Registry containing the standard units.
             *
             * power: W, kW, MW, GW; energy: Wh, kWh, MWh, GWh, TWh;
             * price: Eur/MWh, Eur/kWh, ctEur/kWh; revenue: Eur, kEur, MEur;
             * dimensionless: 1, "", %.
             */
            static UnitRegistry standard();

            /**
             * @brief Standard registry extended with the units in a JSON array.
             *
             * Expected format:
             * [ {"name": "ctEur/kWh", "dimension": "price", "factor": 10.0}, ... ]
             *
             * @throws std::invalid_argument for malformed entries.
             */
            static UnitRegistry from_json(const nlohmann::json &j);

            /**
             * @brief Register a unit.
             *
             * Re-registering a name with the same dimension replaces its factor.
             * @throws std::invalid_argument if the name is registered with another
             *         dimension or the factor is not positive and finite.
             */
            void add_unit(const UnitDefinition &definition);

            /** @brief True if the unit name is registered. */
            bool contains(const std::string &unit) const;

            /**
             * @brief Dimension of a unit.
             * @throws AmbiguousDimensionError for unknown units.
             */
            Dimension dimension_of(const std::string &unit) const;

            /**
             * @brief Size of one unit in canonical units of its dimension.
             * @throws AmbiguousDimensionError for unknown units.
             */
            double factor_of(const std::string &unit) const;

            /**
             * @brief Convert a magnitude to the canonical unit of its dimension.
             * @throws AmbiguousDimensionError for unknown units.
             */
            double to_canonical(double magnitude, const std::string &unit) const;

            /**
             * @brief Convert values to the canonical unit of their dimension.
             * @throws AmbiguousDimensionError for unknown units.
             */
            Eigen::VectorXd to_canonical(const Eigen::VectorXd &values, const std::string &unit) const;

            /** @brief All registered units, sorted by name. */
            std::vector<UnitDefinition> units() const;

            /**
             * @brief Canonical unit of a dimension.
             */
            static const std::string &canonical_unit(Dimension dimension);

            /**
             * @brief Dimension of a op b, if defined.
             *
             * ENERGY x PRICE = REVENUE (either order), REVENUE / PRICE = ENERGY,
             * REVENUE / ENERGY = PRICE, X / X = DIMENSIONLESS, and
             * DIMENSIONLESS leaves the other dimension unchanged.
             */
            static std::optional<Dimension> derive(Dimension a, Operation op, Dimension b);

        private:
            std::map<std::string, UnitDefinition> units_;

            const UnitDefinition &lookup(const std::string &unit) const;
        };

    } // namespace units
} // namespace powerfolio

#endif // POWERFOLIO_UNITS_UNIT_REGISTRY_HPP
