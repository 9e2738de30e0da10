/**
 * @file unit_registry.cpp
 * @brief Implementation of UnitRegistry
 */

#include "units/unit_registry.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace powerfolio
{
    namespace units
    {

        std::string to_string(Dimension dimension)
        {
            switch (dimension)
            {
            case Dimension::POWER:
                return "power";
            case Dimension::ENERGY:
                return "energy";
            case Dimension::PRICE:
                return "price";
            case Dimension::REVENUE:
                return "revenue";
            case Dimension::DIMENSIONLESS:
                return "dimensionless";
            }
            return "unknown";
        }

        Dimension parse_dimension(const std::string &name)
        {
            std::string s = name;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });

            if (s == "power")
                return Dimension::POWER;
            if (s == "energy")
                return Dimension::ENERGY;
            if (s == "price")
                return Dimension::PRICE;
            if (s == "revenue")
                return Dimension::REVENUE;
            if (s == "dimensionless")
                return Dimension::DIMENSIONLESS;

            throw std::invalid_argument("Unknown dimension: " + name);
        }

        // ==================
        // UnitDefinition
        // ==================

        UnitDefinition UnitDefinition::from_json(const nlohmann::json &j)
        {
            if (!j.is_object() || !j.contains("name") || !j.contains("dimension") || !j.contains("factor"))
            {
                throw std::invalid_argument("Unit definition needs 'name', 'dimension' and 'factor': " + j.dump());
            }
            if (!j["name"].is_string() || !j["dimension"].is_string() || !j["factor"].is_number())
            {
                throw std::invalid_argument("Unit definition has fields of the wrong type: " + j.dump());
            }

            UnitDefinition definition;
            definition.name = j["name"].get<std::string>();
            definition.dimension = parse_dimension(j["dimension"].get<std::string>());
            definition.factor = j["factor"].get<double>();
            return definition;
        }

        nlohmann::json UnitDefinition::to_json() const
        {
            return nlohmann::json{{"name", name}, {"dimension", units::to_string(dimension)}, {"factor", factor}};
        }

        // ==================
        // UnitRegistry
        // ==================

        UnitRegistry UnitRegistry::standard()
        {
            UnitRegistry registry;

            registry.add_unit({"W", Dimension::POWER, 1e-6});
            registry.add_unit({"kW", Dimension::POWER, 1e-3});
            registry.add_unit({"MW", Dimension::POWER, 1.0});
            registry.add_unit({"GW", Dimension::POWER, 1e3});

            registry.add_unit({"Wh", Dimension::ENERGY, 1e-6});
            registry.add_unit({"kWh", Dimension::ENERGY, 1e-3});
            registry.add_unit({"MWh", Dimension::ENERGY, 1.0});
            registry.add_unit({"GWh", Dimension::ENERGY, 1e3});
            registry.add_unit({"TWh", Dimension::ENERGY, 1e6});

            registry.add_unit({"Eur/MWh", Dimension::PRICE, 1.0});
            registry.add_unit({"Eur/kWh", Dimension::PRICE, 1e3});
            registry.add_unit({"ctEur/kWh", Dimension::PRICE, 10.0});

            registry.add_unit({"Eur", Dimension::REVENUE, 1.0});
            registry.add_unit({"kEur", Dimension::REVENUE, 1e3});
            registry.add_unit({"MEur", Dimension::REVENUE, 1e6});

            registry.add_unit({"1", Dimension::DIMENSIONLESS, 1.0});
            registry.add_unit({"", Dimension::DIMENSIONLESS, 1.0});
            registry.add_unit({"%", Dimension::DIMENSIONLESS, 0.01});

            return registry;
        }

        UnitRegistry UnitRegistry::from_json(const nlohmann::json &j)
        {
            if (!j.is_array())
            {
                throw std::invalid_argument("Unit list must be a JSON array");
            }

            UnitRegistry registry = standard();
            for (const auto &entry : j)
            {
                registry.add_unit(UnitDefinition::from_json(entry));
            }
            return registry;
        }

        void UnitRegistry::add_unit(const UnitDefinition &definition)
        {
            if (!std::isfinite(definition.factor) || definition.factor <= 0.0)
            {
                throw std::invalid_argument("Factor of unit '" + definition.name + "' must be positive and finite");
            }

            auto it = units_.find(definition.name);
            if (it != units_.end() && it->second.dimension != definition.dimension)
            {
                throw std::invalid_argument("Unit '" + definition.name + "' is already registered as " +
                                            units::to_string(it->second.dimension));
            }
            units_[definition.name] = definition;
        }

        bool UnitRegistry::contains(const std::string &unit) const
        {
            return units_.count(unit) > 0;
        }

        const UnitDefinition &UnitRegistry::lookup(const std::string &unit) const
        {
            auto it = units_.find(unit);
            if (it == units_.end())
            {
                throw AmbiguousDimensionError("Unknown unit: '" + unit + "'");
            }
            return it->second;
        }

        Dimension UnitRegistry::dimension_of(const std::string &unit) const
        {
            return lookup(unit).dimension;
        }

        double UnitRegistry::factor_of(const std::string &unit) const
        {
            return lookup(unit).factor;
        }

        double UnitRegistry::to_canonical(double magnitude, const std::string &unit) const
        {
            return magnitude * factor_of(unit);
        }

        Eigen::VectorXd UnitRegistry::to_canonical(const Eigen::VectorXd &values, const std::string &unit) const
        {
            return values * factor_of(unit);
        }

        std::vector<UnitDefinition> UnitRegistry::units() const
        {
            std::vector<UnitDefinition> result;
            result.reserve(units_.size());
            for (const auto &kv : units_)
            {
                result.push_back(kv.second);
            }
            return result;
        }

        const std::string &UnitRegistry::canonical_unit(Dimension dimension)
        {
            static const std::string power = "MW";
            static const std::string energy = "MWh";
            static const std::string price = "Eur/MWh";
            static const std::string revenue = "Eur";
            static const std::string dimensionless = "1";

            switch (dimension)
            {
            case Dimension::POWER:
                return power;
            case Dimension::ENERGY:
                return energy;
            case Dimension::PRICE:
                return price;
            case Dimension::REVENUE:
                return revenue;
            case Dimension::DIMENSIONLESS:
                break;
            }
            return dimensionless;
        }

        std::optional<Dimension> UnitRegistry::derive(Dimension a, Operation op, Dimension b)
        {
            if (op == Operation::MULTIPLY)
            {
                if (a == Dimension::DIMENSIONLESS)
                    return b;
                if (b == Dimension::DIMENSIONLESS)
                    return a;
                if ((a == Dimension::ENERGY && b == Dimension::PRICE) ||
                    (a == Dimension::PRICE && b == Dimension::ENERGY))
                    return Dimension::REVENUE;
                return std::nullopt;
            }

            // Division
            if (b == Dimension::DIMENSIONLESS)
                return a;
            if (a == b)
                return Dimension::DIMENSIONLESS;
            if (a == Dimension::REVENUE && b == Dimension::PRICE)
                return Dimension::ENERGY;
            if (a == Dimension::REVENUE && b == Dimension::ENERGY)
                return Dimension::PRICE;
            return std::nullopt;
        }

    } // namespace units
} // namespace powerfolio
