/**
 * @file engine_config.hpp
 * @brief Configuration of the calculation engine
 *
 * Loaded from a JSON file of the form:
 * {
 *   "engine": {
 *     "rtol": 1e-7, "atol": 1e-9, "strict": false,
 *     "warnings": "stderr",
 *     "units": [ {"name": "ctEur/kWh", "dimension": "price", "factor": 10.0} ]
 *   }
 * }
 */

#ifndef POWERFOLIO_ENGINE_CONFIG_HPP
#define POWERFOLIO_ENGINE_CONFIG_HPP

#include "units/unit_registry.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace powerfolio
{

    /**
     * @struct EngineConfig
     * @brief Tolerances, diagnostics target and extra units.
     */
    struct EngineConfig
    {
        double rtol = 1e-7;                        ///< Relative tolerance of consistency checks
        double atol = 1e-9;                        ///< Absolute tolerance of consistency checks
        bool strict = false;                       ///< Flattening a nested operand is an error
        std::string warnings = "stderr";           ///< Diagnostics target (stderr, collect, none)
        std::vector<units::UnitDefinition> units;  ///< Units added to the standard registry

        /**
         * @brief Load from JSON object
         *
         * Accepts the full document (with an "engine" member) or the engine
         * object itself. Missing members keep their defaults.
         *
         * @throws std::invalid_argument for invalid values
         */
        static EngineConfig from_json(const nlohmann::json &j);

        /**
         * @brief Serialize to the full JSON document.
         */
        nlohmann::json to_json() const;

        /**
         * @brief Load complete configuration from JSON file
         * @throws std::runtime_error if the file cannot be read or parsed
         */
        static EngineConfig load_from_file(const std::string &config_path);
    };

} // namespace powerfolio

#endif // POWERFOLIO_ENGINE_CONFIG_HPP
