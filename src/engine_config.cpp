/**
 * @file engine_config.cpp
 * @brief Implementation of EngineConfig
 */

#include "engine_config.hpp"

#include <fstream>
#include <stdexcept>

namespace powerfolio
{

    EngineConfig EngineConfig::from_json(const nlohmann::json &j)
    {
        const nlohmann::json &engine = j.contains("engine") ? j["engine"] : j;
        if (!engine.is_object())
        {
            throw std::invalid_argument("Engine configuration must be a JSON object");
        }

        EngineConfig config;
        config.rtol = engine.value("rtol", 1e-7);
        config.atol = engine.value("atol", 1e-9);
        config.strict = engine.value("strict", false);
        config.warnings = engine.value("warnings", "stderr");

        if (config.rtol < 0.0 || config.atol < 0.0)
        {
            throw std::invalid_argument("Tolerances must be non-negative");
        }
        if (config.warnings != "stderr" && config.warnings != "collect" && config.warnings != "none")
        {
            throw std::invalid_argument("Unknown warnings target: " + config.warnings +
                                        " (expected stderr, collect or none)");
        }

        if (engine.contains("units"))
        {
            const auto &list = engine["units"];
            if (!list.is_array())
            {
                throw std::invalid_argument("'units' must be a JSON array");
            }
            for (const auto &entry : list)
            {
                config.units.push_back(units::UnitDefinition::from_json(entry));
            }
        }

        return config;
    }

    nlohmann::json EngineConfig::to_json() const
    {
        nlohmann::json unit_list = nlohmann::json::array();
        for (const auto &u : units)
        {
            unit_list.push_back(u.to_json());
        }

        return nlohmann::json{
            {"engine",
             {{"rtol", rtol},
              {"atol", atol},
              {"strict", strict},
              {"warnings", warnings},
              {"units", unit_list}}}};
    }

    EngineConfig EngineConfig::load_from_file(const std::string &config_path)
    {
        std::ifstream file(config_path);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + config_path);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        try
        {
            return from_json(j);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument("Invalid engine configuration: " + std::string(e.what()));
        }
    }

} // namespace powerfolio
