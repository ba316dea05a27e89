/**
 * @file optimizer_config.cpp
 * @brief Implementation of OptimizerConfig parsing
 */

#include "sectoropt/optimizer/optimizer_config.hpp"
#include "sectoropt/data/data_loader.hpp"
#include <stdexcept>

namespace sectoropt
{
    namespace optimizer
    {

        OptimizerConfig OptimizerConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object() || !j.contains("universe"))
            {
                throw std::invalid_argument("Configuration must contain a 'universe' section");
            }

            OptimizerConfig config;
            config.universe = data::SectorMapping::from_json(j["universe"]);
            config.settings = OptimizerSettings::from_json(j);

            if (j.contains("sector_bounds"))
            {
                config.sector_bounds = SectorConstraintBuilder::bounds_from_json(j["sector_bounds"]);
            }

            if (j.contains("data"))
            {
                const auto &data_section = j["data"];
                config.prices_file = data_section.value("prices_file", "");
                config.returns_file = data_section.value("returns_file", "");
            }

            return config;
        }

        OptimizerConfig OptimizerConfig::load(const std::string &config_path)
        {
            return from_json(data::DataLoader::load_json(config_path));
        }

        nlohmann::json OptimizerConfig::to_json() const
        {
            nlohmann::json bounds_json = nlohmann::json::object();
            for (const auto &entry : sector_bounds)
            {
                bounds_json[entry.first] = entry.second.to_json();
            }

            nlohmann::json j = settings.to_json();
            j["universe"] = universe.to_json();
            j["sector_bounds"] = bounds_json;
            j["data"] = {{"prices_file", prices_file}, {"returns_file", returns_file}};
            return j;
        }

    } // namespace optimizer
} // namespace sectoropt
