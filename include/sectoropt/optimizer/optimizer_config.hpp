/**
 * @file optimizer_config.hpp
 * @brief JSON configuration for a sector-constrained optimization run
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "universe": { "assets": ["TCS.NS", "SBIN.NS"], "sectors": ["Technology", "Banking"] },
 *   "sector_bounds": { "Technology": { "min": 0.1, "max": 0.6 }, "Banking": [0.1, 0.6] },
 *   "risk_model": { "type": "ledoit_wolf" },
 *   "objective": { "periods_per_year": 252, "risk_free_rate": 0.0 },
 *   "solver": { "max_iterations": 100 },
 *   "data": { "prices_file": "data/prices.csv" }
 * }
 * @endcode
 */

#pragma once

#include "sectoropt/data/sector_mapper.hpp"
#include "sectoropt/optimizer/sector_constraints.hpp"
#include "sectoropt/optimizer/sector_portfolio_optimizer.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sectoropt
{
    namespace optimizer
    {

        /**
         * @struct OptimizerConfig
         * @brief Universe, bounds, settings and data source of one run
         */
        struct OptimizerConfig
        {
            data::SectorMapping universe;  ///< Required
            SectorBoundsMap sector_bounds; ///< Empty means all sectors unconstrained
            OptimizerSettings settings;    ///< Defaults when sections are missing
            std::string prices_file;       ///< Optional wide-format price CSV
            std::string returns_file;      ///< Optional wide-format return CSV

            /**
             * @throws std::invalid_argument if "universe" is missing or malformed
             * @throws InvalidConstraintError if a bound entry is malformed
             */
            static OptimizerConfig from_json(const nlohmann::json &j);

            /**
             * @brief Load and parse a configuration file
             * @throws std::runtime_error on I/O or JSON syntax errors
             */
            static OptimizerConfig load(const std::string &config_path);

            nlohmann::json to_json() const;
        };

    } // namespace optimizer
} // namespace sectoropt
