/**
 * @file risk_model_factory.hpp
 * @brief Factory for creating risk models from configuration
 *
 * Allows configuration-driven selection of the covariance estimator.
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "risk_model": {
 *     "type": "ledoit_wolf",
 *     "shrinkage_intensity": -1.0
 *   }
 * }
 * @endcode
 */

#pragma once

#include "sectoropt/risk/risk_model.hpp"
#include "sectoropt/risk/sample_covariance.hpp"
#include "sectoropt/risk/ledoit_wolf_shrinkage.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace sectoropt
{
    namespace risk
    {

        /**
         * @struct RiskModelConfig
         * @brief Configuration parameters for risk model creation
         *
         * Unused parameters are ignored based on the model type.
         */
        struct RiskModelConfig
        {
            /**
             * @brief Type of risk model
             *
             * Supported values (case-insensitive):
             * - "ledoit_wolf" or "shrinkage": LedoitWolfShrinkage (default)
             * - "sample" or "sample_covariance": SampleCovariance
             */
            std::string type = "ledoit_wolf";

            /**
             * @brief Apply Bessel's correction (n-1 vs n)
             *
             * Used by: SampleCovariance
             */
            bool bias_correction = true;

            /**
             * @brief Fixed shrinkage intensity override
             *
             * Used by: LedoitWolfShrinkage
             * Valid range: [0, 1] or -1 for auto (default)
             */
            double shrinkage_intensity = -1.0;

            /**
             * @brief Create configuration from JSON
             * @param j JSON object containing risk model configuration
             * @return RiskModelConfig structure
             *
             * Provides defaults for missing fields.
             */
            static RiskModelConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
        };

        /**
         * @class RiskModelFactory
         * @brief Factory for creating risk model instances
         *
         * Usage Pattern:
         * @code
         * auto config = RiskModelConfig::from_json(json_obj);
         * auto model = RiskModelFactory::create(config);
         * auto cov = model->estimate_covariance(returns);
         * @endcode
         */
        class RiskModelFactory
        {
        public:
            /**
             * @brief Create risk model from configuration
             * @param config Configuration structure
             * @return Unique pointer to created risk model
             * @throws std::invalid_argument if type is unknown or parameters invalid
             */
            static std::unique_ptr<RiskModel> create(const RiskModelConfig &config);

            /**
             * @brief Create risk model from type string and JSON parameters
             */
            static std::unique_ptr<RiskModel> create(
                const std::string &type,
                const nlohmann::json &params);

            static std::unique_ptr<RiskModel> create_sample_covariance(
                bool bias_correction = true);

            static std::unique_ptr<RiskModel> create_ledoit_wolf(
                double shrinkage_override = -1.0);

            /**
             * @brief Get list of supported risk model types
             */
            static std::vector<std::string> get_supported_types();

        private:
            /**
             * @brief Normalize type string (lowercase)
             */
            static std::string normalize_type(const std::string &type);
        };

    } // namespace risk
} // namespace sectoropt
