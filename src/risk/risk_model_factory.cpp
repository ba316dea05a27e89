/**
 * @file risk_model_factory.cpp
 * @brief Implementation of risk model factory
 */

#include "sectoropt/risk/risk_model_factory.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sectoropt
{
    namespace risk
    {

        // RiskModelConfig implementation
        RiskModelConfig RiskModelConfig::from_json(const nlohmann::json &doc)
        {
            RiskModelConfig config;

            if (doc.contains("type"))
            {
                if (!doc["type"].is_string())
                {
                    throw std::invalid_argument("Risk model 'type' must be a string");
                }
                config.type = doc["type"].get<std::string>();
            }

            config.bias_correction = doc.value("bias_correction", config.bias_correction);
            config.shrinkage_intensity = doc.value("shrinkage_intensity", config.shrinkage_intensity);

            return config;
        }

        nlohmann::json RiskModelConfig::to_json() const
        {
            return nlohmann::json{
                {"type", type},
                {"bias_correction", bias_correction},
                {"shrinkage_intensity", shrinkage_intensity}};
        }

        // RiskModelFactory implementation
        std::string RiskModelFactory::normalize_type(const std::string &type)
        {
            std::string normalized = type;
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return normalized;
        }

        std::unique_ptr<RiskModel> RiskModelFactory::create(const RiskModelConfig &config)
        {
            std::string type = normalize_type(config.type);

            if (type == "ledoit_wolf" || type == "shrinkage")
            {
                return std::make_unique<LedoitWolfShrinkage>(config.shrinkage_intensity);
            }
            else if (type == "sample" || type == "sample_covariance")
            {
                return std::make_unique<SampleCovariance>(config.bias_correction);
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown risk model type: '" + config.type + "'. "
                                                                 "Valid options: ledoit_wolf, sample");
            }
        }

        std::unique_ptr<RiskModel> RiskModelFactory::create(const std::string &type, const nlohmann::json &params)
        {
            nlohmann::json config_json = params.is_null() ? nlohmann::json::object() : params;
            config_json["type"] = type;

            return create(RiskModelConfig::from_json(config_json));
        }

        std::unique_ptr<RiskModel> RiskModelFactory::create_sample_covariance(bool bias_correction)
        {
            return std::make_unique<SampleCovariance>(bias_correction);
        }

        std::unique_ptr<RiskModel> RiskModelFactory::create_ledoit_wolf(double shrinkage_override)
        {
            return std::make_unique<LedoitWolfShrinkage>(shrinkage_override);
        }

        std::vector<std::string> RiskModelFactory::get_supported_types()
        {
            return {
                "ledoit_wolf",
                "shrinkage",
                "sample",
                "sample_covariance"};
        }

    } // namespace risk
} // namespace sectoropt
