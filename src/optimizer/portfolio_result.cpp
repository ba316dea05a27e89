/**
 * @file portfolio_result.cpp
 * @brief Implementation of result aggregation
 */

#include "sectoropt/optimizer/portfolio_result.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace sectoropt
{
    namespace optimizer
    {

        PortfolioResult build_portfolio_result(const Eigen::VectorXd &weights,
                                               const data::SectorMapping &mapping,
                                               const SharpeObjective &objective)
        {
            if (static_cast<size_t>(weights.size()) != mapping.size())
            {
                throw std::invalid_argument(
                    "Weight vector size (" + std::to_string(weights.size()) +
                    ") does not match mapping size (" + std::to_string(mapping.size()) + ")");
            }

            PortfolioResult result;
            result.assets = mapping.get_asset_names();
            result.sectors = mapping.get_sectors();
            result.weights = weights;

            for (size_t i = 0; i < result.assets.size(); ++i)
            {
                result.asset_weights[result.assets[i]] = weights(static_cast<Eigen::Index>(i));
            }

            for (const auto &sector : result.sectors)
            {
                double total = 0.0;
                for (int idx : mapping.get_assets_in_sector(sector))
                {
                    total += weights(idx);
                }
                result.sector_weights[sector] = total;
            }

            PortfolioStatistics stats = objective.statistics(weights);
            result.portfolio_return = stats.expected_return;
            result.portfolio_volatility = stats.volatility;
            result.sharpe_ratio = stats.sharpe_ratio;

            return result;
        }

        nlohmann::json PortfolioResult::to_json() const
        {
            nlohmann::json weights_json = nlohmann::json::object();
            for (const auto &asset : assets)
            {
                weights_json[asset] = asset_weights.at(asset);
            }

            nlohmann::json sectors_json = nlohmann::json::object();
            for (const auto &sector : sectors)
            {
                sectors_json[sector] = sector_weights.at(sector);
            }

            return nlohmann::json{
                {"weights", weights_json},
                {"sector_weights", sectors_json},
                {"portfolio_return", portfolio_return},
                {"portfolio_volatility", portfolio_volatility},
                {"sharpe_ratio", sharpe_ratio},
                {"iterations", iterations},
                {"message", message},
                {"shrinkage_intensity", shrinkage_intensity}};
        }

        void PortfolioResult::print_summary() const
        {
            std::cout << "\n=== Portfolio Statistics ===\n";
            std::cout << "Expected Annual Return: " << std::fixed << std::setprecision(2)
                      << portfolio_return * 100 << "%\n";
            std::cout << "Annual Volatility:      " << portfolio_volatility * 100 << "%\n";
            std::cout << "Sharpe Ratio:           " << sharpe_ratio << "\n";
            std::cout << "Solver:                 " << message << " (" << iterations << " iterations)\n";
            std::cout << std::string(50, '-') << "\n";

            std::cout << "Sector Allocation:\n";
            for (const auto &sector : sectors)
            {
                std::cout << "  " << std::left << std::setw(24) << sector << std::right
                          << std::setw(8) << sector_weights.at(sector) * 100 << "%\n";
            }

            std::cout << "\nAsset Weights:\n";
            for (const auto &asset : assets)
            {
                const double w = asset_weights.at(asset);
                if (w > 1e-6)
                {
                    std::cout << "  " << std::left << std::setw(24) << asset << std::right
                              << std::setw(8) << w * 100 << "%\n";
                }
            }

            std::cout << "============================\n"
                      << std::endl;
        }

    } // namespace optimizer
} // namespace sectoropt
