/**
 * @file portfolio_result.hpp
 * @brief Read-only snapshot of an optimized sector portfolio
 */

#pragma once

#include "sectoropt/data/sector_mapper.hpp"
#include "sectoropt/optimizer/sharpe_objective.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace sectoropt
{
    namespace optimizer
    {

        /**
         * @struct PortfolioResult
         * @brief Optimal weights with sector aggregates and annualized statistics
         *
         * Asset and sector entries keep mapping order in `assets` and
         * `sectors`; the maps are keyed by name for lookup.
         */
        struct PortfolioResult
        {
            std::vector<std::string> assets;             ///< Asset order of `weights`
            std::vector<std::string> sectors;            ///< Sector order of the mapping
            Eigen::VectorXd weights;                     ///< Optimal weights (mapping order)
            std::map<std::string, double> asset_weights;  ///< Asset -> weight
            std::map<std::string, double> sector_weights; ///< Sector -> aggregate weight

            double portfolio_return = 0.0;     ///< Annualized expected return
            double portfolio_volatility = 0.0; ///< Annualized volatility
            double sharpe_ratio = 0.0;         ///< (return - r_f) / volatility

            int iterations = 0;               ///< Solver iterations
            std::string message;              ///< Solver termination message
            double shrinkage_intensity = 0.0; ///< Covariance shrinkage used

            /**
             * @brief JSON object: weights, sector_weights, statistics, diagnostics
             */
            nlohmann::json to_json() const;

            /**
             * @brief Print statistics and allocations to stdout
             */
            void print_summary() const;
        };

        /**
         * @brief Assemble a PortfolioResult from a weight vector
         * @param weights Weight vector in mapping order
         * @param mapping Asset -> sector mapping
         * @param objective Objective used to evaluate the statistics
         * @throws std::invalid_argument on dimension mismatch
         * @throws UndefinedRatioError if the portfolio has negligible volatility
         */
        PortfolioResult build_portfolio_result(const Eigen::VectorXd &weights,
                                               const data::SectorMapping &mapping,
                                               const SharpeObjective &objective);

    } // namespace optimizer
} // namespace sectoropt
