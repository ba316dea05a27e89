/**
 * @file sector_portfolio_optimizer.hpp
 * @brief Maximum Sharpe ratio portfolio under sector exposure bounds
 *
 * Ties together the covariance estimator, the constraint builder, the
 * Sharpe objective and the SQP driver.
 *
 * Workflow:
 * 1. Construct with the asset -> sector mapping
 * 2. set_returns() (estimates the covariance)
 * 3. set_sector_bounds() (validated immediately)
 * 4. optimize() or try_optimize()
 */

#pragma once

#include "sectoropt/core/errors.hpp"
#include "sectoropt/data/return_series.hpp"
#include "sectoropt/data/sector_mapper.hpp"
#include "sectoropt/optimizer/portfolio_result.hpp"
#include "sectoropt/optimizer/sector_constraints.hpp"
#include "sectoropt/optimizer/sharpe_objective.hpp"
#include "sectoropt/optimizer/sqp_solver.hpp"
#include "sectoropt/risk/risk_model_factory.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sectoropt
{
    namespace optimizer
    {

        /**
         * @struct OptimizerSettings
         * @brief Risk model, objective and solver configuration
         */
        struct OptimizerSettings
        {
            risk::RiskModelConfig risk_model; ///< Covariance estimator (Ledoit-Wolf by default)
            ObjectiveSettings objective;      ///< Annualization and zero-volatility guard
            SqpOptions solver;                ///< SQP termination settings

            static OptimizerSettings from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct OptimizationOutcome
         * @brief Non-throwing result of an optimization attempt
         *
         * `portfolio` is set only when `success` is true.
         */
        struct OptimizationOutcome
        {
            bool success = false;
            SolverStatus status = SolverStatus::ITERATION_LIMIT;
            std::string message;
            int iterations = 0;
            std::optional<PortfolioResult> portfolio;

            explicit operator bool() const { return success; }
        };

        /**
         * @class SectorPortfolioOptimizer
         * @brief Long-only, fully-invested maximum Sharpe portfolio with sector bounds
         *
         * Sectors without configured bounds are unconstrained.
         *
         * Usage Example:
         * @code
         * SectorPortfolioOptimizer optimizer(mapping);
         * optimizer.set_returns(series);
         * optimizer.set_sector_bounds({{"Technology", {0.1, 0.4}}, {"Banking", {0.1, 0.4}}});
         * PortfolioResult result = optimizer.optimize();
         * result.print_summary();
         * @endcode
         *
         * Thread Safety: not thread-safe; one instance per thread.
         */
        class SectorPortfolioOptimizer
        {
        public:
            /**
             * @param mapping Asset -> sector mapping; fixes the asset order
             * @param settings Risk model, objective and solver settings
             * @throws std::invalid_argument if the mapping is empty or settings are invalid
             */
            explicit SectorPortfolioOptimizer(data::SectorMapping mapping,
                                              OptimizerSettings settings = OptimizerSettings());

            /**
             * @brief Construct from (asset, sector) pairs and the full sector list
             * @throws std::invalid_argument if a listed sector holds no asset
             */
            SectorPortfolioOptimizer(const std::vector<std::pair<std::string, std::string>> &asset_sectors,
                                     const std::vector<std::string> &sectors,
                                     OptimizerSettings settings = OptimizerSettings());

            /**
             * @brief Ingest returns and estimate the covariance
             *
             * Columns are aligned to the mapping order; rows with missing
             * values are dropped.
             *
             * @throws std::invalid_argument if a mapped asset has no column
             * @throws InsufficientDataError if fewer than two complete rows remain
             */
            void set_returns(const data::ReturnSeries &returns);

            /**
             * @brief Convert prices to simple returns, then ingest them
             */
            void set_prices(const Eigen::MatrixXd &prices,
                            const std::vector<std::string> &tickers,
                            const std::vector<std::string> &dates = {});

            /**
             * @throws InvalidConstraintError on invalid or jointly infeasible bounds
             */
            void set_sector_bounds(const SectorBoundsMap &bounds);

            /**
             * @brief Two-dictionary form; a side missing from one map defaults to 0 / 1
             */
            void set_sector_bounds(const std::map<std::string, double> &min_bounds,
                                   const std::map<std::string, double> &max_bounds);

            /**
             * @brief Solve for the maximum Sharpe portfolio
             * @throws std::logic_error if no returns were ingested
             * @throws OptimizationFailedError if the solver does not converge
             */
            PortfolioResult optimize() const;

            /**
             * @brief Solve without throwing on non-convergence
             * @throws std::logic_error if no returns were ingested
             */
            OptimizationOutcome try_optimize() const;

            bool has_returns() const { return has_returns_; }

            const data::SectorMapping &get_mapping() const { return mapping_; }
            const data::ReturnSeries &get_returns() const { return returns_; }
            const Eigen::MatrixXd &get_covariance() const { return covariance_; }
            const Eigen::VectorXd &get_mean_returns() const { return mean_returns_; }
            double get_shrinkage_intensity() const { return shrinkage_intensity_; }
            const SectorBoundsMap &get_sector_bounds() const { return bounds_; }
            const ConstraintSet &get_constraint_set() const { return constraint_set_; }
            const OptimizerSettings &get_settings() const { return settings_; }

            /**
             * @brief Configuration and state as JSON
             */
            nlohmann::json get_parameters() const;

        private:
            void require_returns() const;

            data::SectorMapping mapping_;
            OptimizerSettings settings_;
            std::unique_ptr<risk::RiskModel> risk_model_;

            data::ReturnSeries returns_;     ///< Aligned, complete rows only
            Eigen::VectorXd mean_returns_;   ///< Periodic mean per asset
            Eigen::MatrixXd covariance_;     ///< Periodic covariance
            double shrinkage_intensity_ = 0.0;
            bool has_returns_ = false;

            SectorBoundsMap bounds_;
            ConstraintSet constraint_set_;
        };

    } // namespace optimizer
} // namespace sectoropt
