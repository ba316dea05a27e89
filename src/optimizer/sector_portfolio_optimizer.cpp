/**
 * @file sector_portfolio_optimizer.cpp
 * @brief Implementation of the sector-constrained Sharpe optimizer
 */

#include "sectoropt/optimizer/sector_portfolio_optimizer.hpp"
#include <iostream>
#include <stdexcept>

namespace sectoropt
{
    namespace optimizer
    {

        namespace
        {
            data::SectorMapping mapping_from_pairs(const std::vector<std::pair<std::string, std::string>> &asset_sectors,
                                                   const std::vector<std::string> &sectors)
            {
                std::vector<std::string> assets;
                std::vector<std::string> asset_sector;
                assets.reserve(asset_sectors.size());
                asset_sector.reserve(asset_sectors.size());

                for (const auto &pair : asset_sectors)
                {
                    assets.push_back(pair.first);
                    asset_sector.push_back(pair.second);
                }

                return data::SectorMapping(assets, asset_sector, sectors);
            }
        } // namespace

        // ====================================================================
        // OptimizerSettings
        // ====================================================================

        OptimizerSettings OptimizerSettings::from_json(const nlohmann::json &j)
        {
            OptimizerSettings settings;

            if (j.contains("risk_model"))
            {
                settings.risk_model = risk::RiskModelConfig::from_json(j["risk_model"]);
            }
            if (j.contains("objective"))
            {
                settings.objective = ObjectiveSettings::from_json(j["objective"]);
            }
            if (j.contains("solver"))
            {
                settings.solver = SqpOptions::from_json(j["solver"]);
            }

            return settings;
        }

        nlohmann::json OptimizerSettings::to_json() const
        {
            return nlohmann::json{
                {"risk_model", risk_model.to_json()},
                {"objective", objective.to_json()},
                {"solver", solver.to_json()}};
        }

        // ====================================================================
        // SectorPortfolioOptimizer
        // ====================================================================

        SectorPortfolioOptimizer::SectorPortfolioOptimizer(data::SectorMapping mapping,
                                                           OptimizerSettings settings)
            : mapping_(std::move(mapping)),
              settings_(std::move(settings))
        {
            if (mapping_.empty())
            {
                throw std::invalid_argument("Sector mapping must contain at least one asset");
            }

            settings_.objective.validate();
            settings_.solver.validate();
            risk_model_ = risk::RiskModelFactory::create(settings_.risk_model);

            // No bounds yet: every sector unconstrained
            constraint_set_ = SectorConstraintBuilder::build(mapping_, bounds_);
        }

        SectorPortfolioOptimizer::SectorPortfolioOptimizer(
            const std::vector<std::pair<std::string, std::string>> &asset_sectors,
            const std::vector<std::string> &sectors,
            OptimizerSettings settings)
            : SectorPortfolioOptimizer(mapping_from_pairs(asset_sectors, sectors), std::move(settings))
        {
        }

        void SectorPortfolioOptimizer::set_returns(const data::ReturnSeries &returns)
        {
            data::ReturnSeries aligned = returns.select_assets(mapping_.get_asset_names());

            const size_t incomplete = aligned.count_incomplete_rows();
            if (incomplete > 0)
            {
                aligned = aligned.drop_missing();
                if (settings_.solver.verbose)
                {
                    std::cout << "Dropped " << incomplete << " rows with missing returns\n";
                }
            }

            if (aligned.num_observations() < 2)
            {
                throw InsufficientDataError(
                    "At least 2 complete return observations are required, got " +
                    std::to_string(aligned.num_observations()));
            }

            if (aligned.num_observations() < aligned.num_assets())
            {
                std::cerr << "Warning: " << aligned.num_observations() << " observations for "
                          << aligned.num_assets() << " assets; sample covariance is rank deficient\n";
            }

            Eigen::MatrixXd covariance = risk_model_->estimate_covariance(aligned.get_returns());

            double shrinkage = 0.0;
            if (const auto *ledoit_wolf = dynamic_cast<const risk::LedoitWolfShrinkage *>(risk_model_.get()))
            {
                shrinkage = ledoit_wolf->get_shrinkage_intensity();
            }

            mean_returns_ = aligned.mean_returns();
            covariance_ = std::move(covariance);
            shrinkage_intensity_ = shrinkage;
            returns_ = std::move(aligned);
            has_returns_ = true;
        }

        void SectorPortfolioOptimizer::set_prices(const Eigen::MatrixXd &prices,
                                                  const std::vector<std::string> &tickers,
                                                  const std::vector<std::string> &dates)
        {
            set_returns(data::ReturnSeries::from_prices(prices, tickers, dates));
        }

        void SectorPortfolioOptimizer::set_sector_bounds(const SectorBoundsMap &bounds)
        {
            ConstraintSet constraint_set = SectorConstraintBuilder::build(mapping_, bounds, settings_.solver.verbose);

            bounds_ = bounds;
            constraint_set_ = std::move(constraint_set);
        }

        void SectorPortfolioOptimizer::set_sector_bounds(const std::map<std::string, double> &min_bounds,
                                                         const std::map<std::string, double> &max_bounds)
        {
            set_sector_bounds(SectorConstraintBuilder::merge_bounds(min_bounds, max_bounds));
        }

        void SectorPortfolioOptimizer::require_returns() const
        {
            if (!has_returns_)
            {
                throw std::logic_error("No return data: call set_returns() before optimizing");
            }
        }

        OptimizationOutcome SectorPortfolioOptimizer::try_optimize() const
        {
            require_returns();

            SharpeObjective objective(mean_returns_, covariance_, settings_.objective);
            SqpSolver solver(settings_.solver);

            SqpResult sqp = solver.solve(objective, constraint_set_.to_linear_constraints());

            OptimizationOutcome outcome;
            outcome.success = sqp.success;
            outcome.status = sqp.status;
            outcome.message = sqp.message;
            outcome.iterations = sqp.iterations;

            if (!sqp.success)
            {
                if (settings_.solver.verbose)
                {
                    std::cerr << "Warning: optimization did not converge: " << sqp.message << "\n";
                }
                return outcome;
            }

            PortfolioResult result = build_portfolio_result(sqp.solution, mapping_, objective);
            result.iterations = sqp.iterations;
            result.message = sqp.message;
            result.shrinkage_intensity = shrinkage_intensity_;

            outcome.portfolio = std::move(result);
            return outcome;
        }

        PortfolioResult SectorPortfolioOptimizer::optimize() const
        {
            OptimizationOutcome outcome = try_optimize();

            if (!outcome.success)
            {
                throw OptimizationFailedError(outcome.status, outcome.message);
            }

            return std::move(*outcome.portfolio);
        }

        nlohmann::json SectorPortfolioOptimizer::get_parameters() const
        {
            nlohmann::json bounds_json = nlohmann::json::object();
            for (const auto &entry : bounds_)
            {
                bounds_json[entry.first] = entry.second.to_json();
            }

            nlohmann::json params = settings_.to_json();
            params["universe"] = mapping_.to_json();
            params["sector_bounds"] = bounds_json;
            params["unconstrained_sectors"] = constraint_set_.unconstrained_sectors();
            params["risk_model"]["name"] = risk_model_->get_name();
            params["num_observations"] = has_returns_ ? returns_.num_observations() : 0;
            params["shrinkage_intensity"] = shrinkage_intensity_;

            return params;
        }

    } // namespace optimizer
} // namespace sectoropt
