/**
 * @file sharpe_objective.cpp
 * @brief Implementation of the Sharpe ratio objective
 */

#include "sectoropt/optimizer/sharpe_objective.hpp"
#include "sectoropt/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace sectoropt
{
    namespace optimizer
    {

        // ====================================================================
        // ObjectiveSettings
        // ====================================================================

        void ObjectiveSettings::validate() const
        {
            if (!(periods_per_year > 0.0))
            {
                throw std::invalid_argument(
                    "periods_per_year must be positive, got: " + std::to_string(periods_per_year));
            }

            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument("risk_free_rate must be finite");
            }

            if (!(volatility_floor >= 0.0))
            {
                throw std::invalid_argument(
                    "volatility_floor must be non-negative, got: " + std::to_string(volatility_floor));
            }

            if (!(penalty > 0.0))
            {
                throw std::invalid_argument(
                    "penalty must be positive, got: " + std::to_string(penalty));
            }
        }

        ObjectiveSettings ObjectiveSettings::from_json(const nlohmann::json &j)
        {
            ObjectiveSettings settings;
            settings.periods_per_year = j.value("periods_per_year", settings.periods_per_year);
            settings.risk_free_rate = j.value("risk_free_rate", settings.risk_free_rate);
            settings.volatility_floor = j.value("volatility_floor", settings.volatility_floor);
            settings.penalty = j.value("penalty", settings.penalty);
            settings.validate();
            return settings;
        }

        nlohmann::json ObjectiveSettings::to_json() const
        {
            return nlohmann::json{
                {"periods_per_year", periods_per_year},
                {"risk_free_rate", risk_free_rate},
                {"volatility_floor", volatility_floor},
                {"penalty", penalty}};
        }

        // ====================================================================
        // SharpeObjective
        // ====================================================================

        SharpeObjective::SharpeObjective(const Eigen::VectorXd &mean_returns,
                                         const Eigen::MatrixXd &covariance,
                                         const ObjectiveSettings &settings)
            : settings_(settings)
        {
            settings_.validate();

            const Eigen::Index n = mean_returns.size();
            if (n == 0)
            {
                throw std::invalid_argument("Mean returns vector is empty");
            }

            if (covariance.rows() != n || covariance.cols() != n)
            {
                std::ostringstream oss;
                oss << "Covariance must be " << n << "x" << n << ", got "
                    << covariance.rows() << "x" << covariance.cols();
                throw std::invalid_argument(oss.str());
            }

            if (!mean_returns.allFinite() || !covariance.allFinite())
            {
                throw std::invalid_argument("Mean returns or covariance contain NaN or Inf");
            }

            annual_returns_ = settings_.periods_per_year * mean_returns;
            annual_covariance_ = settings_.periods_per_year * covariance;
        }

        void SharpeObjective::check_dimension(const Eigen::VectorXd &weights) const
        {
            if (weights.size() != annual_returns_.size())
            {
                throw std::invalid_argument(
                    "Weight vector size (" + std::to_string(weights.size()) +
                    ") does not match number of assets (" + std::to_string(annual_returns_.size()) + ")");
            }
        }

        double SharpeObjective::portfolio_return(const Eigen::VectorXd &weights) const
        {
            check_dimension(weights);
            return annual_returns_.dot(weights);
        }

        double SharpeObjective::portfolio_volatility(const Eigen::VectorXd &weights) const
        {
            check_dimension(weights);
            const double variance = weights.dot(annual_covariance_ * weights);
            // Round-off can push a PSD quadratic form slightly negative
            return std::sqrt(std::max(0.0, variance));
        }

        double SharpeObjective::value(const Eigen::VectorXd &weights) const
        {
            const double vol = portfolio_volatility(weights);
            if (vol <= settings_.volatility_floor)
            {
                return settings_.penalty;
            }

            return -(portfolio_return(weights) - settings_.risk_free_rate) / vol;
        }

        Eigen::VectorXd SharpeObjective::gradient(const Eigen::VectorXd &weights) const
        {
            const double vol = portfolio_volatility(weights);
            if (vol <= settings_.volatility_floor)
            {
                return -annual_returns_;
            }

            const double excess = portfolio_return(weights) - settings_.risk_free_rate;
            Eigen::VectorXd sigma_w = annual_covariance_ * weights;

            Eigen::VectorXd d_sharpe = annual_returns_ / vol - (excess / (vol * vol * vol)) * sigma_w;
            return -d_sharpe;
        }

        double SharpeObjective::sharpe_ratio(const Eigen::VectorXd &weights) const
        {
            const double vol = portfolio_volatility(weights);
            if (vol <= settings_.volatility_floor)
            {
                std::ostringstream oss;
                oss << "Sharpe ratio undefined: portfolio volatility " << vol
                    << " is at or below floor " << settings_.volatility_floor;
                throw UndefinedRatioError(oss.str());
            }

            return (portfolio_return(weights) - settings_.risk_free_rate) / vol;
        }

        PortfolioStatistics SharpeObjective::statistics(const Eigen::VectorXd &weights) const
        {
            PortfolioStatistics stats;
            stats.sharpe_ratio = sharpe_ratio(weights);
            stats.expected_return = portfolio_return(weights);
            stats.volatility = portfolio_volatility(weights);
            return stats;
        }

    } // namespace optimizer
} // namespace sectoropt
