/**
 * @file sharpe_objective.hpp
 * @brief Negative annualized Sharpe ratio as a differentiable objective
 *
 * Mathematical formulation (periodic inputs, annualized outputs):
 *
 *   R(w)      = P * mu^T w
 *   sigma(w)  = sqrt(w^T (P * Sigma) w)
 *   S(w)      = (R(w) - r_f) / sigma(w)
 *   f(w)      = -S(w)
 *
 * where P is the number of periods per year.
 */

#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

namespace sectoropt
{
    namespace optimizer
    {

        /**
         * @class ObjectiveFunction
         * @brief Smooth scalar function minimized by SqpSolver
         */
        class ObjectiveFunction
        {
        public:
            virtual ~ObjectiveFunction() = default;

            virtual double value(const Eigen::VectorXd &x) const = 0;

            virtual Eigen::VectorXd gradient(const Eigen::VectorXd &x) const = 0;

            virtual Eigen::Index dimension() const = 0;
        };

        /**
         * @struct ObjectiveSettings
         * @brief Annualization and guard parameters of the Sharpe objective
         */
        struct ObjectiveSettings
        {
            double periods_per_year = 252.0;  ///< Observation periods per year
            double risk_free_rate = 0.0;      ///< Annual risk-free rate
            double volatility_floor = 1e-10;  ///< Volatility at or below this is degenerate
            double penalty = 1e6;             ///< Objective value returned when degenerate

            /**
             * @throws std::invalid_argument on non-positive periods or negative floor/penalty
             */
            void validate() const;

            static ObjectiveSettings from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct PortfolioStatistics
         * @brief Annualized statistics of one weight vector
         */
        struct PortfolioStatistics
        {
            double expected_return = 0.0; ///< Annualized expected return
            double volatility = 0.0;      ///< Annualized volatility
            double sharpe_ratio = 0.0;    ///< (return - r_f) / volatility
        };

        /**
         * @class SharpeObjective
         * @brief f(w) = -Sharpe(w) with analytic gradient
         *
         * Gradient:
         *   dS/dw = mu_a / sigma - (R - r_f) * Sigma_a w / sigma^3
         *
         * When sigma is at or below the floor the ratio is undefined:
         * value() returns +penalty and gradient() returns -mu_a, which
         * points toward higher return. statistics() throws instead.
         */
        class SharpeObjective : public ObjectiveFunction
        {
        public:
            /**
             * @param mean_returns Mean periodic return per asset (N)
             * @param covariance Periodic covariance (N x N)
             * @param settings Annualization and guard parameters
             * @throws std::invalid_argument on dimension mismatch or non-finite input
             */
            SharpeObjective(const Eigen::VectorXd &mean_returns,
                            const Eigen::MatrixXd &covariance,
                            const ObjectiveSettings &settings = ObjectiveSettings());

            double value(const Eigen::VectorXd &weights) const override;

            Eigen::VectorXd gradient(const Eigen::VectorXd &weights) const override;

            Eigen::Index dimension() const override { return annual_returns_.size(); }

            double portfolio_return(const Eigen::VectorXd &weights) const;

            double portfolio_volatility(const Eigen::VectorXd &weights) const;

            /**
             * @throws UndefinedRatioError if volatility is at or below the floor
             */
            double sharpe_ratio(const Eigen::VectorXd &weights) const;

            /**
             * @throws UndefinedRatioError if volatility is at or below the floor
             */
            PortfolioStatistics statistics(const Eigen::VectorXd &weights) const;

            const ObjectiveSettings &get_settings() const { return settings_; }
            const Eigen::VectorXd &annual_returns() const { return annual_returns_; }
            const Eigen::MatrixXd &annual_covariance() const { return annual_covariance_; }

        private:
            void check_dimension(const Eigen::VectorXd &weights) const;

            Eigen::VectorXd annual_returns_;    ///< P * mean returns
            Eigen::MatrixXd annual_covariance_; ///< P * covariance
            ObjectiveSettings settings_;
        };

    } // namespace optimizer
} // namespace sectoropt
