/**
 * @file risk_model.hpp
 * @brief Abstract interface for covariance estimation methods
 *
 * Provides a common interface for the covariance estimators used by the
 * optimizer. All risk models must implement estimate_covariance.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include <Eigen/Dense>
#include <string>
#include <memory>

namespace sectoropt
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Abstract base class for risk model estimation
         *
         * Defines the interface for covariance matrix estimation. Concrete
         * implementations are the sample covariance and Ledoit-Wolf shrinkage.
         *
         * Usage Example:
         * @code
         * std::unique_ptr<RiskModel> risk_model = std::make_unique<LedoitWolfShrinkage>();
         * Eigen::MatrixXd cov = risk_model->estimate_covariance(returns);
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Estimate covariance matrix from return data
             * @param returns Matrix of returns (rows = observations, cols = assets)
             * @return Covariance matrix (n_assets x n_assets)
             * @throws InsufficientDataError if fewer than 2 observations
             * @throws std::invalid_argument if returns has no columns or non-finite values
             *
             * @note The returned matrix is exactly symmetric
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const = 0;

            /**
             * @brief Estimate correlation matrix from return data
             * @param returns Matrix of returns (rows = observations, cols = assets)
             * @return Correlation matrix (n_assets x n_assets)
             *
             * Default implementation: Convert covariance to correlation
             */
            virtual Eigen::MatrixXd estimate_correlation(
                const Eigen::MatrixXd &returns) const;

            /**
             * @brief Get the name of the risk model
             * @return String identifier for the model type
             */
            virtual std::string get_name() const = 0;

        protected:
            /**
             * @brief Validate input returns matrix
             * @param returns Matrix to validate
             * @throws InsufficientDataError if fewer than 2 observations
             * @throws std::invalid_argument for other validation failures
             */
            static void validate_returns(const Eigen::MatrixXd &returns);

            /**
             * @brief Convert covariance matrix to correlation matrix
             * @param covariance Input covariance matrix
             * @return Correlation matrix
             * @throws std::runtime_error if diagonal elements are non-positive
             */
            static Eigen::MatrixXd covariance_to_correlation(
                const Eigen::MatrixXd &covariance);

            /**
             * @brief Symmetrize a matrix: (M + M^T) / 2
             */
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace sectoropt
