/**
 * @file risk_model.cpp
 * @brief Implementation of RiskModel base class utilities
 */

#include "sectoropt/risk/risk_model.hpp"
#include "sectoropt/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sectoropt
{
    namespace risk
    {
        Eigen::MatrixXd RiskModel::estimate_correlation(const Eigen::MatrixXd &returns)
            const
        {
            Eigen::MatrixXd covariance = estimate_covariance(returns);
            return covariance_to_correlation(covariance);
        }

        void RiskModel::validate_returns(const Eigen::MatrixXd &returns)
        {
            if (returns.cols() == 0)
            {
                throw std::invalid_argument("Returns matrix has no asset columns.");
            }

            // Minimum number of observations
            if (returns.rows() < 2)
            {
                throw InsufficientDataError(
                    "Not enough observations to estimate covariance. At least 2 valid observations are required, received: " +
                    std::to_string(returns.rows()));
            }

            if (!returns.allFinite())
            {
                throw std::invalid_argument("Returns matrix contains NaN or Inf values.");
            }
        }

        Eigen::MatrixXd RiskModel::covariance_to_correlation(const Eigen::MatrixXd &covariance)
        {
            const Eigen::Index n = covariance.rows();

            if (n == 0 || covariance.cols() != n)
            {
                throw std::runtime_error("Covariance matrix must be square and non-empty");
            }

            Eigen::VectorXd std_devs = covariance.diagonal().array().sqrt();

            for (Eigen::Index i = 0; i < n; ++i)
            {
                if (!(std_devs(i) > 0.0))
                {
                    throw std::runtime_error("Covariance matrix has non-positive diagonal element at index " +
                                             std::to_string(i) + ": " + std::to_string(covariance(i, i)));
                }
            }

            // corr(i,j) = cov(i,j) / (std(i) * std(j))
            Eigen::MatrixXd correlation(n, n);

            for (Eigen::Index i = 0; i < n; ++i)
            {
                for (Eigen::Index j = 0; j < n; ++j)
                {
                    if (i == j)
                    {
                        correlation(i, j) = 1.0;
                    }
                    else
                    {
                        // Clamp to [-1, 1] to absorb rounding
                        double c = covariance(i, j) / (std_devs(i) * std_devs(j));
                        correlation(i, j) = std::max(-1.0, std::min(1.0, c));
                    }
                }
            }

            return correlation;
        }

        Eigen::MatrixXd RiskModel::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }
    } // namespace risk
} // namespace sectoropt
