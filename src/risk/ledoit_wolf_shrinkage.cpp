/**
 * @file ledoit_wolf_shrinkage.cpp
 * @brief Implementation of Ledoit-Wolf shrinkage estimator
 */

#include "sectoropt/risk/ledoit_wolf_shrinkage.hpp"
#include "sectoropt/risk/sample_covariance.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sectoropt
{
    namespace risk
    {

        LedoitWolfShrinkage::LedoitWolfShrinkage(double shrinkage_override)
            : shrinkage_override_(shrinkage_override), last_shrinkage_(0.0)
        {
            validate_shrinkage(shrinkage_override);
        }

        void LedoitWolfShrinkage::validate_shrinkage(double shrinkage)
        {
            if (shrinkage == -1.0)
            {
                return;
            }

            if (!(shrinkage >= 0.0 && shrinkage <= 1.0))
            {
                throw std::invalid_argument(
                    "Shrinkage override must be in [0, 1] or -1 for auto, got: " +
                    std::to_string(shrinkage));
            }
        }

        Eigen::MatrixXd LedoitWolfShrinkage::estimate_covariance(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);

            const Eigen::Index n_assets = returns.cols();

            // Step 1: maximum-likelihood sample covariance S = XᵀX / T
            SampleCovariance sample_estimator(false);
            Eigen::MatrixXd sample_cov = sample_estimator.estimate_covariance(returns);

            Eigen::RowVectorXd means = returns.colwise().mean();
            Eigen::MatrixXd centered = returns.rowwise() - means;

            // Step 2: scaled identity target F = μI
            const double mu = sample_cov.trace() / static_cast<double>(n_assets);

            // Step 3: shrinkage intensity
            double shrinkage;
            if (shrinkage_override_ >= 0.0)
            {
                shrinkage = shrinkage_override_;
            }
            else
            {
                shrinkage = compute_shrinkage_intensity(centered, sample_cov, mu);
            }

            last_shrinkage_ = shrinkage;

            // Step 4: δ*F + (1-δ)*S
            Eigen::MatrixXd shrunk_cov = (1.0 - shrinkage) * sample_cov;
            shrunk_cov.diagonal().array() += shrinkage * mu;

            return ensure_symmetric(shrunk_cov);
        }

        std::string LedoitWolfShrinkage::get_name() const
        {
            return "LedoitWolfShrinkage";
        }

        double LedoitWolfShrinkage::compute_shrinkage_intensity(
            const Eigen::MatrixXd &centered,
            const Eigen::MatrixXd &sample_cov,
            double mu)
        {
            const Eigen::Index n_obs = centered.rows();
            const Eigen::Index n_assets = centered.cols();

            // A single asset is its own target
            if (n_assets == 1)
            {
                return 0.0;
            }

            const double t = static_cast<double>(n_obs);
            const double n = static_cast<double>(n_assets);

            // d²: distance between sample covariance and target
            Eigen::MatrixXd diff_target = sample_cov;
            diff_target.diagonal().array() -= mu;
            const double d2 = diff_target.squaredNorm() / n;

            // β̄²: dispersion of the per-observation outer products around S
            double beta_sum = 0.0;
            for (Eigen::Index k = 0; k < n_obs; ++k)
            {
                Eigen::VectorXd x_k = centered.row(k).transpose();
                beta_sum += (x_k * x_k.transpose() - sample_cov).squaredNorm();
            }
            const double beta2 = beta_sum / (n * t * t);

            // Target coincides with the sample covariance
            if (d2 <= 0.0)
            {
                return 0.0;
            }

            const double shrinkage = std::min(beta2, d2) / d2;
            return std::max(0.0, std::min(1.0, shrinkage));
        }

    } // namespace risk
} // namespace sectoropt
