/**
 * @file sample_covariance.cpp
 * @brief Implementation of sample covariance estimator
 */

#include "sectoropt/risk/sample_covariance.hpp"

namespace sectoropt
{
    namespace risk
    {

        SampleCovariance::SampleCovariance(bool bias_correction) : bias_correction_(bias_correction)
        {
        }

        Eigen::MatrixXd SampleCovariance::estimate_covariance(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);

            const Eigen::Index n_obs = returns.rows();

            // Center each asset's returns on its mean
            Eigen::RowVectorXd means = returns.colwise().mean();
            Eigen::MatrixXd centered = returns.rowwise() - means;

            Eigen::MatrixXd covariance = centered.transpose() * centered;

            // Bessel's correction divides by (n-1); maximum likelihood by n
            const double normalization = bias_correction_
                                             ? static_cast<double>(n_obs - 1)
                                             : static_cast<double>(n_obs);

            covariance /= normalization;

            return ensure_symmetric(covariance);
        }

        std::string SampleCovariance::get_name() const
        {
            return "SampleCovariance";
        }

    } // namespace risk
} // namespace sectoropt
