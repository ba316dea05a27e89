/**
 * @file linear_constraints.cpp
 * @brief Implementation of LinearConstraints
 */

#include "sectoropt/optimizer/linear_constraints.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace sectoropt
{
    namespace optimizer
    {

        void LinearConstraints::validate() const
        {
            const Eigen::Index n = lower_bounds.size();

            if (n == 0)
            {
                throw std::invalid_argument("Constraint set has no variables");
            }
            if (upper_bounds.size() != n)
            {
                throw std::invalid_argument("Upper bounds size does not match problem dimension");
            }
            if (!lower_bounds.allFinite() || !upper_bounds.allFinite())
            {
                throw std::invalid_argument("Box bounds contain NaN or Inf");
            }
            if ((lower_bounds.array() > upper_bounds.array()).any())
            {
                throw std::invalid_argument("Box lower bound exceeds upper bound");
            }

            if (A_eq.rows() > 0)
            {
                if (A_eq.cols() != n)
                {
                    throw std::invalid_argument("A_eq columns do not match problem dimension");
                }
                if (b_eq.size() != A_eq.rows())
                {
                    throw std::invalid_argument("b_eq size does not match A_eq rows");
                }
            }

            if (A_ineq.rows() > 0)
            {
                if (A_ineq.cols() != n)
                {
                    throw std::invalid_argument("A_ineq columns do not match problem dimension");
                }
                if (ineq_lower.size() != A_ineq.rows() || ineq_upper.size() != A_ineq.rows())
                {
                    throw std::invalid_argument("Inequality bound sizes do not match A_ineq rows");
                }
                for (Eigen::Index i = 0; i < A_ineq.rows(); ++i)
                {
                    if (ineq_lower(i) > ineq_upper(i))
                    {
                        throw std::invalid_argument(
                            "Inequality row " + std::to_string(i) + " has lower bound above upper bound");
                    }
                }
            }
        }

        double LinearConstraints::general_violation(const Eigen::VectorXd &x) const
        {
            double violation = 0.0;

            if (A_eq.rows() > 0)
            {
                violation += (A_eq * x - b_eq).cwiseAbs().sum();
            }

            if (A_ineq.rows() > 0)
            {
                Eigen::VectorXd ax = A_ineq * x;
                for (Eigen::Index i = 0; i < ax.size(); ++i)
                {
                    violation += std::max(0.0, ineq_lower(i) - ax(i));
                    violation += std::max(0.0, ax(i) - ineq_upper(i));
                }
            }

            return violation;
        }

        double LinearConstraints::max_violation(const Eigen::VectorXd &x) const
        {
            double worst = 0.0;

            if (A_eq.rows() > 0)
            {
                worst = std::max(worst, (A_eq * x - b_eq).cwiseAbs().maxCoeff());
            }

            if (A_ineq.rows() > 0)
            {
                Eigen::VectorXd ax = A_ineq * x;
                for (Eigen::Index i = 0; i < ax.size(); ++i)
                {
                    worst = std::max(worst, ineq_lower(i) - ax(i));
                    worst = std::max(worst, ax(i) - ineq_upper(i));
                }
            }

            for (Eigen::Index i = 0; i < x.size(); ++i)
            {
                worst = std::max(worst, lower_bounds(i) - x(i));
                worst = std::max(worst, x(i) - upper_bounds(i));
            }

            return worst;
        }

        Eigen::VectorXd LinearConstraints::clip_to_bounds(const Eigen::VectorXd &x) const
        {
            return x.cwiseMax(lower_bounds).cwiseMin(upper_bounds);
        }

    } // namespace optimizer
} // namespace sectoropt
