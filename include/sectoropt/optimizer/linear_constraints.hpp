/**
 * @file linear_constraints.hpp
 * @brief Matrix form of the linear constraint set handed to the solver
 *
 *   A_eq * x = b_eq
 *   ineq_lower <= A_ineq * x <= ineq_upper
 *   lower_bounds <= x <= upper_bounds
 *
 * One-sided inequality rows use +/- infinity on the open side.
 */

#pragma once

#include <Eigen/Dense>

namespace sectoropt
{
    namespace optimizer
    {

        /**
         * @struct LinearConstraints
         * @brief Linear equality, inequality and box constraints
         */
        struct LinearConstraints
        {
            Eigen::MatrixXd A_eq;          ///< Equality constraint matrix (m_eq x n)
            Eigen::VectorXd b_eq;          ///< Equality right-hand side
            Eigen::MatrixXd A_ineq;        ///< Inequality constraint matrix (m_ineq x n)
            Eigen::VectorXd ineq_lower;    ///< Lower bound per inequality row (may be -inf)
            Eigen::VectorXd ineq_upper;    ///< Upper bound per inequality row (may be +inf)
            Eigen::VectorXd lower_bounds;  ///< Per-variable lower bounds
            Eigen::VectorXd upper_bounds;  ///< Per-variable upper bounds

            /**
             * @brief Number of decision variables
             */
            Eigen::Index num_variables() const { return lower_bounds.size(); }

            /**
             * @brief Check dimensions and bound consistency
             * @throws std::invalid_argument if ill-formed
             */
            void validate() const;

            /**
             * @brief L1 violation of equality and inequality rows (box excluded)
             */
            double general_violation(const Eigen::VectorXd &x) const;

            /**
             * @brief Largest single violation over all constraints, box included
             */
            double max_violation(const Eigen::VectorXd &x) const;

            /**
             * @brief Clip x into the box bounds
             */
            Eigen::VectorXd clip_to_bounds(const Eigen::VectorXd &x) const;
        };

    } // namespace optimizer
} // namespace sectoropt
