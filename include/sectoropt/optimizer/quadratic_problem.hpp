/**
 * @file quadratic_problem.hpp
 * @brief Quadratic programming problem and result structures
 *
 * Problems of the form:
 *
 * Minimize:     (1/2) * x^T * P * x + q^T * x
 * Subject to:   A_eq * x = b_eq                      (equality constraints)
 *               b_lower <= A_ineq * x <= b_upper     (inequality constraints with bounds)
 *               l <= x <= u                          (box constraints)
 *
 * Used for the subproblems of the sequential quadratic programming solver.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace sectoropt
{
    namespace optimizer
    {

        /**
         * @struct QuadraticProblem
         * @brief Quadratic programming problem definition
         */
        struct QuadraticProblem
        {
            Eigen::MatrixXd P; ///< Quadratic term (N x N)
            Eigen::VectorXd q; ///< Linear term (N x 1)

            Eigen::MatrixXd A_eq; ///< Equality constraint matrix
            Eigen::VectorXd b_eq; ///< Equality constraint values

            Eigen::MatrixXd A_ineq;       ///< Inequality constraint matrix
            Eigen::VectorXd b_ineq_lower; ///< Inequality lower bounds (may be -inf)
            Eigen::VectorXd b_ineq_upper; ///< Inequality upper bounds (may be +inf)

            Eigen::VectorXd lower_bounds; ///< Lower bounds
            Eigen::VectorXd upper_bounds; ///< Upper bounds

            QuadraticProblem() = default;

            /**
             * @brief Validate problem dimensions and values
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;
        };

        /**
         * @struct SolverOptions
         * @brief Options for the QP solver
         */
        struct SolverOptions
        {
            int max_iterations = 50000; ///< Maximum ADMM iterations
            double tolerance = 1e-9;    ///< Absolute and relative tolerance
            bool polish = true;         ///< Refine the active set after ADMM
            bool verbose = false;       ///< Print solver output

            SolverOptions() = default;
        };

        /**
         * @struct SolverResult
         * @brief Result from the QP solver
         *
         * Multipliers follow the solver's sign convention: positive when the
         * upper side of a row is active, negative when the lower side is.
         */
        struct SolverResult
        {
            Eigen::VectorXd solution;    ///< Optimal solution
            Eigen::VectorXd duals_eq;    ///< Multipliers of equality rows
            Eigen::VectorXd duals_ineq;  ///< Multipliers of inequality rows
            Eigen::VectorXd duals_box;   ///< Multipliers of box rows
            double objective_value;      ///< Final objective value
            bool success;                ///< Convergence achieved
            int iterations;              ///< Number of iterations
            std::string message;         ///< Status message

            SolverResult();
        };

    } // namespace optimizer
} // namespace sectoropt
