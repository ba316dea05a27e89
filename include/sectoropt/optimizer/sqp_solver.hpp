/**
 * @file sqp_solver.hpp
 * @brief Sequential quadratic programming for smooth objectives with linear constraints
 *
 * Each iteration solves the subproblem
 *
 *   minimize     (1/2) d^T B d + g^T d
 *   subject to   A_eq d = b_eq - A_eq x
 *                lower - A x <= A_ineq d <= upper - A x
 *                lb - x <= d <= ub - x
 *
 * with OSQP, takes a backtracking step on the L1 merit function
 * f(x) + rho * violation(x), and refreshes B with a damped BFGS update.
 */

#pragma once

#include "sectoropt/core/errors.hpp"
#include "sectoropt/optimizer/linear_constraints.hpp"
#include "sectoropt/optimizer/osqp_solver.hpp"
#include "sectoropt/optimizer/sharpe_objective.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>

namespace sectoropt
{
    namespace optimizer
    {

        /**
         * @struct SqpOptions
         * @brief Termination and subproblem settings for SqpSolver
         */
        struct SqpOptions
        {
            int max_iterations = 100;             ///< Outer SQP iterations
            double ftol = 1e-9;                   ///< Objective change tolerance
            double step_tolerance = 1e-8;         ///< Infinity-norm step tolerance
            double feasibility_tolerance = 1e-7;  ///< Allowed constraint violation
            double qp_tolerance = 1e-9;           ///< OSQP eps_abs / eps_rel
            int qp_max_iterations = 50000;        ///< OSQP iteration cap
            bool verbose = false;                 ///< Print per-iteration progress

            /**
             * @throws std::invalid_argument on non-positive limits or tolerances
             */
            void validate() const;

            static SqpOptions from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct SqpResult
         * @brief Outcome of one SqpSolver run
         */
        struct SqpResult
        {
            Eigen::VectorXd solution;                           ///< Last accepted iterate
            bool success = false;                               ///< status == CONVERGED
            SolverStatus status = SolverStatus::ITERATION_LIMIT; ///< Termination reason
            std::string message;                                ///< Diagnostic text
            int iterations = 0;                                 ///< Outer iterations performed
            double objective_value = 0.0;                       ///< f(solution)
            double constraint_violation = 0.0;                  ///< Max violation at solution
        };

        /**
         * @class SqpSolver
         * @brief SLSQP-style solver built on OSQP subproblems
         *
         * Algorithm Steps:
         * 1. Start from x0 clipped to the box (equal weights by default)
         * 2. Solve the quadratic subproblem for the search direction d
         * 3. Update the merit penalty from the subproblem multipliers
         * 4. Backtrack until the merit function decreases sufficiently
         * 5. Damped BFGS update of the Hessian approximation
         * 6. Stop on small objective change or small step at a feasible point
         *
         * No internal retry: every failure is reported through SqpResult.
         *
         * Usage Example:
         * @code
         * SqpSolver solver;
         * SqpResult result = solver.solve(objective, constraint_set.to_linear_constraints());
         * if (!result.success) {
         *     std::cerr << result.message << "\n";
         * }
         * @endcode
         */
        class SqpSolver
        {
        public:
            explicit SqpSolver(const SqpOptions &options = SqpOptions());

            void set_options(const SqpOptions &options);

            const SqpOptions &get_options() const { return options_; }

            /**
             * @brief Minimize from the equal-weight starting point
             */
            SqpResult solve(const ObjectiveFunction &objective,
                            const LinearConstraints &constraints) const;

            /**
             * @brief Minimize from a given starting point
             * @throws std::invalid_argument on dimension mismatch or invalid constraints
             */
            SqpResult solve(const ObjectiveFunction &objective,
                            const LinearConstraints &constraints,
                            const Eigen::VectorXd &x0) const;

        private:
            SqpOptions options_;

            QuadraticProblem build_subproblem(const Eigen::MatrixXd &hessian,
                                              const Eigen::VectorXd &gradient,
                                              const LinearConstraints &constraints,
                                              const Eigen::VectorXd &x) const;

            /**
             * @brief Powell-damped BFGS update keeping B positive definite
             */
            static void damped_bfgs_update(Eigen::MatrixXd &hessian,
                                           const Eigen::VectorXd &s,
                                           const Eigen::VectorXd &y);

            static double multiplier_norm(const SolverResult &qp_result);
        };

    } // namespace optimizer
} // namespace sectoropt
