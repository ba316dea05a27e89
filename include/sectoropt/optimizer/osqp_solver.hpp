/**
 * @file osqp_solver.hpp
 * @brief OSQP-based quadratic programming solver
 *
 * Wraps the OSQP library (Operator Splitting Quadratic Program) to solve the
 * quadratic subproblems generated by SqpSolver.
 *
 * Problem formulation:
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   A_eq x = b_eq
 *                b_lower <= A_ineq x <= b_upper
 *                lb <= x <= ub
 */

#pragma once

#include "sectoropt/optimizer/quadratic_problem.hpp"
#include <Eigen/Dense>
#include <osqp/osqp.h>
#include <vector>

namespace sectoropt
{
    namespace optimizer
    {

        /**
         * @class OSQPSolver
         * @brief Quadratic programming solver using the OSQP library
         *
         * Returns both the primal solution and the constraint multipliers;
         * the multipliers drive the merit penalty of the outer SQP loop.
         *
         * Usage Example:
         * @code
         * OSQPSolver solver;
         * SolverOptions options;
         * options.tolerance = 1e-9;
         * solver.set_options(options);
         *
         * QuadraticProblem problem = ...;
         * SolverResult result = solver.solve(problem);
         * if (result.success) {
         *     std::cout << result.solution.transpose() << "\n";
         * }
         * @endcode
         */
        class OSQPSolver
        {
        public:
            OSQPSolver();

            explicit OSQPSolver(const SolverOptions &options);

            ~OSQPSolver() = default;

            void set_options(const SolverOptions &options);

            const SolverOptions &get_options() const { return options_; }

            /**
             * @brief Solve quadratic programming problem
             * @param problem QP problem definition
             * @return Solution, multipliers, status and iteration count
             * @throws std::invalid_argument if the problem is ill-formed
             *
             * Infeasible or unsolved problems are reported through
             * SolverResult::success and SolverResult::message.
             */
            SolverResult solve(const QuadraticProblem &problem) const;

        private:
            SolverOptions options_; ///< Solver configuration

            /**
             * @brief Convert Eigen dense matrix to OSQP sparse CSC format
             *
             * For symmetric matrices only the upper triangle is stored.
             */
            void convert_to_csc(
                const Eigen::MatrixXd &dense,
                std::vector<OSQPFloat> &data,
                std::vector<OSQPInt> &indices,
                std::vector<OSQPInt> &indptr,
                bool upper_triangular_only = false) const;

            /**
             * @brief Build stacked constraint matrix for OSQP
             * @return Number of constraint rows (m)
             *
             *   A = [A_eq; A_ineq; I]
             *   l = [b_eq; b_lower; lb]
             *   u = [b_eq; b_upper; ub]
             */
            OSQPInt build_constraint_matrix(
                const QuadraticProblem &problem,
                std::vector<OSQPFloat> &A_data,
                std::vector<OSQPInt> &A_indices,
                std::vector<OSQPInt> &A_indptr,
                std::vector<OSQPFloat> &l,
                std::vector<OSQPFloat> &u) const;

            /**
             * @brief Map +/-inf to OSQP_INFTY
             */
            static OSQPFloat to_osqp_bound(double value);
        };

    } // namespace optimizer
} // namespace sectoropt
