/**
 * @file quadratic_problem.cpp
 * @brief Validation of quadratic programming problems
 */

#include "sectoropt/optimizer/quadratic_problem.hpp"
#include <cmath>
#include <stdexcept>

namespace sectoropt
{
    namespace optimizer
    {

        SolverResult::SolverResult()
            : objective_value(0.0), success(false), iterations(0)
        {
        }

        void QuadraticProblem::validate() const
        {
            const Eigen::Index n = q.size();

            if (n == 0)
            {
                throw std::invalid_argument("Problem dimension is zero");
            }

            // Check P matrix
            if (P.rows() != n || P.cols() != n)
            {
                throw std::invalid_argument("P matrix dimensions do not match q vector");
            }

            if (!P.allFinite())
            {
                throw std::invalid_argument("P matrix contains NaN or Inf");
            }

            if (!q.allFinite())
            {
                throw std::invalid_argument("q vector contains NaN or Inf");
            }

            // Check equality constraints
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
                if (!A_eq.allFinite() || !b_eq.allFinite())
                {
                    throw std::invalid_argument("Equality constraints contain NaN or Inf");
                }
            }

            // Check inequality constraints; infinite bounds mark an open side
            if (A_ineq.rows() > 0)
            {
                if (A_ineq.cols() != n)
                {
                    throw std::invalid_argument("A_ineq columns do not match problem dimension");
                }
                if (b_ineq_lower.size() != A_ineq.rows() || b_ineq_upper.size() != A_ineq.rows())
                {
                    throw std::invalid_argument("Inequality bound sizes do not match A_ineq rows");
                }
                if (!A_ineq.allFinite() || b_ineq_lower.hasNaN() || b_ineq_upper.hasNaN())
                {
                    throw std::invalid_argument("Inequality constraints contain NaN or Inf");
                }
            }

            // Check bounds
            if (lower_bounds.size() != n || upper_bounds.size() != n)
            {
                throw std::invalid_argument("Bound vectors do not match problem dimension");
            }

            if (lower_bounds.hasNaN() || upper_bounds.hasNaN())
            {
                throw std::invalid_argument("Bounds contain NaN");
            }

            for (Eigen::Index i = 0; i < n; ++i)
            {
                if (lower_bounds(i) > upper_bounds(i))
                {
                    throw std::invalid_argument(
                        "Lower bound exceeds upper bound for variable " + std::to_string(i));
                }
            }
        }

    } // namespace optimizer
} // namespace sectoropt
