/**
 * @file sqp_solver.cpp
 * @brief Implementation of the sequential quadratic programming solver
 */

#include "sectoropt/optimizer/sqp_solver.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace sectoropt
{
    namespace optimizer
    {

        namespace
        {
            constexpr double kArmijoCoefficient = 1e-4;
            constexpr double kMinStepLength = 1e-10;
            constexpr double kVanishingDirection = 1e-6;

            SqpResult make_result(const Eigen::VectorXd &x,
                                  double f,
                                  const LinearConstraints &constraints,
                                  double feasibility_tolerance,
                                  SolverStatus status,
                                  const std::string &message,
                                  int iterations)
            {
                SqpResult result;
                result.solution = x;
                result.objective_value = f;
                result.constraint_violation = constraints.max_violation(x);
                result.status = status;
                result.message = message;
                result.iterations = iterations;

                if (status == SolverStatus::CONVERGED && result.constraint_violation > feasibility_tolerance)
                {
                    std::ostringstream oss;
                    oss << "Converged point violates constraints by " << result.constraint_violation;
                    result.status = SolverStatus::CONSTRAINT_VIOLATION;
                    result.message = oss.str();
                }

                result.success = (result.status == SolverStatus::CONVERGED);
                return result;
            }
        } // namespace

        // ====================================================================
        // SqpOptions
        // ====================================================================

        void SqpOptions::validate() const
        {
            if (max_iterations <= 0)
            {
                throw std::invalid_argument(
                    "max_iterations must be positive, got: " + std::to_string(max_iterations));
            }
            if (qp_max_iterations <= 0)
            {
                throw std::invalid_argument(
                    "qp_max_iterations must be positive, got: " + std::to_string(qp_max_iterations));
            }
            if (!(ftol > 0.0) || !(step_tolerance > 0.0) ||
                !(feasibility_tolerance > 0.0) || !(qp_tolerance > 0.0))
            {
                throw std::invalid_argument("Solver tolerances must be positive");
            }
        }

        SqpOptions SqpOptions::from_json(const nlohmann::json &j)
        {
            SqpOptions options;
            options.max_iterations = j.value("max_iterations", options.max_iterations);
            options.ftol = j.value("ftol", options.ftol);
            options.step_tolerance = j.value("step_tolerance", options.step_tolerance);
            options.feasibility_tolerance = j.value("feasibility_tolerance", options.feasibility_tolerance);
            options.qp_tolerance = j.value("qp_tolerance", options.qp_tolerance);
            options.qp_max_iterations = j.value("qp_max_iterations", options.qp_max_iterations);
            options.verbose = j.value("verbose", options.verbose);
            options.validate();
            return options;
        }

        nlohmann::json SqpOptions::to_json() const
        {
            return nlohmann::json{
                {"max_iterations", max_iterations},
                {"ftol", ftol},
                {"step_tolerance", step_tolerance},
                {"feasibility_tolerance", feasibility_tolerance},
                {"qp_tolerance", qp_tolerance},
                {"qp_max_iterations", qp_max_iterations},
                {"verbose", verbose}};
        }

        // ====================================================================
        // SqpSolver
        // ====================================================================

        SqpSolver::SqpSolver(const SqpOptions &options)
            : options_(options)
        {
            options_.validate();
        }

        void SqpSolver::set_options(const SqpOptions &options)
        {
            options.validate();
            options_ = options;
        }

        SqpResult SqpSolver::solve(const ObjectiveFunction &objective,
                                   const LinearConstraints &constraints) const
        {
            const Eigen::Index n = constraints.num_variables();
            if (n == 0)
            {
                throw std::invalid_argument("Constraint set has no variables");
            }
            return solve(objective, constraints, Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n)));
        }

        QuadraticProblem SqpSolver::build_subproblem(const Eigen::MatrixXd &hessian,
                                                     const Eigen::VectorXd &gradient,
                                                     const LinearConstraints &constraints,
                                                     const Eigen::VectorXd &x) const
        {
            QuadraticProblem problem;
            problem.P = hessian;
            problem.q = gradient;

            if (constraints.A_eq.rows() > 0)
            {
                problem.A_eq = constraints.A_eq;
                problem.b_eq = constraints.b_eq - constraints.A_eq * x;
            }

            if (constraints.A_ineq.rows() > 0)
            {
                Eigen::VectorXd ax = constraints.A_ineq * x;
                problem.A_ineq = constraints.A_ineq;
                // Infinite sides stay infinite
                problem.b_ineq_lower = constraints.ineq_lower - ax;
                problem.b_ineq_upper = constraints.ineq_upper - ax;
            }

            problem.lower_bounds = constraints.lower_bounds - x;
            problem.upper_bounds = constraints.upper_bounds - x;

            return problem;
        }

        void SqpSolver::damped_bfgs_update(Eigen::MatrixXd &hessian,
                                           const Eigen::VectorXd &s,
                                           const Eigen::VectorXd &y)
        {
            Eigen::VectorXd bs = hessian * s;
            const double sbs = s.dot(bs);
            if (!(sbs > 1e-16))
            {
                return;
            }

            const double sy = s.dot(y);
            Eigen::VectorXd r = y;
            if (sy < 0.2 * sbs)
            {
                const double theta = 0.8 * sbs / (sbs - sy);
                r = theta * y + (1.0 - theta) * bs;
            }

            const double sr = s.dot(r);
            if (!(sr > 1e-16))
            {
                return;
            }

            hessian += r * r.transpose() / sr - bs * bs.transpose() / sbs;
            hessian = 0.5 * (hessian + hessian.transpose());

            if (!hessian.allFinite())
            {
                hessian = Eigen::MatrixXd::Identity(s.size(), s.size());
            }
        }

        double SqpSolver::multiplier_norm(const SolverResult &qp_result)
        {
            double norm = 0.0;
            if (qp_result.duals_eq.size() > 0)
            {
                norm = std::max(norm, qp_result.duals_eq.lpNorm<Eigen::Infinity>());
            }
            if (qp_result.duals_ineq.size() > 0)
            {
                norm = std::max(norm, qp_result.duals_ineq.lpNorm<Eigen::Infinity>());
            }
            return norm;
        }

        SqpResult SqpSolver::solve(const ObjectiveFunction &objective,
                                   const LinearConstraints &constraints,
                                   const Eigen::VectorXd &x0) const
        {
            constraints.validate();

            const Eigen::Index n = constraints.num_variables();
            if (x0.size() != n || objective.dimension() != n)
            {
                throw std::invalid_argument(
                    "Starting point, objective and constraints disagree on dimension (" +
                    std::to_string(x0.size()) + ", " + std::to_string(objective.dimension()) + ", " +
                    std::to_string(n) + ")");
            }

            SolverOptions qp_options;
            qp_options.max_iterations = options_.qp_max_iterations;
            qp_options.tolerance = options_.qp_tolerance;
            qp_options.polish = true;
            OSQPSolver qp_solver(qp_options);

            Eigen::VectorXd x = constraints.clip_to_bounds(x0);
            double f = objective.value(x);
            Eigen::VectorXd g = objective.gradient(x);

            if (!std::isfinite(f) || !g.allFinite())
            {
                return make_result(x, f, constraints, options_.feasibility_tolerance, SolverStatus::NUMERICAL_ERROR,
                                   "Objective or gradient is not finite at the starting point", 0);
            }

            Eigen::MatrixXd hessian = Eigen::MatrixXd::Identity(n, n);
            double rho = 0.0;

            if (options_.verbose)
            {
                std::cout << "SQP: " << n << " variables, "
                          << constraints.A_eq.rows() << " equality, "
                          << constraints.A_ineq.rows() << " inequality constraints\n";
                std::cout << std::setw(6) << "iter" << std::setw(16) << "objective"
                          << std::setw(14) << "violation" << std::setw(12) << "step" << "\n";
            }

            for (int iter = 1; iter <= options_.max_iterations; ++iter)
            {
                // Step 1: search direction from the quadratic subproblem
                SolverResult qp_result = qp_solver.solve(build_subproblem(hessian, g, constraints, x));
                if (!qp_result.success)
                {
                    return make_result(x, f, constraints, options_.feasibility_tolerance, SolverStatus::QP_SUBPROBLEM_FAILED,
                                       "QP subproblem failed: " + qp_result.message, iter);
                }

                const Eigen::VectorXd &d = qp_result.solution;
                const double d_norm = d.lpNorm<Eigen::Infinity>();

                // Step 2: merit penalty tracks the largest multiplier
                const double y_norm = multiplier_norm(qp_result);
                rho = std::max(y_norm, 0.5 * (rho + y_norm));

                const double violation = constraints.general_violation(x);
                const double merit = f + rho * violation;
                const double directional = g.dot(d) - rho * violation;

                if (d_norm < options_.step_tolerance)
                {
                    return make_result(x, f, constraints, options_.feasibility_tolerance, SolverStatus::CONVERGED,
                                       "Optimization terminated successfully (step below tolerance)", iter);
                }

                if (violation <= options_.feasibility_tolerance && std::abs(directional) < options_.ftol)
                {
                    return make_result(x, f, constraints, options_.feasibility_tolerance, SolverStatus::CONVERGED,
                                       "Optimization terminated successfully (directional derivative below tolerance)", iter);
                }

                if (directional >= 0.0)
                {
                    if (violation <= options_.feasibility_tolerance && d_norm < kVanishingDirection)
                    {
                        return make_result(x, f, constraints, options_.feasibility_tolerance, SolverStatus::CONVERGED,
                                           "Optimization terminated successfully (search direction vanished)", iter);
                    }

                    std::ostringstream oss;
                    oss << "Positive directional derivative for linesearch (" << directional << ")";
                    return make_result(x, f, constraints, options_.feasibility_tolerance, SolverStatus::POSITIVE_DIRECTIONAL_DERIVATIVE,
                                       oss.str(), iter);
                }

                // Step 3: backtracking line search on the merit function
                double alpha = 1.0;
                Eigen::VectorXd x_new;
                double f_new = 0.0;
                bool accepted = false;

                while (alpha >= kMinStepLength)
                {
                    x_new = constraints.clip_to_bounds(x + alpha * d);
                    f_new = objective.value(x_new);

                    if (std::isfinite(f_new))
                    {
                        const double merit_new = f_new + rho * constraints.general_violation(x_new);
                        if (merit_new <= merit + kArmijoCoefficient * alpha * directional)
                        {
                            accepted = true;
                            break;
                        }
                    }

                    alpha *= 0.5;
                }

                if (!accepted)
                {
                    return make_result(x, f, constraints, options_.feasibility_tolerance, SolverStatus::LINE_SEARCH_FAILED,
                                       "Line search could not reduce the merit function", iter);
                }

                Eigen::VectorXd g_new = objective.gradient(x_new);
                if (!g_new.allFinite())
                {
                    return make_result(x, f, constraints, options_.feasibility_tolerance, SolverStatus::NUMERICAL_ERROR,
                                       "Gradient is not finite at the accepted step", iter);
                }

                // Step 4: curvature update; linear constraints drop out of y
                const Eigen::VectorXd s = x_new - x;
                damped_bfgs_update(hessian, s, g_new - g);

                const double f_change = std::abs(f_new - f);
                const double step = s.lpNorm<Eigen::Infinity>();

                x = x_new;
                f = f_new;
                g = g_new;

                const double max_violation = constraints.max_violation(x);

                if (options_.verbose)
                {
                    std::cout << std::setw(6) << iter
                              << std::setw(16) << std::setprecision(8) << f
                              << std::setw(14) << std::setprecision(3) << max_violation
                              << std::setw(12) << step << "\n";
                }

                if (max_violation <= options_.feasibility_tolerance &&
                    (f_change < options_.ftol || step < options_.step_tolerance))
                {
                    return make_result(x, f, constraints, options_.feasibility_tolerance, SolverStatus::CONVERGED,
                                       "Optimization terminated successfully", iter);
                }
            }

            return make_result(x, f, constraints, options_.feasibility_tolerance, SolverStatus::ITERATION_LIMIT,
                               "Iteration limit reached", options_.max_iterations);
        }

    } // namespace optimizer
} // namespace sectoropt
