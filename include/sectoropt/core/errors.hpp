/**
 * @file errors.hpp
 * @brief Exception types raised by the optimization core
 *
 * Each failure class gets its own type so callers can tell data problems,
 * configuration problems and solver non-convergence apart:
 *
 * - InsufficientDataError: not enough valid observations for estimation
 * - InvalidConstraintError: malformed or contradictory sector bounds
 * - OptimizationFailedError: solver did not reach a feasible optimum
 * - UndefinedRatioError: zero or negligible volatility at evaluation
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sectoropt
{

    /**
     * @enum SolverStatus
     * @brief Termination reason reported by the nonlinear solver
     */
    enum class SolverStatus
    {
        CONVERGED,                       ///< Optimality reached
        ITERATION_LIMIT,                 ///< max_iterations exhausted
        QP_SUBPROBLEM_FAILED,            ///< QP subproblem infeasible or unsolved
        LINE_SEARCH_FAILED,              ///< No step reduced the merit function
        POSITIVE_DIRECTIONAL_DERIVATIVE, ///< Search direction is not a descent direction
        CONSTRAINT_VIOLATION,            ///< Final point violates the constraints
        NUMERICAL_ERROR                  ///< NaN/Inf encountered
    };

    /**
     * @brief Human-readable name of a solver status
     */
    std::string to_string(SolverStatus status);

    /**
     * @class InsufficientDataError
     * @brief Fewer than two valid return observations remain for estimation
     */
    class InsufficientDataError : public std::invalid_argument
    {
    public:
        explicit InsufficientDataError(const std::string &what)
            : std::invalid_argument(what)
        {
        }
    };

    /**
     * @class InvalidConstraintError
     * @brief Sector bounds are out of range, inverted or jointly infeasible
     */
    class InvalidConstraintError : public std::invalid_argument
    {
    public:
        explicit InvalidConstraintError(const std::string &what)
            : std::invalid_argument(what)
        {
        }
    };

    /**
     * @class OptimizationFailedError
     * @brief Nonlinear solver terminated without a feasible optimum
     *
     * Carries the solver status and its diagnostic message so the caller can
     * decide whether to relax constraints or retry from another point.
     */
    class OptimizationFailedError : public std::runtime_error
    {
    public:
        OptimizationFailedError(SolverStatus status, const std::string &reason)
            : std::runtime_error("Optimization failed (" + to_string(status) + "): " + reason),
              status_(status),
              reason_(reason)
        {
        }

        SolverStatus status() const { return status_; }
        const std::string &reason() const { return reason_; }

    private:
        SolverStatus status_;
        std::string reason_;
    };

    /**
     * @class UndefinedRatioError
     * @brief Sharpe ratio requested where portfolio volatility is negligible
     */
    class UndefinedRatioError : public std::domain_error
    {
    public:
        explicit UndefinedRatioError(const std::string &what)
            : std::domain_error(what)
        {
        }
    };

} // namespace sectoropt
