/**
 * @file errors.cpp
 * @brief Solver status names
 */

#include "sectoropt/core/errors.hpp"

namespace sectoropt
{

    std::string to_string(SolverStatus status)
    {
        switch (status)
        {
        case SolverStatus::CONVERGED:
            return "CONVERGED";
        case SolverStatus::ITERATION_LIMIT:
            return "ITERATION_LIMIT";
        case SolverStatus::QP_SUBPROBLEM_FAILED:
            return "QP_SUBPROBLEM_FAILED";
        case SolverStatus::LINE_SEARCH_FAILED:
            return "LINE_SEARCH_FAILED";
        case SolverStatus::POSITIVE_DIRECTIONAL_DERIVATIVE:
            return "POSITIVE_DIRECTIONAL_DERIVATIVE";
        case SolverStatus::CONSTRAINT_VIOLATION:
            return "CONSTRAINT_VIOLATION";
        case SolverStatus::NUMERICAL_ERROR:
            return "NUMERICAL_ERROR";
        }
        return "UNKNOWN";
    }

} // namespace sectoropt
