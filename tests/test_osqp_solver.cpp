#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sectoropt/optimizer/osqp_solver.hpp"
#include <cmath>
#include <limits>

using namespace sectoropt::optimizer;
using Catch::Matchers::WithinAbs;

namespace
{
    const double kInf = std::numeric_limits<double>::infinity();
}

TEST_CASE("OSQP inequality constraint support", "[OSQP][Critical]")
{
    // Objective: maximize x + y with a small regularizer
    // Constraint: x + y <= 0.5 (inequality, open below)
    // Expected: x = y = 0.25 (on boundary)
    QuadraticProblem problem;
    problem.P = 2e-6 * Eigen::MatrixXd::Identity(2, 2);
    problem.q = -Eigen::VectorXd::Ones(2);

    problem.A_ineq = Eigen::MatrixXd::Ones(1, 2);
    problem.b_ineq_lower = Eigen::VectorXd::Constant(1, -kInf);
    problem.b_ineq_upper = Eigen::VectorXd::Constant(1, 0.5);

    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::VectorXd::Constant(2, 1.0);

    OSQPSolver solver;
    auto result = solver.solve(problem);

    REQUIRE(result.success);
    REQUIRE(std::abs(result.solution.sum() - 0.5) < 1e-6);
    REQUIRE(std::abs(result.solution(0) - 0.25) < 1e-6);
    REQUIRE(result.duals_ineq.size() == 1);
    REQUIRE(result.duals_box.size() == 2);
}

TEST_CASE("OSQP equality-constrained minimum variance", "[OSQP]")
{
    // min 0.5 x'Px with sum(x) = 1; diagonal P gives x_i proportional to 1/P_ii
    QuadraticProblem problem;
    problem.P = Eigen::MatrixXd::Zero(2, 2);
    problem.P(0, 0) = 1.0;
    problem.P(1, 1) = 3.0;
    problem.q = Eigen::VectorXd::Zero(2);

    problem.A_eq = Eigen::MatrixXd::Ones(1, 2);
    problem.b_eq = Eigen::VectorXd::Ones(1);

    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::VectorXd::Ones(2);

    OSQPSolver solver;
    auto result = solver.solve(problem);

    REQUIRE(result.success);
    REQUIRE_THAT(result.solution(0), WithinAbs(0.75, 1e-6));
    REQUIRE_THAT(result.solution(1), WithinAbs(0.25, 1e-6));
    REQUIRE_THAT(result.objective_value, WithinAbs(0.5 * (0.5625 + 3.0 * 0.0625), 1e-6));
    REQUIRE(result.duals_eq.size() == 1);
}

TEST_CASE("OSQP two-sided inequality rows", "[OSQP]")
{
    // Pull both variables toward 1 while 0.2 <= x0 <= 0.4 through a row constraint
    QuadraticProblem problem;
    problem.P = Eigen::MatrixXd::Identity(2, 2);
    problem.q = -Eigen::VectorXd::Ones(2);

    problem.A_ineq = Eigen::MatrixXd::Zero(1, 2);
    problem.A_ineq(0, 0) = 1.0;
    problem.b_ineq_lower = Eigen::VectorXd::Constant(1, 0.2);
    problem.b_ineq_upper = Eigen::VectorXd::Constant(1, 0.4);

    problem.lower_bounds = Eigen::VectorXd::Constant(2, -kInf);
    problem.upper_bounds = Eigen::VectorXd::Constant(2, kInf);

    OSQPSolver solver;
    auto result = solver.solve(problem);

    REQUIRE(result.success);
    REQUIRE_THAT(result.solution(0), WithinAbs(0.4, 1e-6));
    REQUIRE_THAT(result.solution(1), WithinAbs(1.0, 1e-6));
}

TEST_CASE("OSQP reports infeasible problems", "[OSQP]")
{
    QuadraticProblem problem;
    problem.P = Eigen::MatrixXd::Identity(2, 2);
    problem.q = Eigen::VectorXd::Zero(2);

    problem.A_eq = Eigen::MatrixXd::Ones(1, 2);
    problem.b_eq = Eigen::VectorXd::Ones(1);

    // Both variables capped at 0.3 cannot sum to one
    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::VectorXd::Constant(2, 0.3);

    OSQPSolver solver;
    auto result = solver.solve(problem);

    REQUIRE_FALSE(result.success);
    REQUIRE_FALSE(result.message.empty());
}

TEST_CASE("QuadraticProblem validation", "[OSQP]")
{
    QuadraticProblem problem;
    problem.P = Eigen::MatrixXd::Identity(2, 2);
    problem.q = Eigen::VectorXd::Zero(2);
    problem.lower_bounds = Eigen::VectorXd::Zero(2);
    problem.upper_bounds = Eigen::VectorXd::Ones(2);

    REQUIRE_NOTHROW(problem.validate());

    SECTION("Mismatched P")
    {
        problem.P = Eigen::MatrixXd::Identity(3, 3);
        REQUIRE_THROWS_AS(problem.validate(), std::invalid_argument);
    }

    SECTION("Inverted box")
    {
        problem.lower_bounds(1) = 2.0;
        REQUIRE_THROWS_AS(problem.validate(), std::invalid_argument);
    }

    SECTION("Solver validates before setup")
    {
        problem.q = Eigen::VectorXd::Zero(3);
        OSQPSolver solver;
        REQUIRE_THROWS_AS(solver.solve(problem), std::invalid_argument);
    }
}
