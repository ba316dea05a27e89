/**
 * @file test_sqp_solver.cpp
 * @brief Tests for the SQP driver on problems with known optima
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sectoropt/optimizer/sqp_solver.hpp"
#include <limits>
#include <utility>

using namespace sectoropt;
using namespace sectoropt::optimizer;
using Catch::Matchers::WithinAbs;

namespace
{
    // f(x) = 0.5 * ||x - target||^2
    class DistanceObjective : public ObjectiveFunction
    {
    public:
        explicit DistanceObjective(Eigen::VectorXd target) : target_(std::move(target)) {}

        double value(const Eigen::VectorXd &x) const override
        {
            return 0.5 * (x - target_).squaredNorm();
        }

        Eigen::VectorXd gradient(const Eigen::VectorXd &x) const override
        {
            return x - target_;
        }

        Eigen::Index dimension() const override { return target_.size(); }

    private:
        Eigen::VectorXd target_;
    };

    LinearConstraints budget_constraints(Eigen::Index n)
    {
        LinearConstraints lc;
        lc.A_eq = Eigen::MatrixXd::Ones(1, n);
        lc.b_eq = Eigen::VectorXd::Ones(1);
        lc.lower_bounds = Eigen::VectorXd::Zero(n);
        lc.upper_bounds = Eigen::VectorXd::Ones(n);
        return lc;
    }

    // Two uncorrelated assets with equal daily variance 0.0004
    SharpeObjective two_asset_objective()
    {
        Eigen::VectorXd mean(2);
        mean << 0.001, 0.0005;
        Eigen::MatrixXd cov = 0.0004 * Eigen::MatrixXd::Identity(2, 2);
        return SharpeObjective(mean, cov);
    }
}

TEST_CASE("SQP projects onto the simplex", "[SQP]")
{
    Eigen::VectorXd target(3);
    target << 0.7, 0.5, -0.2;
    DistanceObjective objective(target);

    SqpSolver solver;
    auto result = solver.solve(objective, budget_constraints(3));

    REQUIRE(result.success);
    REQUIRE(result.status == SolverStatus::CONVERGED);
    REQUIRE_THAT(result.solution(0), WithinAbs(0.6, 1e-6));
    REQUIRE_THAT(result.solution(1), WithinAbs(0.4, 1e-6));
    REQUIRE_THAT(result.solution(2), WithinAbs(0.0, 1e-6));
    REQUIRE(result.constraint_violation <= 1e-7);
}

TEST_CASE("SQP finds the tangency portfolio", "[SQP][Sharpe]")
{
    auto objective = two_asset_objective();

    SECTION("Interior optimum proportional to inverse covariance times mean")
    {
        SqpSolver solver;
        auto result = solver.solve(objective, budget_constraints(2));

        REQUIRE(result.success);
        REQUIRE_THAT(result.solution(0), WithinAbs(2.0 / 3.0, 1e-4));
        REQUIRE_THAT(result.solution(1), WithinAbs(1.0 / 3.0, 1e-4));
        REQUIRE_THAT(result.solution.sum(), WithinAbs(1.0, 1e-7));
        REQUIRE(result.iterations >= 1);
        REQUIRE(result.iterations <= 100);
    }

    SECTION("Active inequality row")
    {
        auto lc = budget_constraints(2);
        lc.A_ineq = Eigen::MatrixXd::Zero(1, 2);
        lc.A_ineq(0, 0) = 1.0;
        lc.ineq_lower = Eigen::VectorXd::Constant(1, -std::numeric_limits<double>::infinity());
        lc.ineq_upper = Eigen::VectorXd::Constant(1, 0.5);

        SqpSolver solver;
        auto result = solver.solve(objective, lc);

        REQUIRE(result.success);
        REQUIRE_THAT(result.solution(0), WithinAbs(0.5, 1e-5));
        REQUIRE_THAT(result.solution(1), WithinAbs(0.5, 1e-5));
    }

    SECTION("Explicit starting point is clipped into the box")
    {
        Eigen::VectorXd x0(2);
        x0 << 1.5, -0.5;

        SqpSolver solver;
        auto result = solver.solve(objective, budget_constraints(2), x0);

        REQUIRE(result.success);
        REQUIRE_THAT(result.solution(0), WithinAbs(2.0 / 3.0, 1e-4));
    }
}

TEST_CASE("SQP failure modes", "[SQP]")
{
    auto objective = two_asset_objective();

    SECTION("Iteration limit")
    {
        SqpOptions options;
        options.max_iterations = 1;
        SqpSolver solver(options);

        auto result = solver.solve(objective, budget_constraints(2));

        REQUIRE_FALSE(result.success);
        REQUIRE(result.status == SolverStatus::ITERATION_LIMIT);
        REQUIRE(result.iterations == 1);
    }

    SECTION("Infeasible subproblem")
    {
        auto lc = budget_constraints(2);
        lc.upper_bounds = Eigen::VectorXd::Constant(2, 0.3);

        SqpSolver solver;
        auto result = solver.solve(objective, lc);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.status == SolverStatus::QP_SUBPROBLEM_FAILED);
    }

    SECTION("Dimension mismatch")
    {
        SqpSolver solver;
        REQUIRE_THROWS_AS(solver.solve(objective, budget_constraints(3)), std::invalid_argument);
    }
}

TEST_CASE("SqpOptions", "[SQP][Config]")
{
    SECTION("Defaults are valid")
    {
        REQUIRE_NOTHROW(SqpOptions().validate());
    }

    SECTION("Invalid values throw")
    {
        SqpOptions options;
        options.max_iterations = 0;
        REQUIRE_THROWS_AS(SqpSolver(options), std::invalid_argument);

        options = SqpOptions();
        options.ftol = -1.0;
        REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
    }

    SECTION("JSON overrides selected fields")
    {
        auto options = SqpOptions::from_json(nlohmann::json{{"max_iterations", 250}, {"ftol", 1e-10}});
        REQUIRE(options.max_iterations == 250);
        REQUIRE(options.ftol == 1e-10);
        REQUIRE(options.step_tolerance == SqpOptions().step_tolerance);
    }

    SECTION("Status names")
    {
        REQUIRE(to_string(SolverStatus::CONVERGED) == "CONVERGED");
        REQUIRE(to_string(SolverStatus::LINE_SEARCH_FAILED) == "LINE_SEARCH_FAILED");
    }
}
