/**
 * @file test_return_series.cpp
 * @brief Unit tests for ReturnSeries
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sectoropt/core/errors.hpp"
#include "sectoropt/data/return_series.hpp"
#include <limits>
#include <stdexcept>

using namespace sectoropt::data;
using Catch::Matchers::WithinAbs;

namespace
{
    const double kNaN = std::numeric_limits<double>::quiet_NaN();
}

TEST_CASE("ReturnSeries construction", "[ReturnSeries]")
{
    Eigen::MatrixXd returns(3, 2);
    returns << 0.01, 0.02,
        -0.01, 0.00,
        0.03, -0.02;

    SECTION("Valid construction")
    {
        ReturnSeries series(returns, {"TCS.NS", "SBIN.NS"}, {"2024-01-02", "2024-01-03", "2024-01-04"});
        REQUIRE(series.num_observations() == 3);
        REQUIRE(series.num_assets() == 2);
        REQUIRE(series.has_ticker("SBIN.NS"));
        REQUIRE_FALSE(series.has_ticker("INFY.NS"));
        REQUIRE_FALSE(series.empty());
    }

    SECTION("Ticker count mismatch throws")
    {
        REQUIRE_THROWS_AS(ReturnSeries(returns, {"TCS.NS"}), std::invalid_argument);
    }

    SECTION("Date count mismatch throws")
    {
        REQUIRE_THROWS_AS(ReturnSeries(returns, {"TCS.NS", "SBIN.NS"}, {"2024-01-02"}), std::invalid_argument);
    }

    SECTION("Duplicate tickers throw")
    {
        REQUIRE_THROWS_AS(ReturnSeries(returns, {"TCS.NS", "TCS.NS"}), std::invalid_argument);
    }
}

TEST_CASE("ReturnSeries from prices", "[ReturnSeries][Prices]")
{
    SECTION("Simple returns from consecutive prices")
    {
        Eigen::MatrixXd prices(3, 2);
        prices << 100.0, 50.0,
            110.0, 50.0,
            99.0, 55.0;

        auto series = ReturnSeries::from_prices(prices, {"A", "B"}, {"d0", "d1", "d2"});

        REQUIRE(series.num_observations() == 2);
        REQUIRE_THAT(series.get_returns()(0, 0), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(series.get_returns()(0, 1), WithinAbs(0.00, 1e-12));
        REQUIRE_THAT(series.get_returns()(1, 0), WithinAbs(-0.10, 1e-12));
        REQUIRE_THAT(series.get_returns()(1, 1), WithinAbs(0.10, 1e-12));

        // Return rows carry the later date
        REQUIRE(series.get_dates().front() == "d1");
        REQUIRE(series.get_dates().back() == "d2");
    }

    SECTION("Rows touching a missing price are dropped")
    {
        Eigen::MatrixXd prices(4, 2);
        prices << 100.0, 50.0,
            101.0, 51.0,
            kNaN, 52.0,
            103.0, 53.0;

        auto series = ReturnSeries::from_prices(prices, {"A", "B"});

        // Returns 2 and 3 both involve the missing price
        REQUIRE(series.num_observations() == 1);
        REQUIRE_THAT(series.get_returns()(0, 0), WithinAbs(0.01, 1e-12));
    }

    SECTION("Single price row throws")
    {
        Eigen::MatrixXd prices(1, 2);
        prices << 100.0, 50.0;
        REQUIRE_THROWS_AS(ReturnSeries::from_prices(prices, {"A", "B"}), sectoropt::InsufficientDataError);
    }
}

TEST_CASE("ReturnSeries manipulation", "[ReturnSeries]")
{
    Eigen::MatrixXd returns(4, 3);
    returns << 0.01, 0.02, 0.03,
        kNaN, 0.01, 0.02,
        0.02, 0.03, 0.04,
        0.03, 0.04, kNaN;

    ReturnSeries series(returns, {"A", "B", "C"}, {"d1", "d2", "d3", "d4"});

    SECTION("Select assets reorders columns")
    {
        auto selected = series.select_assets({"C", "A"});
        REQUIRE(selected.num_assets() == 2);
        REQUIRE(selected.get_tickers()[0] == "C");
        REQUIRE_THAT(selected.get_returns()(0, 0), WithinAbs(0.03, 1e-12));
        REQUIRE_THAT(selected.get_returns()(0, 1), WithinAbs(0.01, 1e-12));
    }

    SECTION("Select unknown asset throws")
    {
        REQUIRE_THROWS_AS(series.select_assets({"A", "Z"}), std::invalid_argument);
    }

    SECTION("Drop missing keeps complete rows and their dates")
    {
        REQUIRE(series.count_incomplete_rows() == 2);

        auto clean = series.drop_missing();
        REQUIRE(clean.num_observations() == 2);
        REQUIRE(clean.count_incomplete_rows() == 0);
        REQUIRE(clean.get_dates()[0] == "d1");
        REQUIRE(clean.get_dates()[1] == "d3");
    }

    SECTION("Mean returns of complete rows")
    {
        auto mean = series.drop_missing().mean_returns();
        REQUIRE_THAT(mean(0), WithinAbs(0.015, 1e-12));
        REQUIRE_THAT(mean(1), WithinAbs(0.025, 1e-12));
        REQUIRE_THAT(mean(2), WithinAbs(0.035, 1e-12));
    }

    SECTION("Mean of empty series throws")
    {
        ReturnSeries empty;
        REQUIRE_THROWS_AS(empty.mean_returns(), std::runtime_error);
    }
}
