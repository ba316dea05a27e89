/**
 * @file test_data_loader.cpp
 * @brief Tests for CSV/JSON loading and configuration parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sectoropt/core/errors.hpp"
#include "sectoropt/data/data_loader.hpp"
#include "sectoropt/optimizer/optimizer_config.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace sectoropt;
using namespace sectoropt::data;
using Catch::Matchers::WithinAbs;

namespace
{
    std::filesystem::path write_temp(const std::string &name, const std::string &content)
    {
        auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << content;
        return path;
    }
}

TEST_CASE("DataLoader wide CSV", "[DataLoader][CSV]")
{
    auto path = write_temp("sectoropt_prices.csv",
                           "date,TCS.NS,SBIN.NS,ONGC.NS\n"
                           "2024-01-01,100,50,200\n"
                           "2024-01-02,110,,202\n"
                           "2024-01-03,121,55,204.02\n");

    SECTION("Load all columns")
    {
        auto table = DataLoader::load_csv_wide(path.string());
        REQUIRE(table.values.rows() == 3);
        REQUIRE(table.tickers.size() == 3);
        REQUIRE(table.dates[0] == "2024-01-01");
        REQUIRE(std::isnan(table.values(1, 1)));
    }

    SECTION("Select and reorder columns")
    {
        auto table = DataLoader::load_csv_wide(path.string(), {"ONGC.NS", "TCS.NS"});
        REQUIRE(table.tickers == std::vector<std::string>{"ONGC.NS", "TCS.NS"});
        REQUIRE_THAT(table.values(0, 0), WithinAbs(200.0, 1e-12));
    }

    SECTION("Missing ticker throws")
    {
        REQUIRE_THROWS_AS(DataLoader::load_csv_wide(path.string(), {"INFY.NS"}), std::runtime_error);
    }

    SECTION("Prices become returns with incomplete rows dropped")
    {
        auto series = DataLoader::load_prices_csv(path.string(), {"TCS.NS", "ONGC.NS"});
        REQUIRE(series.num_observations() == 2);
        REQUIRE_THAT(series.get_returns()(0, 0), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(series.get_returns()(1, 1), WithinAbs(0.01, 1e-12));

        auto with_gap = DataLoader::load_prices_csv(path.string());
        REQUIRE(with_gap.num_observations() == 0);
    }

    std::filesystem::remove(path);
}

TEST_CASE("DataLoader rejects malformed input", "[DataLoader][CSV]")
{
    SECTION("Missing file")
    {
        REQUIRE_THROWS_AS(DataLoader::load_csv_wide("/nonexistent/prices.csv"), std::runtime_error);
    }

    SECTION("Header without date column")
    {
        auto path = write_temp("sectoropt_bad_header.csv", "ticker,A\nx,1\n");
        REQUIRE_THROWS_AS(DataLoader::load_csv_wide(path.string()), std::runtime_error);
        std::filesystem::remove(path);
    }

    SECTION("Non-numeric cell")
    {
        auto path = write_temp("sectoropt_bad_cell.csv", "date,A\n2024-01-01,abc\n");
        REQUIRE_THROWS_AS(DataLoader::load_csv_wide(path.string()), std::runtime_error);
        std::filesystem::remove(path);
    }

    SECTION("Invalid JSON")
    {
        auto path = write_temp("sectoropt_bad.json", "{ \"universe\": ");
        REQUIRE_THROWS_AS(DataLoader::load_json(path.string()), std::runtime_error);
        std::filesystem::remove(path);
    }
}

TEST_CASE("DataLoader returns CSV round trip", "[DataLoader][CSV]")
{
    Eigen::MatrixXd returns(2, 2);
    returns << 0.01, -0.02,
        0.03, 0.04;
    ReturnSeries series(returns, {"A", "B"}, {"d1", "d2"});

    auto path = std::filesystem::temp_directory_path() / "sectoropt_returns.csv";
    DataLoader::save_csv_wide(series, path.string());

    auto loaded = DataLoader::load_returns_csv(path.string());
    REQUIRE(loaded.get_tickers() == series.get_tickers());
    REQUIRE(loaded.get_dates() == series.get_dates());
    REQUIRE((loaded.get_returns() - returns).cwiseAbs().maxCoeff() < 1e-12);

    std::filesystem::remove(path);
}

TEST_CASE("Synthetic prices are reproducible", "[DataLoader][Synthetic]")
{
    auto a = DataLoader::generate_synthetic_prices({"A", "B"}, 50, 7);
    auto b = DataLoader::generate_synthetic_prices({"A", "B"}, 50, 7);

    REQUIRE(a.values.rows() == 50);
    REQUIRE(a.values == b.values);
    REQUIRE(a.values(0, 0) == 100.0);
    REQUIRE_THROWS_AS(DataLoader::generate_synthetic_prices({}, 50), std::invalid_argument);
    REQUIRE_THROWS_AS(DataLoader::generate_synthetic_prices({"A"}, 1), std::invalid_argument);
    REQUIRE(DataLoader::generate_synthetic_prices({"A"}, 2).values.rows() == 2);
}

TEST_CASE("OptimizerConfig parsing", "[Config]")
{
    SECTION("Full configuration")
    {
        nlohmann::json j = {
            {"universe", {{"assets", {"TCS.NS", "INFY.NS", "SBIN.NS"}},
                          {"sectors", {"Technology", "Technology", "Banking"}}}},
            {"sector_bounds", {{"Technology", {{"min", 0.2}, {"max", 0.7}}},
                               {"Banking", {0.3, 0.8}}}},
            {"risk_model", {{"type", "sample"}, {"bias_correction", false}}},
            {"objective", {{"periods_per_year", 52}, {"risk_free_rate", 0.05}}},
            {"solver", {{"max_iterations", 200}, {"verbose", false}}},
            {"data", {{"prices_file", "prices.csv"}}}};

        auto config = optimizer::OptimizerConfig::from_json(j);

        REQUIRE(config.universe.size() == 3);
        REQUIRE_THAT(config.sector_bounds.at("Technology").min_weight, WithinAbs(0.2, 1e-12));
        REQUIRE_THAT(config.sector_bounds.at("Banking").max_weight, WithinAbs(0.8, 1e-12));
        REQUIRE(config.settings.risk_model.type == "sample");
        REQUIRE_FALSE(config.settings.risk_model.bias_correction);
        REQUIRE_THAT(config.settings.objective.periods_per_year, WithinAbs(52.0, 1e-12));
        REQUIRE_THAT(config.settings.objective.risk_free_rate, WithinAbs(0.05, 1e-12));
        REQUIRE(config.settings.solver.max_iterations == 200);
        REQUIRE(config.prices_file == "prices.csv");
        REQUIRE(config.returns_file.empty());
    }

    SECTION("Missing optional sections fall back to defaults")
    {
        nlohmann::json j = {{"universe", {{"assets", {"A", "B"}}, {"sectors", {"X", "Y"}}}}};
        auto config = optimizer::OptimizerConfig::from_json(j);

        REQUIRE(config.sector_bounds.empty());
        REQUIRE(config.settings.risk_model.type == "ledoit_wolf");
        REQUIRE_THAT(config.settings.objective.periods_per_year, WithinAbs(252.0, 1e-12));
        REQUIRE(config.settings.solver.max_iterations == 100);
    }

    SECTION("Missing universe")
    {
        REQUIRE_THROWS_AS(optimizer::OptimizerConfig::from_json(nlohmann::json::object()), std::invalid_argument);
    }

    SECTION("Malformed bounds")
    {
        nlohmann::json j = {{"universe", {{"assets", {"A", "B"}}, {"sectors", {"X", "Y"}}}},
                            {"sector_bounds", {{"X", {0.1, 0.2, 0.3}}}}};
        REQUIRE_THROWS_AS(optimizer::OptimizerConfig::from_json(j), InvalidConstraintError);
    }

    SECTION("Load from file")
    {
        auto path = write_temp("sectoropt_config.json",
                               R"({"universe": {"assets": ["A", "B"], "sectors": ["X", "Y"]},
                                   "sector_bounds": {"X": {"min": 0.3, "max": 0.7}}})");
        auto config = optimizer::OptimizerConfig::load(path.string());
        REQUIRE(config.sector_bounds.size() == 1);
        REQUIRE_THAT(config.sector_bounds.at("X").max_weight, WithinAbs(0.7, 1e-12));
        std::filesystem::remove(path);
    }
}
