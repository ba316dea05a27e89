/**
 * @file test_sector_mapper.cpp
 * @brief Unit tests for SectorMapping
 */

#include <catch2/catch_test_macros.hpp>

#include "sectoropt/data/sector_mapper.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace sectoropt::data;

TEST_CASE("SectorMapping from parallel vectors", "[SectorMapping]")
{
    SectorMapping mapping({"TCS.NS", "SBIN.NS", "INFY.NS", "ONGC.NS"},
                          {"Technology", "Banking", "Technology", "Energy"});

    SECTION("Sizes and order of first appearance")
    {
        REQUIRE(mapping.size() == 4);
        REQUIRE(mapping.num_sectors() == 3);
        REQUIRE(mapping.get_sectors() == std::vector<std::string>{"Technology", "Banking", "Energy"});
    }

    SECTION("Reverse index in asset order")
    {
        REQUIRE(mapping.get_assets_in_sector("Technology") == std::vector<int>{0, 2});
        REQUIRE(mapping.get_assets_in_sector("Banking") == std::vector<int>{1});
        REQUIRE(mapping.get_sector_for_asset("ONGC.NS") == "Energy");
    }

    SECTION("Unknown sector lookups")
    {
        REQUIRE_FALSE(mapping.has_sector("Consumer"));
        REQUIRE_THROWS_AS(mapping.get_assets_in_sector("Consumer"), std::out_of_range);
    }

    SECTION("JSON round trip keeps the mapping")
    {
        auto restored = SectorMapping::from_json(mapping.to_json());
        REQUIRE(restored.get_asset_names() == mapping.get_asset_names());
        REQUIRE(restored.get_sectors() == mapping.get_sectors());
    }
}

TEST_CASE("SectorMapping validation", "[SectorMapping]")
{
    SECTION("Size mismatch")
    {
        REQUIRE_THROWS_AS(SectorMapping({"A", "B"}, {"X"}), std::invalid_argument);
    }

    SECTION("Duplicate asset")
    {
        REQUIRE_THROWS_AS(SectorMapping({"A", "A"}, {"X", "Y"}), std::invalid_argument);
    }

    SECTION("Empty names")
    {
        REQUIRE_THROWS_AS(SectorMapping({"A", " "}, {"X", "Y"}), std::invalid_argument);
        REQUIRE_THROWS_AS(SectorMapping({"A", "B"}, {"X", ""}), std::invalid_argument);
    }
}

TEST_CASE("SectorMapping with declared sector list", "[SectorMapping]")
{
    SECTION("Declared order is kept")
    {
        SectorMapping mapping({"A", "B", "C"}, {"X", "Y", "X"}, {"Y", "X"});
        REQUIRE(mapping.get_sectors() == std::vector<std::string>{"Y", "X"});
    }

    SECTION("Declared sector without assets is rejected")
    {
        REQUIRE_THROWS_AS(SectorMapping({"A", "B"}, {"X", "Y"}, {"X", "Y", "Z"}), std::invalid_argument);
    }

    SECTION("Undeclared sector is rejected")
    {
        REQUIRE_THROWS_AS(SectorMapping({"A", "B"}, {"X", "Y"}, {"X"}), std::invalid_argument);
    }
}

TEST_CASE("SectorMapping factories", "[SectorMapping]")
{
    SECTION("From pairs")
    {
        auto mapping = SectorMapping::from_pairs({{"A", "X"}, {"B", "Y"}});
        REQUIRE(mapping.get_sector_for_asset("B") == "Y");
    }

    SECTION("From JSON array of entries")
    {
        nlohmann::json j = nlohmann::json::array({{{"asset", "A"}, {"sector", "X"}},
                                                  {{"asset", "B"}, {"sector", "X"}}});
        auto mapping = SectorMapping::from_json(j);
        REQUIRE(mapping.get_assets_in_sector("X") == std::vector<int>{0, 1});
    }

    SECTION("From JSON missing keys")
    {
        REQUIRE_THROWS_AS(SectorMapping::from_json(nlohmann::json{{"assets", {"A"}}}), std::invalid_argument);
    }

    SECTION("From CSV")
    {
        auto path = std::filesystem::temp_directory_path() / "sectoropt_mapping_test.csv";
        {
            std::ofstream out(path);
            out << "asset,sector\n"
                << "TCS.NS, Technology\n"
                << "\n"
                << "SBIN.NS,Banking\n";
        }

        auto mapping = SectorMapping::from_csv(path.string());
        REQUIRE(mapping.size() == 2);
        REQUIRE(mapping.get_sector_for_asset("TCS.NS") == "Technology");

        std::filesystem::remove(path);
    }

    SECTION("From missing CSV file")
    {
        REQUIRE_THROWS_AS(SectorMapping::from_csv("/nonexistent/mapping.csv"), std::runtime_error);
    }
}
