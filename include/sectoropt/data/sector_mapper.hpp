/**
 * @file sector_mapper.hpp
 * @brief Asset to sector mapping
 *
 * Provides the asset -> sector mapping and the derived sector -> asset index
 * view used to construct sector exposure constraints.
 */

#ifndef SECTOROPT_DATA_SECTOR_MAPPER_HPP
#define SECTOROPT_DATA_SECTOR_MAPPER_HPP

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace sectoropt {
namespace data {

/**
 * @class SectorMapping
 * @brief Maps assets to sectors for constraint construction
 *
 * Purpose:
 * - Store the mapping from asset identifiers (tickers) to sector names.
 * - Fix the asset order used by weight vectors throughout the optimizer.
 * - Provide the sector -> asset index lists, computed once at construction.
 *
 * Sector order is the order of first appearance in the asset list, unless an
 * explicit sector list is supplied, in which case that order is used.
 *
 * Thread safety:
 * - Immutable after construction; safe for concurrent reads.
 *
 * Usage example:
 * @code
 * SectorMapping mapping({"TCS.NS", "INFY.NS", "SBIN.NS"},
 *                       {"Technology", "Technology", "Banking"});
 * const auto& tech = mapping.get_assets_in_sector("Technology"); // {0, 1}
 * @endcode
 */
class SectorMapping {
public:
    /**
     * @brief Default constructor
     * Creates an empty mapping.
     */
    SectorMapping() = default;

    /**
     * @brief Construct mapping from parallel vectors
     * @param asset_names Vector of asset identifiers (tickers)
     * @param sectors Vector of corresponding sector names (same length)
     * @throws std::invalid_argument if sizes differ, names are empty or an asset repeats
     */
    SectorMapping(const std::vector<std::string>& asset_names,
                  const std::vector<std::string>& sectors);

    /**
     * @brief Construct mapping with an explicit sector list
     * @param asset_names Vector of asset identifiers
     * @param sectors Sector of each asset (same length)
     * @param declared_sectors Full sector list; fixes the sector order
     * @throws std::invalid_argument if an asset's sector is not declared or a
     *         declared sector has no asset
     */
    SectorMapping(const std::vector<std::string>& asset_names,
                  const std::vector<std::string>& sectors,
                  const std::vector<std::string>& declared_sectors);

    /**
     * @brief Factory: create mapping from (asset, sector) pairs
     * @param pairs Ordered asset/sector pairs
     */
    static SectorMapping from_pairs(const std::vector<std::pair<std::string, std::string>>& pairs);

    /**
     * @brief Factory: create mapping from CSV file
     * @param filepath Path to CSV file where each row is: asset,sector (header skipped)
     * @param delimiter Field delimiter (default: ',')
     * @return SectorMapping instance
     * @throws std::runtime_error on IO errors or when no valid row is found
     */
    static SectorMapping from_csv(const std::string& filepath, char delimiter = ',');

    /**
     * @brief Factory: create mapping from JSON
     * @param j Either {"assets": [...], "sectors": [...]} (parallel arrays) or
     *          an array of {"asset": "...", "sector": "..."} objects
     * @return SectorMapping instance
     * @throws std::invalid_argument on missing fields or size mismatch
     */
    static SectorMapping from_json(const nlohmann::json& j);

    /**
     * @brief Get list of asset names in mapping order
     */
    const std::vector<std::string>& get_asset_names() const { return asset_names_; }

    /**
     * @brief Get list of unique sectors in mapping order
     */
    const std::vector<std::string>& get_sectors() const { return sectors_; }

    /**
     * @brief Get asset indices belonging to a sector
     * @param sector Sector name
     * @return Vector of asset indices (ascending)
     * @throws std::out_of_range if sector not present
     */
    const std::vector<int>& get_assets_in_sector(const std::string& sector) const;

    /**
     * @brief Get sector for a given asset
     * @param asset Asset identifier (ticker)
     * @return Sector name
     * @throws std::out_of_range if asset not found
     */
    const std::string& get_sector_for_asset(const std::string& asset) const;

    /**
     * @brief Check whether a sector exists in the mapping
     */
    bool has_sector(const std::string& sector) const;

    /**
     * @brief Serialize mapping to JSON
     * @return JSON representation: {"assets": [...], "sectors": [...]} (parallel arrays)
     */
    nlohmann::json to_json() const;

    /**
     * @brief Number of assets in mapping
     */
    size_t size() const { return asset_names_.size(); }

    /**
     * @brief Number of distinct sectors
     */
    size_t num_sectors() const { return sectors_.size(); }

    /**
     * @brief Check if mapping is empty
     */
    bool empty() const { return asset_names_.empty(); }

private:
    std::vector<std::string> asset_names_;                         ///< Asset identifiers in order
    std::vector<std::string> sectors_;                             ///< Unique sectors in order
    std::unordered_map<std::string, std::string> asset_to_sector_; ///< Map asset -> sector
    std::unordered_map<std::string, std::vector<int>> sector_to_assets_; ///< Map sector -> indices

    /**
     * @brief Rebuild reverse index (sector_to_assets_) and sector order
     */
    void build_reverse_index();
};

} // namespace data
} // namespace sectoropt

#endif // SECTOROPT_DATA_SECTOR_MAPPER_HPP
