/**
 * @file sector_mapper.cpp
 * @brief Implementation of SectorMapping for asset->sector mappings
 */

#include "sectoropt/data/sector_mapper.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace sectoropt {
namespace data {

// Trim helpers (left/right)
static inline std::string ltrim(std::string s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

static inline std::string rtrim(std::string s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    return s;
}

static inline std::string trim(std::string s)
{
    return ltrim(rtrim(std::move(s)));
}

SectorMapping::SectorMapping(const std::vector<std::string>& asset_names,
                             const std::vector<std::string>& sector_names)
{
    if (asset_names.size() != sector_names.size())
    {
        throw std::invalid_argument("SectorMapping: asset_names and sector_names size mismatch");
    }

    asset_names_.reserve(asset_names.size());
    for (size_t i = 0; i < asset_names.size(); ++i)
    {
        const std::string a = trim(asset_names[i]);
        const std::string s = trim(sector_names[i]);
        if (a.empty())
        {
            throw std::invalid_argument("SectorMapping: empty asset name at index " + std::to_string(i));
        }
        if (s.empty())
        {
            throw std::invalid_argument("SectorMapping: empty sector name for asset '" + a + "'");
        }
        if (!asset_to_sector_.emplace(a, s).second)
        {
            throw std::invalid_argument("SectorMapping: duplicate asset '" + a + "'");
        }
        asset_names_.push_back(a);
    }

    build_reverse_index();
}

SectorMapping::SectorMapping(const std::vector<std::string>& asset_names,
                             const std::vector<std::string>& sector_names,
                             const std::vector<std::string>& declared_sectors)
    : SectorMapping(asset_names, sector_names)
{
    std::vector<std::string> ordered;
    std::unordered_set<std::string> seen;
    for (const auto& raw : declared_sectors)
    {
        const std::string s = trim(raw);
        if (!seen.insert(s).second)
        {
            continue;
        }
        if (sector_to_assets_.find(s) == sector_to_assets_.end())
        {
            throw std::invalid_argument("SectorMapping: declared sector '" + s + "' has no assets");
        }
        ordered.push_back(s);
    }

    for (const auto& s : sectors_)
    {
        if (seen.find(s) == seen.end())
        {
            throw std::invalid_argument("SectorMapping: sector '" + s + "' is not in the declared sector list");
        }
    }

    sectors_ = std::move(ordered);
}

SectorMapping SectorMapping::from_pairs(const std::vector<std::pair<std::string, std::string>>& pairs)
{
    std::vector<std::string> assets;
    std::vector<std::string> sectors;
    assets.reserve(pairs.size());
    sectors.reserve(pairs.size());
    for (const auto& p : pairs)
    {
        assets.push_back(p.first);
        sectors.push_back(p.second);
    }
    return SectorMapping(assets, sectors);
}

SectorMapping SectorMapping::from_csv(const std::string& filepath, char delimiter)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("SectorMapping::from_csv: could not open file: " + filepath);
    }

    std::string line;
    std::vector<std::string> assets;
    std::vector<std::string> sectors;

    // First line is a header
    if (!std::getline(file, line))
    {
        throw std::runtime_error("SectorMapping::from_csv: empty file: " + filepath);
    }

    while (std::getline(file, line))
    {
        if (line.empty())
            continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string item;
        while (std::getline(ss, item, delimiter))
        {
            fields.push_back(trim(item));
        }

        if (fields.size() < 2)
        {
            continue;
        }

        const std::string asset = fields[0];
        const std::string sector = fields[1];

        if (asset.empty() || sector.empty())
        {
            continue; // skip empty entries
        }

        assets.push_back(asset);
        sectors.push_back(sector);
    }

    if (assets.empty())
    {
        throw std::runtime_error("SectorMapping::from_csv: no valid mappings found in: " + filepath);
    }

    return SectorMapping(assets, sectors);
}

SectorMapping SectorMapping::from_json(const nlohmann::json& j)
{
    if (j.is_array())
    {
        std::vector<std::pair<std::string, std::string>> pairs;
        for (const auto& entry : j)
        {
            if (!entry.contains("asset") || !entry.contains("sector"))
            {
                throw std::invalid_argument("SectorMapping::from_json: each entry needs 'asset' and 'sector'");
            }
            pairs.emplace_back(entry.at("asset").get<std::string>(), entry.at("sector").get<std::string>());
        }
        return from_pairs(pairs);
    }

    if (!j.contains("assets") || !j.contains("sectors"))
    {
        throw std::invalid_argument("SectorMapping::from_json: JSON must contain 'assets' and 'sectors' arrays");
    }

    std::vector<std::string> assets = j.at("assets").get<std::vector<std::string>>();
    std::vector<std::string> sectors = j.at("sectors").get<std::vector<std::string>>();

    if (j.contains("sector_list"))
    {
        return SectorMapping(assets, sectors, j.at("sector_list").get<std::vector<std::string>>());
    }

    return SectorMapping(assets, sectors);
}

void SectorMapping::build_reverse_index()
{
    sector_to_assets_.clear();
    sectors_.clear();
    for (size_t i = 0; i < asset_names_.size(); ++i)
    {
        const std::string& sector = asset_to_sector_.at(asset_names_[i]);
        auto it = sector_to_assets_.find(sector);
        if (it == sector_to_assets_.end())
        {
            sectors_.push_back(sector);
            it = sector_to_assets_.emplace(sector, std::vector<int>()).first;
        }
        it->second.push_back(static_cast<int>(i));
    }
}

const std::vector<int>& SectorMapping::get_assets_in_sector(const std::string& sector) const
{
    auto it = sector_to_assets_.find(sector);
    if (it == sector_to_assets_.end())
    {
        throw std::out_of_range("SectorMapping: sector not found: " + sector);
    }
    return it->second;
}

const std::string& SectorMapping::get_sector_for_asset(const std::string& asset) const
{
    auto it = asset_to_sector_.find(asset);
    if (it == asset_to_sector_.end())
    {
        throw std::out_of_range("SectorMapping: asset not found: " + asset);
    }
    return it->second;
}

bool SectorMapping::has_sector(const std::string& sector) const
{
    return sector_to_assets_.find(sector) != sector_to_assets_.end();
}

nlohmann::json SectorMapping::to_json() const
{
    nlohmann::json j;
    j["assets"] = asset_names_;
    std::vector<std::string> sectors(asset_names_.size());
    for (size_t i = 0; i < asset_names_.size(); ++i)
    {
        sectors[i] = asset_to_sector_.at(asset_names_[i]);
    }
    j["sectors"] = sectors;
    j["sector_list"] = sectors_;
    return j;
}

} // namespace data
} // namespace sectoropt
