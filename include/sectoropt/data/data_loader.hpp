/**
 * @file data_loader.hpp
 * @brief CSV and JSON loading utilities
 *
 * Loads price or return tables from wide-format CSV files and
 * configuration documents from JSON files.
 */

#ifndef SECTOROPT_DATA_DATA_LOADER_HPP
#define SECTOROPT_DATA_DATA_LOADER_HPP

#include "sectoropt/data/return_series.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace sectoropt {
namespace data {

/**
 * @struct PriceTable
 * @brief Raw wide-format table (dates x tickers)
 */
struct PriceTable {
    Eigen::MatrixXd values;           ///< One row per date, one column per ticker
    std::vector<std::string> dates;   ///< Row labels
    std::vector<std::string> tickers; ///< Column labels
};

/**
 * @class DataLoader
 * @brief Loads market data and configuration from files
 *
 * CSV files use the wide format:
 * @code
 * date,TCS.NS,INFY.NS,SBIN.NS
 * 2023-01-02,3250.5,1510.2,610.4
 * @endcode
 * Empty cells and "nan" are read as missing values.
 */
class DataLoader {
public:
    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Read a wide-format CSV table
     * @param filepath Path to CSV file
     * @param tickers Columns to load, in this order (all columns if empty)
     * @throws std::runtime_error if the file cannot be read, a requested
     *         ticker is missing or no data rows are present
     */
    static PriceTable load_csv_wide(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Load a price CSV and convert it to simple returns
     */
    static ReturnSeries load_prices_csv(const std::string& filepath,
                                        const std::vector<std::string>& tickers = {});

    /**
     * @brief Load a CSV that already holds periodic returns
     */
    static ReturnSeries load_returns_csv(const std::string& filepath,
                                         const std::vector<std::string>& tickers = {});

    /**
     * @brief Write a ReturnSeries back out in wide format
     * @throws std::runtime_error if the file cannot be opened
     */
    static void save_csv_wide(const ReturnSeries& series, const std::string& filepath);

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON configuration file
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    // ========================================================================
    // Data Generation (for testing and demos)
    // ========================================================================

    /**
     * @brief Generate synthetic prices with i.i.d. normal daily returns
     * @param tickers Ticker symbols
     * @param num_days Number of price rows
     * @param seed Random seed (identical seeds give identical tables)
     * @param volatility Daily return standard deviation
     * @param drift Daily mean return
     */
    static PriceTable generate_synthetic_prices(const std::vector<std::string>& tickers,
                                                size_t num_days,
                                                std::uint32_t seed = 42,
                                                double volatility = 0.02,
                                                double drift = 0.0005);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);
    static double safe_stod(const std::string& str);
};

} // namespace data
} // namespace sectoropt

#endif // SECTOROPT_DATA_DATA_LOADER_HPP
