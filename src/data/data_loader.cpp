/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader
 */

#include "sectoropt/data/data_loader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace sectoropt
{
    namespace data
    {

        // ===========================
        // CSV Loading - Wide Format
        // ===========================

        PriceTable DataLoader::load_csv_wide(const std::string &filepath,
                                             const std::vector<std::string> &tickers)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            auto header = parse_csv_line(line);
            if (header.size() < 2 || trim(header[0]) != "date")
            {
                throw std::runtime_error("CSV must start with a 'date' column followed by tickers");
            }

            std::vector<std::string> all_tickers;
            for (size_t i = 1; i < header.size(); ++i)
            {
                all_tickers.push_back(trim(header[i]));
            }

            // Column positions to load
            std::vector<size_t> column_indices;
            std::vector<std::string> selected_tickers;

            if (tickers.empty())
            {
                for (size_t i = 0; i < all_tickers.size(); ++i)
                {
                    column_indices.push_back(i);
                }
                selected_tickers = all_tickers;
            }
            else
            {
                for (const auto &ticker : tickers)
                {
                    auto it = std::find(all_tickers.begin(), all_tickers.end(), ticker);
                    if (it == all_tickers.end())
                    {
                        throw std::runtime_error("Ticker '" + ticker + "' not found in " + filepath);
                    }
                    column_indices.push_back(static_cast<size_t>(std::distance(all_tickers.begin(), it)));
                    selected_tickers.push_back(ticker);
                }
            }

            std::vector<std::string> dates;
            std::vector<std::vector<double>> rows;

            while (std::getline(file, line))
            {
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                dates.push_back(trim(fields[0]));

                std::vector<double> row;
                row.reserve(column_indices.size());
                for (size_t idx : column_indices)
                {
                    if (idx + 1 < fields.size())
                    {
                        row.push_back(safe_stod(fields[idx + 1]));
                    }
                    else
                    {
                        row.push_back(std::numeric_limits<double>::quiet_NaN());
                    }
                }
                rows.push_back(std::move(row));
            }

            if (rows.empty())
            {
                throw std::runtime_error("No data rows found in CSV file: " + filepath);
            }

            PriceTable table;
            table.values.resize(static_cast<Eigen::Index>(rows.size()),
                                static_cast<Eigen::Index>(selected_tickers.size()));
            for (size_t i = 0; i < rows.size(); ++i)
            {
                for (size_t j = 0; j < selected_tickers.size(); ++j)
                {
                    table.values(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
                }
            }
            table.dates = std::move(dates);
            table.tickers = std::move(selected_tickers);

            return table;
        }

        ReturnSeries DataLoader::load_prices_csv(const std::string &filepath,
                                                 const std::vector<std::string> &tickers)
        {
            PriceTable table = load_csv_wide(filepath, tickers);
            return ReturnSeries::from_prices(table.values, table.tickers, table.dates);
        }

        ReturnSeries DataLoader::load_returns_csv(const std::string &filepath,
                                                  const std::vector<std::string> &tickers)
        {
            PriceTable table = load_csv_wide(filepath, tickers);
            return ReturnSeries(table.values, table.tickers, table.dates);
        }

        void DataLoader::save_csv_wide(const ReturnSeries &series, const std::string &filepath)
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "date";
            for (const auto &ticker : series.get_tickers())
            {
                file << "," << ticker;
            }
            file << "\n";

            const auto &returns = series.get_returns();
            const auto &dates = series.get_dates();
            file << std::setprecision(12);

            for (Eigen::Index i = 0; i < returns.rows(); ++i)
            {
                file << (dates.empty() ? std::to_string(i) : dates[static_cast<size_t>(i)]);
                for (Eigen::Index j = 0; j < returns.cols(); ++j)
                {
                    file << ",";
                    if (std::isfinite(returns(i, j)))
                    {
                        file << returns(i, j);
                    }
                }
                file << "\n";
            }
        }

        // ==================
        // JSON Loading
        // ==================

        nlohmann::json DataLoader::load_json(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
            }

            return j;
        }

        // ==================
        // Synthetic Data
        // ==================

        PriceTable DataLoader::generate_synthetic_prices(const std::vector<std::string> &tickers,
                                                         size_t num_days,
                                                         std::uint32_t seed,
                                                         double volatility,
                                                         double drift)
        {
            if (tickers.empty() || num_days < 2)
            {
                throw std::invalid_argument("Synthetic data needs at least one ticker and two days");
            }

            std::mt19937 gen(seed);
            std::normal_distribution<double> dist(drift, volatility);

            PriceTable table;
            table.tickers = tickers;
            table.values.resize(static_cast<Eigen::Index>(num_days), static_cast<Eigen::Index>(tickers.size()));
            table.dates.reserve(num_days);

            for (size_t i = 0; i < num_days; ++i)
            {
                table.dates.push_back("d" + std::to_string(i));
            }

            for (Eigen::Index j = 0; j < table.values.cols(); ++j)
            {
                table.values(0, j) = 100.0;
                for (Eigen::Index i = 1; i < table.values.rows(); ++i)
                {
                    table.values(i, j) = table.values(i - 1, j) * (1.0 + dist(gen));
                }
            }

            return table;
        }

        // ==================
        // Helper Methods
        // ==================

        std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::string token;
            bool in_quotes = false;

            for (char c : line)
            {
                if (c == '"')
                {
                    in_quotes = !in_quotes;
                }
                else if (c == ',' && !in_quotes)
                {
                    tokens.push_back(token);
                    token.clear();
                }
                else
                {
                    token += c;
                }
            }

            tokens.push_back(token);
            return tokens;
        }

        std::string DataLoader::trim(const std::string &str)
        {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";

            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

        double DataLoader::safe_stod(const std::string &str)
        {
            std::string trimmed = trim(str);
            if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            try
            {
                size_t consumed = 0;
                double value = std::stod(trimmed, &consumed);
                if (consumed != trimmed.size())
                {
                    throw std::runtime_error("Malformed numeric field: '" + trimmed + "'");
                }
                return value;
            }
            catch (const std::invalid_argument &)
            {
                throw std::runtime_error("Malformed numeric field: '" + trimmed + "'");
            }
            catch (const std::out_of_range &)
            {
                throw std::runtime_error("Numeric field out of range: '" + trimmed + "'");
            }
        }

    } // namespace data
} // namespace sectoropt
