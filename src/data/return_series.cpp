/**
 * @file return_series.cpp
 * @brief Implementation of ReturnSeries
 */

#include "sectoropt/data/return_series.hpp"
#include "sectoropt/core/errors.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace sectoropt
{
    namespace data
    {

        // ============================================================================
        // Construction
        // ============================================================================

        ReturnSeries::ReturnSeries(const Eigen::MatrixXd &returns,
                                   const std::vector<std::string> &tickers,
                                   const std::vector<std::string> &dates)
            : returns_(returns), tickers_(tickers), dates_(dates)
        {
            if (returns_.cols() != static_cast<Eigen::Index>(tickers_.size()))
            {
                throw std::invalid_argument(
                    "Return matrix columns (" + std::to_string(returns_.cols()) +
                    ") must match tickers vector size (" + std::to_string(tickers_.size()) + ")");
            }
            if (!dates_.empty() && returns_.rows() != static_cast<Eigen::Index>(dates_.size()))
            {
                throw std::invalid_argument("Return matrix rows must match dates vector size");
            }

            build_index_map();

            if (ticker_index_.size() != tickers_.size())
            {
                throw std::invalid_argument("Return series contains duplicate tickers");
            }
        }

        ReturnSeries ReturnSeries::from_prices(const Eigen::MatrixXd &prices,
                                               const std::vector<std::string> &tickers,
                                               const std::vector<std::string> &dates)
        {
            if (prices.rows() < 2)
            {
                throw InsufficientDataError("Need at least 2 price observations to calculate returns");
            }
            if (!dates.empty() && prices.rows() != static_cast<Eigen::Index>(dates.size()))
            {
                throw std::invalid_argument("Price matrix rows must match dates vector size");
            }

            Eigen::MatrixXd returns(prices.rows() - 1, prices.cols());

            for (Eigen::Index i = 0; i < prices.rows() - 1; ++i)
            {
                for (Eigen::Index j = 0; j < prices.cols(); ++j)
                {
                    const double p_t = prices(i + 1, j);
                    const double p_tm1 = prices(i, j);

                    if (std::isnan(p_t) || std::isnan(p_tm1) || p_tm1 == 0.0)
                    {
                        returns(i, j) = std::numeric_limits<double>::quiet_NaN();
                    }
                    else
                    {
                        returns(i, j) = (p_t - p_tm1) / p_tm1;
                    }
                }
            }

            // Each return is labelled with the later of its two price dates
            std::vector<std::string> return_dates;
            if (!dates.empty())
            {
                return_dates.assign(dates.begin() + 1, dates.end());
            }

            return ReturnSeries(returns, tickers, return_dates).drop_missing();
        }

        // ============================================================================
        // Manipulation
        // ============================================================================

        ReturnSeries ReturnSeries::select_assets(const std::vector<std::string> &selected_tickers) const
        {
            std::vector<int> indices;
            indices.reserve(selected_tickers.size());

            for (const auto &ticker : selected_tickers)
            {
                int idx = find_ticker_index(ticker);
                if (idx < 0)
                {
                    throw std::invalid_argument("Ticker not found in return series: " + ticker);
                }
                indices.push_back(idx);
            }

            Eigen::MatrixXd selected(returns_.rows(), static_cast<Eigen::Index>(indices.size()));
            for (size_t i = 0; i < indices.size(); ++i)
            {
                selected.col(static_cast<Eigen::Index>(i)) = returns_.col(indices[i]);
            }

            return ReturnSeries(selected, selected_tickers, dates_);
        }

        ReturnSeries ReturnSeries::drop_missing() const
        {
            std::vector<Eigen::Index> valid_rows;
            valid_rows.reserve(static_cast<size_t>(returns_.rows()));

            for (Eigen::Index i = 0; i < returns_.rows(); ++i)
            {
                if (returns_.row(i).allFinite())
                {
                    valid_rows.push_back(i);
                }
            }

            Eigen::MatrixXd clean(static_cast<Eigen::Index>(valid_rows.size()), returns_.cols());
            std::vector<std::string> clean_dates;
            if (!dates_.empty())
            {
                clean_dates.reserve(valid_rows.size());
            }

            for (size_t i = 0; i < valid_rows.size(); ++i)
            {
                clean.row(static_cast<Eigen::Index>(i)) = returns_.row(valid_rows[i]);
                if (!dates_.empty())
                {
                    clean_dates.push_back(dates_[static_cast<size_t>(valid_rows[i])]);
                }
            }

            return ReturnSeries(clean, tickers_, clean_dates);
        }

        size_t ReturnSeries::count_incomplete_rows() const
        {
            size_t count = 0;
            for (Eigen::Index i = 0; i < returns_.rows(); ++i)
            {
                if (!returns_.row(i).allFinite())
                {
                    ++count;
                }
            }
            return count;
        }

        // ============================================================================
        // Statistics
        // ============================================================================

        Eigen::VectorXd ReturnSeries::mean_returns() const
        {
            if (returns_.rows() == 0)
            {
                throw std::runtime_error("Cannot compute mean returns of an empty series");
            }
            return returns_.colwise().mean().transpose();
        }

        bool ReturnSeries::has_ticker(const std::string &ticker) const
        {
            return find_ticker_index(ticker) >= 0;
        }

        void ReturnSeries::print_summary() const
        {
            std::cout << "\n=== Return Series Summary ===\n";
            std::cout << "Dimensions: " << returns_.rows() << " observations x "
                      << returns_.cols() << " assets\n";
            if (!dates_.empty())
            {
                std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
            }
            std::cout << "Assets: ";
            for (const auto &ticker : tickers_)
            {
                std::cout << ticker << " ";
            }
            std::cout << "\nIncomplete rows: " << count_incomplete_rows() << "\n";
            std::cout << "=============================\n"
                      << std::endl;
        }

        // ============================================================================
        // Private Helpers
        // ============================================================================

        int ReturnSeries::find_ticker_index(const std::string &ticker) const
        {
            auto it = ticker_index_.find(ticker);
            if (it != ticker_index_.end())
            {
                return static_cast<int>(it->second);
            }
            return -1;
        }

        void ReturnSeries::build_index_map()
        {
            ticker_index_.clear();
            for (size_t i = 0; i < tickers_.size(); ++i)
            {
                ticker_index_[tickers_[i]] = i;
            }
        }

    } // namespace data
} // namespace sectoropt
