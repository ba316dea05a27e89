/**
 * @file return_series.hpp
 * @brief Aligned per-asset periodic return observations
 *
 * Holds a time-indexed table of fractional returns, one column per asset.
 * Rows are observations (oldest first), columns are assets. The series is
 * produced by a data collaborator; this class only stores it, aligns it and
 * removes incomplete rows before covariance estimation.
 */

#ifndef SECTOROPT_DATA_RETURN_SERIES_HPP
#define SECTOROPT_DATA_RETURN_SERIES_HPP

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace sectoropt
{
    namespace data
    {

        /**
         * @class ReturnSeries
         * @brief Container for multi-asset periodic return data
         *
         * Stores returns as an Eigen matrix (observations x assets) with
         * ticker labels and optional date labels.
         *
         * @note Missing observations are represented as NaN.
         * @note Read-only once handed to the optimizer.
         *
         * Usage Example:
         * @code
         * ReturnSeries series = ReturnSeries::from_prices(prices, {"AAPL", "MSFT"}, dates);
         * Eigen::VectorXd mu = series.mean_returns();
         * @endcode
         */
        class ReturnSeries
        {
        public:
            /**
             * @brief Empty series
             */
            ReturnSeries() = default;

            /**
             * @brief Construct from a return matrix
             * @param returns Return matrix (observations x assets)
             * @param tickers Asset identifiers, one per column
             * @param dates Optional observation labels, one per row (may be empty)
             * @throws std::invalid_argument if labels do not match the matrix
             */
            ReturnSeries(const Eigen::MatrixXd &returns,
                         const std::vector<std::string> &tickers,
                         const std::vector<std::string> &dates = {});

            /**
             * @brief Build a return series from a price table
             * @param prices Price matrix (dates x assets)
             * @param tickers Asset identifiers
             * @param dates Optional date labels for the price rows
             * @return Simple returns P_t / P_{t-1} - 1 with incomplete rows removed
             * @throws std::invalid_argument if fewer than two price rows
             *
             * A return is missing when either price is NaN or the previous
             * price is zero. The first price row has no return and is dropped.
             */
            static ReturnSeries from_prices(const Eigen::MatrixXd &prices,
                                            const std::vector<std::string> &tickers,
                                            const std::vector<std::string> &dates = {});

            const Eigen::MatrixXd &get_returns() const { return returns_; }
            const std::vector<std::string> &get_tickers() const { return tickers_; }
            const std::vector<std::string> &get_dates() const { return dates_; }

            size_t num_observations() const { return static_cast<size_t>(returns_.rows()); }
            size_t num_assets() const { return static_cast<size_t>(returns_.cols()); }
            bool empty() const { return returns_.size() == 0; }

            /**
             * @brief Reorder/subset columns to the given ticker order
             * @param selected_tickers Tickers to keep, in the desired order
             * @return New series
             * @throws std::invalid_argument if a ticker is not present
             */
            ReturnSeries select_assets(const std::vector<std::string> &selected_tickers) const;

            /**
             * @brief Remove rows containing NaN or Inf values
             * @return New series with complete rows only (possibly zero rows)
             */
            ReturnSeries drop_missing() const;

            /**
             * @brief Count rows containing at least one missing value
             */
            size_t count_incomplete_rows() const;

            /**
             * @brief Per-asset arithmetic mean of the periodic returns
             * @return Vector of means (size = num_assets)
             * @throws std::runtime_error if the series has no observations
             */
            Eigen::VectorXd mean_returns() const;

            /**
             * @brief Check whether a ticker is present
             */
            bool has_ticker(const std::string &ticker) const;

            /**
             * @brief Print dimensions and labels
             */
            void print_summary() const;

        private:
            int find_ticker_index(const std::string &ticker) const;
            void build_index_map();

            Eigen::MatrixXd returns_;                    ///< Returns (observations x assets)
            std::vector<std::string> tickers_;           ///< Asset tickers
            std::vector<std::string> dates_;             ///< Observation labels (optional)
            std::map<std::string, size_t> ticker_index_; ///< Ticker to column map
        };

    } // namespace data
} // namespace sectoropt

#endif // SECTOROPT_DATA_RETURN_SERIES_HPP
