/**
 * @file sector_constraints.hpp
 * @brief Sector exposure constraints for long-only, fully-invested portfolios
 *
 * Converts per-sector (min, max) bounds into constraint records:
 *   sum(w) = 1
 *   sum(w_i : i in sector) - min >= 0     (LOWER)
 *   max - sum(w_i : i in sector) >= 0     (UPPER)
 *   0 <= w_i <= 1
 */

#pragma once

#include "sectoropt/data/sector_mapper.hpp"
#include "sectoropt/optimizer/linear_constraints.hpp"
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace sectoropt
{
    namespace optimizer
    {

        /**
         * @struct SectorBounds
         * @brief Allowed aggregate weight range for one sector
         */
        struct SectorBounds
        {
            double min_weight = 0.0; ///< Minimum total weight (e.g., 0.10 = 10%)
            double max_weight = 1.0; ///< Maximum total weight

            SectorBounds() = default;
            SectorBounds(double min_w, double max_w) : min_weight(min_w), max_weight(max_w) {}

            /**
             * @brief Check 0 <= min <= max <= 1 and finiteness
             * @param sector Sector name used in the error message
             * @throws InvalidConstraintError if out of range
             */
            void validate(const std::string &sector) const;

            nlohmann::json to_json() const;

            /**
             * @brief Parse {"min": a, "max": b} or [a, b]
             *
             * Missing keys default to 0 / 1.
             */
            static SectorBounds from_json(const nlohmann::json &j);
        };

        using SectorBoundsMap = std::map<std::string, SectorBounds>;

        /**
         * @enum ConstraintKind
         * @brief Side of a sector bound
         */
        enum class ConstraintKind
        {
            LOWER, ///< sum(w_S) >= bound
            UPPER  ///< sum(w_S) <= bound
        };

        std::string to_string(ConstraintKind kind);

        /**
         * @struct ConstraintRecord
         * @brief One sector inequality, bound to its own asset index list
         */
        struct ConstraintRecord
        {
            std::string sector;             ///< Sector name
            std::vector<int> asset_indices; ///< Assets in the sector (mapping order)
            double bound = 0.0;             ///< Bound value
            ConstraintKind kind = ConstraintKind::LOWER;

            /**
             * @brief Sum of the sector's weights
             */
            double exposure(const Eigen::VectorXd &weights) const;

            /**
             * @brief Residual in >= 0 form (negative means violated)
             */
            double residual(const Eigen::VectorXd &weights) const;
        };

        /**
         * @class ConstraintSet
         * @brief Complete constraint description for one optimization
         *
         * Holds the budget equality, the sector inequality records and the
         * per-asset box bounds. Immutable once built.
         */
        class ConstraintSet
        {
        public:
            ConstraintSet() = default;

            ConstraintSet(size_t num_assets,
                          std::vector<ConstraintRecord> records,
                          std::vector<std::string> unconstrained_sectors);

            size_t num_assets() const { return num_assets_; }

            const std::vector<ConstraintRecord> &get_records() const { return records_; }

            /**
             * @brief Sectors in the mapping that received no bounds
             */
            const std::vector<std::string> &unconstrained_sectors() const { return unconstrained_sectors_; }

            const Eigen::VectorXd &lower_bounds() const { return lower_bounds_; }
            const Eigen::VectorXd &upper_bounds() const { return upper_bounds_; }

            /**
             * @brief Budget residual sum(w) - 1
             */
            double budget_residual(const Eigen::VectorXd &weights) const;

            /**
             * @brief Inequality residuals (one per record, >= 0 when satisfied)
             */
            Eigen::VectorXd residuals(const Eigen::VectorXd &weights) const;

            /**
             * @brief Largest violation over budget, sector and box constraints
             */
            double max_violation(const Eigen::VectorXd &weights) const;

            bool is_satisfied(const Eigen::VectorXd &weights, double tolerance = 1e-6) const;

            /**
             * @brief Matrix form consumed by SqpSolver
             *
             * Budget goes to A_eq; each record becomes one A_ineq row with an
             * infinite bound on its open side.
             */
            LinearConstraints to_linear_constraints() const;

        private:
            void check_dimension(const Eigen::VectorXd &weights) const;

            size_t num_assets_ = 0;
            std::vector<ConstraintRecord> records_;
            std::vector<std::string> unconstrained_sectors_;
            Eigen::VectorXd lower_bounds_;
            Eigen::VectorXd upper_bounds_;
        };

        /**
         * @class SectorConstraintBuilder
         * @brief Validates sector bounds and produces a ConstraintSet
         *
         * All validation happens here, before any solver work:
         * - each bound finite with 0 <= min <= max <= 1
         * - each bounded sector must hold at least one asset
         * - sum of mins <= 1 and sum of effective maxes >= 1
         *   (sectors without bounds count with max 1)
         *
         * Usage Example:
         * @code
         * SectorBoundsMap bounds{{"Technology", {0.1, 0.4}}};
         * ConstraintSet set = SectorConstraintBuilder::build(mapping, bounds);
         * @endcode
         */
        class SectorConstraintBuilder
        {
        public:
            /**
             * @throws InvalidConstraintError on invalid or infeasible bounds
             */
            static ConstraintSet build(const data::SectorMapping &mapping,
                                       const SectorBoundsMap &bounds,
                                       bool verbose = false);

            /**
             * @brief Merge separate min/max dictionaries
             *
             * A sector missing from one side gets 0 (min) or 1 (max).
             */
            static SectorBoundsMap merge_bounds(const std::map<std::string, double> &min_bounds,
                                                const std::map<std::string, double> &max_bounds);

            static SectorBoundsMap bounds_from_json(const nlohmann::json &j);

        private:
            static void check_aggregate_feasibility(const data::SectorMapping &mapping,
                                                    const SectorBoundsMap &bounds);
        };

    } // namespace optimizer
} // namespace sectoropt
