/**
 * @file sector_constraints.cpp
 * @brief Implementation of sector constraint construction
 */

#include "sectoropt/optimizer/sector_constraints.hpp"
#include "sectoropt/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace sectoropt
{
    namespace optimizer
    {

        // ====================================================================
        // SectorBounds
        // ====================================================================

        void SectorBounds::validate(const std::string &sector) const
        {
            if (!std::isfinite(min_weight) || !std::isfinite(max_weight))
            {
                throw InvalidConstraintError("Bounds for sector '" + sector + "' must be finite");
            }

            if (min_weight < 0.0)
            {
                throw InvalidConstraintError(
                    "min_weight for sector '" + sector + "' must be non-negative, got: " +
                    std::to_string(min_weight));
            }

            if (max_weight > 1.0)
            {
                throw InvalidConstraintError(
                    "max_weight for sector '" + sector + "' cannot exceed 1, got: " +
                    std::to_string(max_weight));
            }

            if (min_weight > max_weight)
            {
                throw InvalidConstraintError(
                    "min_weight (" + std::to_string(min_weight) +
                    ") cannot exceed max_weight (" + std::to_string(max_weight) +
                    ") for sector '" + sector + "'");
            }
        }

        nlohmann::json SectorBounds::to_json() const
        {
            return nlohmann::json{{"min", min_weight}, {"max", max_weight}};
        }

        namespace
        {
            double bound_value(const nlohmann::json &value, const char *side)
            {
                if (!value.is_number())
                {
                    throw InvalidConstraintError(std::string("Sector bound '") + side +
                                                 "' must be a number, got: " + value.dump());
                }
                return value.get<double>();
            }
        }

        SectorBounds SectorBounds::from_json(const nlohmann::json &j)
        {
            SectorBounds bounds;

            if (j.is_array())
            {
                if (j.size() != 2)
                {
                    throw InvalidConstraintError("Sector bounds array must have exactly two elements [min, max]");
                }
                bounds.min_weight = bound_value(j[0], "min");
                bounds.max_weight = bound_value(j[1], "max");
            }
            else if (j.is_object())
            {
                if (j.contains("min"))
                {
                    bounds.min_weight = bound_value(j["min"], "min");
                }
                if (j.contains("max"))
                {
                    bounds.max_weight = bound_value(j["max"], "max");
                }
            }
            else
            {
                throw InvalidConstraintError("Sector bounds must be an object {min, max} or an array [min, max]");
            }

            return bounds;
        }

        std::string to_string(ConstraintKind kind)
        {
            return kind == ConstraintKind::LOWER ? "LOWER" : "UPPER";
        }

        // ====================================================================
        // ConstraintRecord
        // ====================================================================

        double ConstraintRecord::exposure(const Eigen::VectorXd &weights) const
        {
            double total = 0.0;
            for (int idx : asset_indices)
            {
                total += weights(idx);
            }
            return total;
        }

        double ConstraintRecord::residual(const Eigen::VectorXd &weights) const
        {
            const double total = exposure(weights);
            return kind == ConstraintKind::LOWER ? total - bound : bound - total;
        }

        // ====================================================================
        // ConstraintSet
        // ====================================================================

        ConstraintSet::ConstraintSet(size_t num_assets,
                                     std::vector<ConstraintRecord> records,
                                     std::vector<std::string> unconstrained_sectors)
            : num_assets_(num_assets),
              records_(std::move(records)),
              unconstrained_sectors_(std::move(unconstrained_sectors)),
              lower_bounds_(Eigen::VectorXd::Zero(num_assets)),
              upper_bounds_(Eigen::VectorXd::Ones(num_assets))
        {
            for (const auto &record : records_)
            {
                for (int idx : record.asset_indices)
                {
                    if (idx < 0 || static_cast<size_t>(idx) >= num_assets_)
                    {
                        throw std::out_of_range(
                            "Asset index " + std::to_string(idx) + " out of range in constraint for sector '" +
                            record.sector + "'");
                    }
                }
            }
        }

        void ConstraintSet::check_dimension(const Eigen::VectorXd &weights) const
        {
            if (static_cast<size_t>(weights.size()) != num_assets_)
            {
                throw std::invalid_argument(
                    "Weight vector size (" + std::to_string(weights.size()) +
                    ") does not match number of assets (" + std::to_string(num_assets_) + ")");
            }
        }

        double ConstraintSet::budget_residual(const Eigen::VectorXd &weights) const
        {
            check_dimension(weights);
            return weights.sum() - 1.0;
        }

        Eigen::VectorXd ConstraintSet::residuals(const Eigen::VectorXd &weights) const
        {
            check_dimension(weights);

            Eigen::VectorXd result(static_cast<Eigen::Index>(records_.size()));
            for (size_t k = 0; k < records_.size(); ++k)
            {
                result(static_cast<Eigen::Index>(k)) = records_[k].residual(weights);
            }
            return result;
        }

        double ConstraintSet::max_violation(const Eigen::VectorXd &weights) const
        {
            double worst = std::abs(budget_residual(weights));

            for (const auto &record : records_)
            {
                worst = std::max(worst, -record.residual(weights));
            }

            worst = std::max(worst, (lower_bounds_ - weights).maxCoeff());
            worst = std::max(worst, (weights - upper_bounds_).maxCoeff());

            return worst;
        }

        bool ConstraintSet::is_satisfied(const Eigen::VectorXd &weights, double tolerance) const
        {
            return max_violation(weights) <= tolerance;
        }

        LinearConstraints ConstraintSet::to_linear_constraints() const
        {
            const auto n = static_cast<Eigen::Index>(num_assets_);
            const auto m = static_cast<Eigen::Index>(records_.size());
            const double inf = std::numeric_limits<double>::infinity();

            LinearConstraints lc;
            lc.A_eq = Eigen::MatrixXd::Ones(1, n);
            lc.b_eq = Eigen::VectorXd::Ones(1);

            lc.A_ineq = Eigen::MatrixXd::Zero(m, n);
            lc.ineq_lower = Eigen::VectorXd::Constant(m, -inf);
            lc.ineq_upper = Eigen::VectorXd::Constant(m, inf);

            for (Eigen::Index k = 0; k < m; ++k)
            {
                const auto &record = records_[static_cast<size_t>(k)];
                for (int idx : record.asset_indices)
                {
                    lc.A_ineq(k, idx) = 1.0;
                }

                if (record.kind == ConstraintKind::LOWER)
                {
                    lc.ineq_lower(k) = record.bound;
                }
                else
                {
                    lc.ineq_upper(k) = record.bound;
                }
            }

            lc.lower_bounds = lower_bounds_;
            lc.upper_bounds = upper_bounds_;

            return lc;
        }

        // ====================================================================
        // SectorConstraintBuilder
        // ====================================================================

        ConstraintSet SectorConstraintBuilder::build(const data::SectorMapping &mapping,
                                                     const SectorBoundsMap &bounds,
                                                     bool verbose)
        {
            if (mapping.empty())
            {
                throw InvalidConstraintError("Cannot build constraints for an empty sector mapping");
            }

            for (const auto &entry : bounds)
            {
                if (!mapping.has_sector(entry.first))
                {
                    throw InvalidConstraintError(
                        "Bounds given for sector '" + entry.first + "' which holds no assets");
                }
                entry.second.validate(entry.first);
            }

            check_aggregate_feasibility(mapping, bounds);

            std::vector<ConstraintRecord> records;
            std::vector<std::string> unconstrained;
            records.reserve(2 * bounds.size());

            // Emit in mapping sector order so row order is deterministic
            for (const auto &sector : mapping.get_sectors())
            {
                auto it = bounds.find(sector);
                if (it == bounds.end())
                {
                    unconstrained.push_back(sector);
                    continue;
                }

                const auto &indices = mapping.get_assets_in_sector(sector);
                records.push_back(ConstraintRecord{sector, indices, it->second.min_weight, ConstraintKind::LOWER});
                records.push_back(ConstraintRecord{sector, indices, it->second.max_weight, ConstraintKind::UPPER});
            }

            if (verbose && !unconstrained.empty())
            {
                std::cerr << "Note: " << unconstrained.size() << " sector(s) without bounds are unconstrained:";
                for (const auto &sector : unconstrained)
                {
                    std::cerr << " " << sector;
                }
                std::cerr << "\n";
            }

            return ConstraintSet(mapping.size(), std::move(records), std::move(unconstrained));
        }

        void SectorConstraintBuilder::check_aggregate_feasibility(const data::SectorMapping &mapping,
                                                                  const SectorBoundsMap &bounds)
        {
            constexpr double tolerance = 1e-9;

            double sum_min = 0.0;
            double sum_max = 0.0;
            for (const auto &sector : mapping.get_sectors())
            {
                auto it = bounds.find(sector);
                if (it == bounds.end())
                {
                    sum_max += 1.0;
                }
                else
                {
                    sum_min += it->second.min_weight;
                    sum_max += it->second.max_weight;
                }
            }

            if (sum_min > 1.0 + tolerance)
            {
                std::ostringstream oss;
                oss << "Sector minimums sum to " << sum_min << " which exceeds the full budget of 1";
                throw InvalidConstraintError(oss.str());
            }

            if (sum_max < 1.0 - tolerance)
            {
                std::ostringstream oss;
                oss << "Sector maximums sum to " << sum_max << " which cannot hold the full budget of 1";
                throw InvalidConstraintError(oss.str());
            }
        }

        SectorBoundsMap SectorConstraintBuilder::merge_bounds(const std::map<std::string, double> &min_bounds,
                                                              const std::map<std::string, double> &max_bounds)
        {
            SectorBoundsMap merged;

            for (const auto &entry : min_bounds)
            {
                merged[entry.first].min_weight = entry.second;
            }
            for (const auto &entry : max_bounds)
            {
                merged[entry.first].max_weight = entry.second;
            }

            return merged;
        }

        SectorBoundsMap SectorConstraintBuilder::bounds_from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw InvalidConstraintError("sector_bounds must be an object keyed by sector name");
            }

            SectorBoundsMap bounds;
            for (auto it = j.begin(); it != j.end(); ++it)
            {
                bounds[it.key()] = SectorBounds::from_json(it.value());
            }
            return bounds;
        }

    } // namespace optimizer
} // namespace sectoropt
