// === Objectives ==============================================================
//
// Turns per-site weight columns plus a shared coverage matrix into fitness
// functions over placements. `Objectives` keeps every column as a separate
// objective (multi-objective mode); `CombinedObjective` folds them into one
// weight vector using per-column importance. Both are pure over immutable
// inputs, so candidates may be evaluated in any order.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sensor_placement/coverage.hpp"
#include "sensor_placement/site_set.hpp"
#include "sensor_placement/types.hpp"

namespace sensor_placement {

/**
 * @brief Names a value column of the region data and how much it matters.
 */
struct Column final {
    std::string dataset{};  /**< Dataset the column belongs to (e.g. "workplace"). */
    std::string column{};   /**< Column within the dataset (e.g. "workers"). */
    double weight{1.0};     /**< Importance when objectives are combined. */
    std::string label{};    /**< Display label; empty means "<dataset>_<column>". */
    double fill_na{0.0};    /**< Replacement for missing (NaN) values. */

    [[nodiscard]] std::string resolved_label() const;
};

/** @brief Labelled non-negative weight vector aligned to the site order. */
class Objective final {
  public:
    /**
     * @brief Validate and optionally normalise @p weights to sum to 1.
     *
     * All-zero weights are accepted here; evaluating such an objective raises
     * DegenerateObjectiveError.
     */
    Objective(std::vector<double> weights, std::string label, bool normalize = true);

    [[nodiscard]] const std::string& label() const noexcept;
    [[nodiscard]] const std::vector<double>& weights() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    /** @brief Weighted average of @p site_coverage: Σ w·c / Σ w. */
    [[nodiscard]] double score(const std::vector<double>& site_coverage) const;

  private:
    std::string str_label_;
    std::vector<double> list_weights_;
};

/**
 * @brief Fitness over placements for one or more objectives sharing a coverage matrix.
 */
class FitnessFunction {
  public:
    explicit FitnessFunction(CoverageMatrixPtr coverage);
    virtual ~FitnessFunction() = default;

    [[nodiscard]] virtual std::size_t n_obj() const noexcept = 0;
    [[nodiscard]] virtual std::vector<std::string> labels() const = 0;
    /** @brief Score an already computed per-site coverage vector. */
    [[nodiscard]] virtual std::vector<double> evaluate(const std::vector<double>& site_coverage) const = 0;

    /** @brief One score per objective for a 0/1 placement. */
    [[nodiscard]] std::vector<double> fitness(const Placement& placement) const;
    /** @brief One score per objective for an index-encoded network. */
    [[nodiscard]] std::vector<double> fitness(const IndexVector& sensor_indices) const;
    /** @brief Per-site coverage induced by @p placement. */
    [[nodiscard]] std::vector<double> site_coverage(const Placement& placement) const;

    [[nodiscard]] const CoverageMatrix& coverage() const noexcept;
    [[nodiscard]] const CoverageMatrixPtr& coverage_ptr() const noexcept;
    /** @brief Number of sensor candidates (placement length). */
    [[nodiscard]] std::size_t n_candidates() const noexcept;
    [[nodiscard]] std::size_t n_sites() const noexcept;

  protected:
    void require_aligned(const Objective& objective) const;

    CoverageMatrixPtr coverage_;
};

using FitnessFunctionPtr = std::shared_ptr<const FitnessFunction>;

/** @brief Objectives kept separate; fitness has one entry per objective. */
class Objectives final : public FitnessFunction {
  public:
    Objectives(CoverageMatrixPtr coverage, std::vector<Objective> objectives);

    /** @brief Build one objective per column from region data. */
    [[nodiscard]] static std::shared_ptr<const Objectives> from_region(
        const RegionData& region,
        const std::vector<Column>& columns,
        CoverageMatrixPtr coverage,
        bool normalize = true
    );

    [[nodiscard]] std::size_t n_obj() const noexcept override;
    [[nodiscard]] std::vector<std::string> labels() const override;
    [[nodiscard]] std::vector<double> evaluate(const std::vector<double>& site_coverage) const override;

    [[nodiscard]] const std::vector<Objective>& objectives() const noexcept;

  private:
    std::vector<Objective> list_objectives_;
};

/**
 * @brief Objectives folded into one weight vector by normalised importance.
 */
class CombinedObjective final : public FitnessFunction {
  public:
    CombinedObjective(
        CoverageMatrixPtr coverage,
        std::vector<Objective> objectives,
        std::vector<double> importance,
        bool normalize = true
    );

    /** @brief Importance is taken from each column's weight. */
    [[nodiscard]] static std::shared_ptr<const CombinedObjective> from_region(
        const RegionData& region,
        const std::vector<Column>& columns,
        CoverageMatrixPtr coverage,
        bool normalize = true
    );

    [[nodiscard]] std::size_t n_obj() const noexcept override;
    [[nodiscard]] std::vector<std::string> labels() const override;
    [[nodiscard]] std::vector<double> evaluate(const std::vector<double>& site_coverage) const override;

    [[nodiscard]] const std::vector<double>& importance() const noexcept;
    [[nodiscard]] const std::vector<std::string>& component_labels() const noexcept;
    [[nodiscard]] const Objective& combined() const noexcept;

  private:
    std::vector<double> list_importance_;
    std::vector<std::string> list_component_labels_;
    Objective objective_combined_;
};

/** @brief 0/1 placement from candidate indices; repeated indices collapse. */
[[nodiscard]] Placement placement_from_indices(const IndexVector& sensor_indices, std::size_t n_candidates);

}  // namespace sensor_placement
