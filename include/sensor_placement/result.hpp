// === Results =================================================================
//
// Containers returned by the optimisers. A result is immutable once returned:
// optimisers produce a new result from `update` rather than modifying the one
// passed in, so callers can keep the previous result as a checkpoint.
// Fitness values are always stored in maximise-is-better orientation.

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "sensor_placement/flat_record.hpp"
#include "sensor_placement/objectives.hpp"
#include "sensor_placement/types.hpp"

namespace sensor_placement {

class EvolutionaryAlgorithm;

/** @brief Provenance shared by all results: objectives, network size, optimiser. */
class Result {
  public:
    Result(FitnessFunctionPtr objectives, std::size_t n_sensors, std::string optimiser);
    virtual ~Result() = default;

    [[nodiscard]] const FitnessFunction& objectives() const noexcept;
    [[nodiscard]] const FitnessFunctionPtr& objectives_ptr() const noexcept;
    [[nodiscard]] std::size_t n_sensors() const noexcept;
    [[nodiscard]] std::size_t n_obj() const noexcept;
    [[nodiscard]] const std::string& optimiser() const noexcept;

    /** @brief Flat, format-neutral representation including metadata. */
    [[nodiscard]] virtual FlatRecord to_flat() const;

  protected:
    FitnessFunctionPtr objectives_;
    std::size_t n_sensors_;
    std::string str_optimiser_;
};

/** @brief One network: its placement and one score per objective. */
class SingleNetworkResult : public Result {
  public:
    /** @brief Empty network with zero coverage. */
    SingleNetworkResult(FitnessFunctionPtr objectives, std::size_t n_sensors, std::string optimiser = "single");
    SingleNetworkResult(
        FitnessFunctionPtr objectives,
        std::size_t n_sensors,
        Placement placement,
        std::vector<double> total_coverage,
        std::string optimiser = "single"
    );

    [[nodiscard]] const Placement& placement() const noexcept;
    /** @brief One weighted coverage score per objective. */
    [[nodiscard]] const std::vector<double>& total_coverage() const noexcept;
    /** @brief Number of candidates holding a sensor. */
    [[nodiscard]] std::size_t n_placed() const noexcept;
    /** @brief Candidate indices holding a sensor, ascending. */
    [[nodiscard]] std::vector<SiteIndex> sensor_indices() const;
    /** @brief Identifiers of the candidates holding a sensor, in index order. */
    [[nodiscard]] std::vector<std::string> sensor_identifiers() const;
    /** @brief Coverage of each site provided by this network. */
    [[nodiscard]] std::vector<double> site_coverage() const;

    [[nodiscard]] FlatRecord to_flat() const override;
    [[nodiscard]] static SingleNetworkResult from_flat(const FlatRecord& record, FitnessFunctionPtr objectives);

  protected:
    Placement placement_;
    std::vector<double> list_total_coverage_;
};

/** @brief Greedy network plus the order sensors were added and coverage after each. */
class GreedyResult final : public SingleNetworkResult {
  public:
    GreedyResult(FitnessFunctionPtr objectives, std::size_t n_sensors);
    GreedyResult(
        FitnessFunctionPtr objectives,
        std::size_t n_sensors,
        Placement placement,
        double total_coverage,
        std::vector<SiteIndex> placement_history,
        std::vector<double> coverage_history
    );

    [[nodiscard]] const std::vector<SiteIndex>& placement_history() const noexcept;
    [[nodiscard]] const std::vector<double>& coverage_history() const noexcept;

    [[nodiscard]] FlatRecord to_flat() const override;
    [[nodiscard]] static GreedyResult from_flat(const FlatRecord& record, FitnessFunctionPtr objectives);

  private:
    std::vector<SiteIndex> list_placement_history_;
    std::vector<double> list_coverage_history_;
};

/**
 * @brief Population of index-encoded networks with their fitness vectors.
 *
 * `population()` has shape (population_size, n_sensors) and
 * `total_coverage()` has shape (population_size, n_obj), including when
 * n_obj == 1. When produced by an evolutionary optimiser the result also
 * carries the algorithm state needed to continue the search.
 */
class PopulationResult final : public Result {
  public:
    /** @brief All-zero population and coverage. */
    PopulationResult(
        FitnessFunctionPtr objectives,
        std::size_t n_sensors,
        std::size_t population_size,
        std::string optimiser = "population"
    );
    PopulationResult(
        FitnessFunctionPtr objectives,
        std::size_t n_sensors,
        std::vector<IndexVector> population,
        std::vector<std::vector<double>> total_coverage,
        std::size_t generations,
        std::string optimiser,
        std::shared_ptr<const EvolutionaryAlgorithm> algorithm = nullptr
    );

    [[nodiscard]] std::size_t population_size() const noexcept;
    [[nodiscard]] const std::vector<IndexVector>& population() const noexcept;
    [[nodiscard]] const std::vector<std::vector<double>>& total_coverage() const noexcept;
    /** @brief Generations evolved so far (0 for random or fresh populations). */
    [[nodiscard]] std::size_t generations() const noexcept;
    /** @brief Algorithm state to continue from; null when none was recorded. */
    [[nodiscard]] const std::shared_ptr<const EvolutionaryAlgorithm>& algorithm() const noexcept;

    /** @brief Index of the first individual with the highest score for @p obj_idx. */
    [[nodiscard]] std::size_t best_index(std::size_t obj_idx = 0) const;
    [[nodiscard]] SingleNetworkResult best_result(std::size_t obj_idx = 0) const;
    /** @brief Highest score reached for each objective. */
    [[nodiscard]] std::vector<double> best_coverage() const;
    [[nodiscard]] SingleNetworkResult get_single_result(std::size_t idx) const;
    /** @brief Indices of individuals no other individual dominates. */
    [[nodiscard]] std::vector<std::size_t> pareto_front() const;

    [[nodiscard]] FlatRecord to_flat() const override;
    [[nodiscard]] static PopulationResult from_flat(const FlatRecord& record, FitnessFunctionPtr objectives);

  private:
    std::vector<IndexVector> list_population_;
    std::vector<std::vector<double>> list_total_coverage_;
    std::size_t generations_;
    std::shared_ptr<const EvolutionaryAlgorithm> algorithm_;
};

}  // namespace sensor_placement
