// === Population Optimiser ====================================================
//
// Drives an `EvolutionaryAlgorithm` over an index-encoded coverage problem.
// Every `run`/`update` evolves a private clone of the algorithm, so the result
// passed to `update` remains a valid checkpoint after the call returns or
// throws.

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "sensor_placement/evolutionary_algorithm.hpp"
#include "sensor_placement/flat_record.hpp"
#include "sensor_placement/logging.hpp"
#include "sensor_placement/objectives.hpp"
#include "sensor_placement/result.hpp"
#include "sensor_placement/types.hpp"

namespace sensor_placement {

struct PopulationOptimiserOptions final {
    std::size_t population_size{200}; /**< Individuals in the initial random population. */
    std::uint64_t seed{0};            /**< Seed for the initial population. */
    ProgressCallback progress{};      /**< Invoked after every evolve batch. */
};

/** @brief One convergence sample taken after an evolve batch. */
struct ConvergenceEntry final {
    std::size_t generations{};
    std::vector<double> best_coverage{};
    double hypervolume{};
};

/**
 * @brief Per-batch record of best fitness and hypervolume.
 *
 * Hypervolume is measured against the origin in maximisation orientation, so
 * it grows as the population's front improves.
 */
class ConvergenceLog final {
  public:
    void record(const PopulationResult& result);

    [[nodiscard]] const std::vector<ConvergenceEntry>& entries() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] FlatRecord to_flat() const;

  private:
    std::vector<ConvergenceEntry> list_entries_;
};

class PopulationOptimiser final {
  public:
    PopulationOptimiser(std::shared_ptr<const EvolutionaryAlgorithm> algorithm, PopulationOptimiserOptions options = {});

    /**
     * @brief Evolve a fresh random population for one batch.
     *
     * @throws InvalidSensorCountError if n_sensors is 0 or exceeds the candidates.
     * @throws InvalidParameterError if the population size is below 2.
     */
    [[nodiscard]] PopulationResult run(FitnessFunctionPtr objectives, std::size_t n_sensors);

    /** @brief Evolve a copy of @p result's population and algorithm state for one more batch. */
    [[nodiscard]] PopulationResult update(const PopulationResult& result);

    /**
     * @brief Repeat `update` until @p total_generations have been evolved.
     *
     * Records @p log after every batch, including the batches already behind
     * @p result if the log is empty.
     */
    [[nodiscard]] PopulationResult evolve_for(const PopulationResult& result,
                                              std::size_t total_generations,
                                              ConvergenceLog& log);

    [[nodiscard]] const EvolutionaryAlgorithm& algorithm() const noexcept;

  private:
    /** @brief `update` reporting progress towards @p target_generations (0: this batch only). */
    [[nodiscard]] PopulationResult resume(const PopulationResult& result, std::size_t target_generations);
    [[nodiscard]] PopulationResult evolve_batch(const FitnessFunctionPtr& objectives,
                                                std::size_t n_sensors,
                                                Population population,
                                                std::unique_ptr<EvolutionaryAlgorithm> algorithm,
                                                std::size_t generations_before,
                                                std::size_t target_generations);

    std::shared_ptr<const EvolutionaryAlgorithm> algorithm_;
    PopulationOptimiserOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace sensor_placement
