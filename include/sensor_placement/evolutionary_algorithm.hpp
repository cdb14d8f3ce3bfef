// === Evolutionary Algorithm ==================================================
//
// Narrow seam between the population optimiser and the search algorithm.
// `CoverageProblem` adapts a fitness function to the minimisation convention
// the search uses; `to_maximisation` converts back at the result boundary.
// These two are the only places the fitness sign flips.

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "sensor_placement/objectives.hpp"
#include "sensor_placement/pareto.hpp"
#include "sensor_placement/types.hpp"

namespace sensor_placement {

/**
 * @brief Index-encoded placement search space: n_sensors integers in [0, M-1].
 */
class CoverageProblem final {
  public:
    CoverageProblem(FitnessFunctionPtr objectives, std::size_t n_sensors);

    [[nodiscard]] const FitnessFunction& objectives() const noexcept;
    [[nodiscard]] std::size_t n_sensors() const noexcept;
    [[nodiscard]] std::size_t n_obj() const noexcept;
    [[nodiscard]] std::int64_t lower_bound() const noexcept;
    [[nodiscard]] std::int64_t upper_bound() const noexcept;

    /** @brief Negated objective scores of @p sensor_indices (lower is better). */
    [[nodiscard]] std::vector<double> fitness(const IndexVector& sensor_indices) const;

  private:
    FitnessFunctionPtr objectives_;
    std::size_t n_sensors_;
};

[[nodiscard]] std::vector<double> to_minimisation(const std::vector<double>& scores);
[[nodiscard]] std::vector<double> to_maximisation(const std::vector<double>& minimised);
[[nodiscard]] FitnessMatrix to_minimisation(const FitnessMatrix& scores);
[[nodiscard]] FitnessMatrix to_maximisation(const FitnessMatrix& minimised);

/** @brief Decision vectors with their minimisation fitness, row-aligned. */
struct Population final {
    std::vector<IndexVector> decision_vectors{};
    FitnessMatrix fitness{};

    [[nodiscard]] std::size_t size() const noexcept {
        return decision_vectors.size();
    }
};

/** @brief Draw @p size individuals uniformly from [lower, upper]^n_sensors and evaluate them. */
[[nodiscard]] Population random_population(const CoverageProblem& problem, std::size_t size, std::mt19937_64& rng);

/** @brief One line of an algorithm's per-generation log. */
struct EvolutionLogEntry final {
    std::size_t generation{};           /**< Generations evolved by this algorithm instance. */
    std::size_t fevals{};               /**< Fitness evaluations so far. */
    std::vector<double> ideal_point{};  /**< Best (minimised) value per objective in the population. */
    std::size_t first_front_size{};     /**< Individuals on the first non-dominated front. */
};

using EvolutionLog = std::vector<EvolutionLogEntry>;

/**
 * @brief Stateful population-based search algorithm.
 *
 * Implementations carry internal state (random engine, counters, log) across
 * `evolve` calls. The optimiser clones the algorithm before evolving so a
 * previous result can be resumed or retried from its own snapshot.
 */
class EvolutionaryAlgorithm {
  public:
    virtual ~EvolutionaryAlgorithm() = default;

    /** @brief Advance @p population by generations_per_evolve() generations. */
    [[nodiscard]] virtual Population evolve(const CoverageProblem& problem, Population population) = 0;
    [[nodiscard]] virtual const EvolutionLog& get_log() const noexcept = 0;
    [[nodiscard]] virtual std::unique_ptr<EvolutionaryAlgorithm> clone() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::size_t generations_per_evolve() const noexcept = 0;
};

}  // namespace sensor_placement
