// === Pareto Utilities ========================================================
//
// Dominance helpers shared by NSGA-II selection, population result queries and
// convergence logging. All functions except `hypervolume` work on minimisation
// values (the orientation the evolutionary search uses internally).

#pragma once

#include <cstddef>
#include <vector>

namespace sensor_placement {

/** @brief Row-per-individual matrix of objective values. */
using FitnessMatrix = std::vector<std::vector<double>>;

/** @brief Fronts from fast non-dominated sorting; ranks[i] is the front of individual i. */
struct NonDominatedSorting final {
    std::vector<std::size_t> ranks{};
    std::vector<std::vector<std::size_t>> fronts{};
};

/** @brief True when @p lhs is no worse everywhere and strictly better somewhere. */
[[nodiscard]] bool dominates(const std::vector<double>& lhs, const std::vector<double>& rhs);

[[nodiscard]] NonDominatedSorting fast_non_dominated_sort(const FitnessMatrix& fitness);

/** @brief Crowding distance of each member of @p front, aligned with @p front. */
[[nodiscard]] std::vector<double> crowding_distance(const FitnessMatrix& fitness, const std::vector<std::size_t>& front);

/** @brief Indices of the first front, ascending. */
[[nodiscard]] std::vector<std::size_t> non_dominated_front(const FitnessMatrix& fitness);

/**
 * @brief Volume dominated by maximisation @p points and bounded below by @p reference.
 *
 * Exact slicing algorithm; intended for the handful of objectives used in
 * placement studies.
 */
[[nodiscard]] double hypervolume(const FitnessMatrix& points, const std::vector<double>& reference);

}  // namespace sensor_placement
