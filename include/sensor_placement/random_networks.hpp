// === Random Networks =========================================================
//
// Baseline of uniformly random index-encoded networks, scored with the same
// objectives as the optimisers so their results can be compared directly.

#pragma once

#include <cstdint>
#include <memory>
#include <random>

#include "sensor_placement/logging.hpp"
#include "sensor_placement/objectives.hpp"
#include "sensor_placement/result.hpp"

namespace sensor_placement {

class RandomNetworks final {
  public:
    RandomNetworks(std::size_t population_size, std::uint64_t seed);

    /** @brief Draw population_size random networks of @p n_sensors sensors. */
    [[nodiscard]] PopulationResult run(FitnessFunctionPtr objectives, std::size_t n_sensors);

    /** @brief Fresh sample for the same objectives and network size as @p result. */
    [[nodiscard]] PopulationResult update(const PopulationResult& result);

  private:
    std::size_t population_size_;
    std::mt19937_64 rng_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace sensor_placement
