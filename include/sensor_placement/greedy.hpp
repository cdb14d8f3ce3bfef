// === Greedy Optimiser ========================================================
//
// Single-objective, deterministic, incremental site selection. Each step adds
// the sensor that raises fitness the most and never removes one, so a network
// can be grown one sensor at a time from any earlier result.

#pragma once

#include <memory>

#include "sensor_placement/logging.hpp"
#include "sensor_placement/objectives.hpp"
#include "sensor_placement/result.hpp"
#include "sensor_placement/types.hpp"

namespace sensor_placement {

/** @brief Optional hooks for the greedy optimiser. */
struct GreedyOptions final {
    ProgressCallback progress{}; /**< Invoked after every sensor placement. */
};

/** @brief Best-first placement of one sensor at a time. */
class Greedy final {
  public:
    explicit Greedy(GreedyOptions options = {});

    /**
     * @brief Place @p n_sensors sensors starting from an empty network.
     *
     * @throws InvalidSensorCountError if n_sensors is 0 or exceeds the candidates.
     * @throws InvalidParameterError if @p objectives is not single-objective.
     */
    [[nodiscard]] GreedyResult run(FitnessFunctionPtr objectives, std::size_t n_sensors);

    /**
     * @brief Return a copy of @p result extended by exactly one sensor.
     *
     * Ties between candidates are resolved in favour of the lowest index.
     */
    [[nodiscard]] GreedyResult update(const GreedyResult& result);

  private:
    void report_progress(std::size_t placed, std::size_t target) const;

    GreedyOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace sensor_placement
