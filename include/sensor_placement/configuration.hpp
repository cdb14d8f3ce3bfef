// === Configuration ===========================================================
//
// Strongly-typed settings for placement runs. `ConfigurationLoader` translates
// environment variables into `Configuration` so the rest of the codebase never
// touches `std::getenv` directly.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "sensor_placement/coverage.hpp"

namespace sensor_placement {

/**
 * @brief Immutable bundle of runtime knobs for a placement study.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative.
 */
struct Configuration final {
    std::string log_directory{};             /**< Destination directory for structured logs. */
    std::string log_level{};                 /**< spdlog level name applied after startup. */
    DecayFunction decay{ExponentialDecay{}}; /**< Distance decay used to build the coverage matrix. */
    std::size_t n_sensors{};                 /**< Sensors per network. */
    std::size_t population_size{};           /**< Individuals in the evolutionary population. */
    std::size_t generations{};               /**< Total generations to evolve. */
    std::size_t log_every{};                 /**< Generations per evolve batch. */
    std::uint64_t seed{};                    /**< Seed shared by the stochastic optimisers. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static DecayFunction load_decay();
};

}  // namespace sensor_placement
