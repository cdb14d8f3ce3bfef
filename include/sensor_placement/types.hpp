// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// placement engine (index space, planar coordinates, placements, progress
// reporting).

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sensor_placement {

/**
 * @brief Position of a site or sensor candidate in the ordered index space.
 */
using SiteIndex = std::size_t;

/**
 * @brief 0/1 vector with one entry per sensor candidate; 1 marks a sensor.
 */
using Placement = std::vector<std::uint8_t>;

/**
 * @brief Index-encoded network: one candidate index per sensor, duplicates allowed.
 */
using IndexVector = std::vector<std::int64_t>;

/**
 * @brief Planar coordinate in projected metres (e.g. British National Grid).
 */
struct PlanarCoordinate final {
    double x{}; /**< Easting in metres. */
    double y{}; /**< Northing in metres. */
};

/**
 * @brief Snapshot handed to progress observers at well-defined points of a run.
 */
struct Progress final {
    std::string optimiser{};  /**< Name of the optimiser reporting progress. */
    std::size_t completed{};  /**< Sensors placed or generations completed. */
    std::size_t total{};      /**< Target number of sensors or generations. */
    double fraction{};        /**< completed / total, in [0, 1]. */
};

/**
 * @brief Observer invoked synchronously after each placement or generation batch.
 *
 * Callbacks are advisory: they must not influence the result. Their invocation
 * points are the only places an external driver should decide to stop calling
 * `run`/`update` again.
 */
using ProgressCallback = std::function<void(const Progress&)>;

}  // namespace sensor_placement
