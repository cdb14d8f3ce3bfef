// === Coverage Model ==========================================================
//
// Converts planar distances between sensor candidates and sites into [0, 1]
// coverage values through a decay function, and aggregates them into the
// sensor→site coverage matrix shared by every fitness evaluation. Building the
// matrix is O(M·N); evaluating a placement against it is O(k·N), so callers
// build it once per (site set, decay) pair and share it read-only.

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "sensor_placement/site_set.hpp"
#include "sensor_placement/types.hpp"

namespace sensor_placement {

/** @brief Hard cutoff: a site is covered only when strictly closer than the radius. */
struct BinaryDecay final {
    double radius{};
};

/** @brief Smooth decay exp(-distance / theta). */
struct ExponentialDecay final {
    double theta{};
};

using DecayFunction = std::variant<BinaryDecay, ExponentialDecay>;

/** @brief Coverage in [0, 1] provided at @p distance. */
[[nodiscard]] double apply_decay(const DecayFunction& decay, double distance);
/** @brief Radius or theta of the decay function. */
[[nodiscard]] double decay_parameter(const DecayFunction& decay) noexcept;
/** @brief "binary" or "exponential". */
[[nodiscard]] std::string_view decay_kind_name(const DecayFunction& decay) noexcept;
/** @brief Build a decay from its name and parameter, validating both. */
[[nodiscard]] DecayFunction make_decay(std::string_view kind, double parameter);
/** @brief Throw InvalidParameterError unless the parameter is finite and > 0. */
void validate_decay(const DecayFunction& decay);

/**
 * @brief Euclidean distances between every sensor candidate (rows) and site (columns).
 */
[[nodiscard]] std::vector<std::vector<double>> distance_matrix(
    const std::vector<double>& sensor_x,
    const std::vector<double>& sensor_y,
    const std::vector<double>& site_x,
    const std::vector<double>& site_y
);

/** @brief Square distance matrix for a single set of points. */
[[nodiscard]] std::vector<std::vector<double>> distance_matrix(const std::vector<double>& x, const std::vector<double>& y);

/** @brief Immutable M×N matrix of decayed coverage from sensor candidate i to site j. */
class CoverageMatrix final {
  public:
    /**
     * @brief Wrap precomputed coverage values.
     *
     * @param region_id Region the sites belong to.
     * @param sensor_identifiers One identifier per row.
     * @param site_identifiers One identifier per column.
     * @param decay Decay the values were computed with.
     * @param values Row-major coverage values, all in [0, 1].
     */
    CoverageMatrix(
        std::string region_id,
        std::vector<std::string> sensor_identifiers,
        std::vector<std::string> site_identifiers,
        DecayFunction decay,
        std::vector<double> values
    );

    /** @brief Sensors may be placed at any of the sites. */
    [[nodiscard]] static std::shared_ptr<const CoverageMatrix> build(const SiteSet& sites, const DecayFunction& decay);
    /** @brief Sensors restricted to a distinct candidate set. */
    [[nodiscard]] static std::shared_ptr<const CoverageMatrix> build(
        const SiteSet& sensors,
        const SiteSet& sites,
        const DecayFunction& decay
    );
    /** @brief Build from raw coordinates; identifiers become the decimal index. */
    [[nodiscard]] static std::shared_ptr<const CoverageMatrix> build(
        const std::vector<double>& x,
        const std::vector<double>& y,
        const DecayFunction& decay
    );
    [[nodiscard]] static std::shared_ptr<const CoverageMatrix> build(
        const std::vector<double>& sensor_x,
        const std::vector<double>& sensor_y,
        const std::vector<double>& site_x,
        const std::vector<double>& site_y,
        const DecayFunction& decay
    );

    [[nodiscard]] const std::string& region_id() const noexcept;
    [[nodiscard]] std::size_t n_sensors() const noexcept;
    [[nodiscard]] std::size_t n_sites() const noexcept;
    [[nodiscard]] const DecayFunction& decay() const noexcept;
    [[nodiscard]] const std::vector<std::string>& sensor_identifiers() const noexcept;
    [[nodiscard]] const std::vector<std::string>& site_identifiers() const noexcept;

    /** @brief Coverage of site @p site provided by a sensor at candidate @p sensor. */
    [[nodiscard]] double at(SiteIndex sensor, SiteIndex site) const;

    /** @brief Per-site coverage from the best selected sensor; zero where none covers. */
    [[nodiscard]] std::vector<double> coverage_for_placement(const Placement& placement) const;

  private:
    std::string str_region_id_;
    std::vector<std::string> list_sensor_identifiers_;
    std::vector<std::string> list_site_identifiers_;
    DecayFunction decay_;
    std::vector<double> list_values_;
};

using CoverageMatrixPtr = std::shared_ptr<const CoverageMatrix>;

/** @brief Free-function form of CoverageMatrix::coverage_for_placement. */
[[nodiscard]] std::vector<double> coverage_for_placement(const CoverageMatrix& matrix, const Placement& placement);

}  // namespace sensor_placement
