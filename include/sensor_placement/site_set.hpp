// === Site Set ================================================================
//
// Models the candidate locations of a region (e.g. census output areas) and the
// per-site value columns supplied by the data-provisioning collaborator. The
// order of sites defines the index space used by coverage matrices, objectives
// and results, so every column is validated against it on insertion.

#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sensor_placement/types.hpp"

namespace sensor_placement {

/** @brief A single candidate location. */
struct Site final {
    std::string identifier{};      /**< Unique identifier such as an oa11cd code. */
    PlanarCoordinate location{};   /**< Centroid of the area in projected metres. */
};

/** @brief Ordered, immutable collection of candidate sites for one region. */
class SiteSet final {
  public:
    SiteSet(std::string region_id, std::vector<Site> sites);

    /** @brief Region the sites belong to (e.g. a local authority code). */
    [[nodiscard]] const std::string& region_id() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const std::vector<Site>& sites() const noexcept;
    [[nodiscard]] const Site& at(SiteIndex index) const;

    [[nodiscard]] std::vector<double> x() const;
    [[nodiscard]] std::vector<double> y() const;
    [[nodiscard]] std::vector<std::string> identifiers() const;

    /** @brief Position of @p identifier in the site order. */
    [[nodiscard]] SiteIndex index_of(const std::string& identifier) const;
    /** @brief 0/1 placement with a sensor at each of the named sites. */
    [[nodiscard]] Placement placement_from_identifiers(const std::vector<std::string>& identifiers) const;

  private:
    std::string str_region_id_;
    std::vector<Site> list_sites_;
    std::unordered_map<std::string, SiteIndex> map_index_by_identifier_;
};

/**
 * @brief Site set plus named per-site value columns aligned to its order.
 *
 * Columns are keyed by (dataset, column), mirroring how the provisioning layer
 * groups census and workplace tables. Missing values are stored as NaN and are
 * filled when an objective requests the column.
 */
class RegionData final {
  public:
    explicit RegionData(SiteSet sites);

    [[nodiscard]] const SiteSet& sites() const noexcept;
    [[nodiscard]] std::size_t n_sites() const noexcept;

    void add_column(const std::string& dataset, const std::string& column, std::vector<double> values);
    [[nodiscard]] bool has_column(const std::string& dataset, const std::string& column) const;
    [[nodiscard]] const std::vector<double>& column_values(const std::string& dataset, const std::string& column) const;

  private:
    SiteSet sites_;
    std::map<std::pair<std::string, std::string>, std::vector<double>> map_columns_;
};

}  // namespace sensor_placement
