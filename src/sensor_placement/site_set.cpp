#include "sensor_placement/site_set.hpp"

#include <fmt/format.h>

#include "sensor_placement/errors.hpp"

namespace sensor_placement {

SiteSet::SiteSet(std::string region_id, std::vector<Site> sites)
    : str_region_id_(std::move(region_id)),
      list_sites_(std::move(sites)) {
    map_index_by_identifier_.reserve(list_sites_.size());
    for (SiteIndex index = 0; index < list_sites_.size(); ++index) {
        const auto [iterator_site, inserted] = map_index_by_identifier_.emplace(list_sites_[index].identifier, index);
        if (!inserted) {
            throw InvalidParameterError(fmt::format(
                "Duplicate site identifier {} at indices {} and {}",
                list_sites_[index].identifier,
                iterator_site->second,
                index
            ));
        }
    }
}

const std::string& SiteSet::region_id() const noexcept {
    return str_region_id_;
}

std::size_t SiteSet::size() const noexcept {
    return list_sites_.size();
}

bool SiteSet::empty() const noexcept {
    return list_sites_.empty();
}

const std::vector<Site>& SiteSet::sites() const noexcept {
    return list_sites_;
}

const Site& SiteSet::at(SiteIndex index) const {
    return list_sites_.at(index);
}

std::vector<double> SiteSet::x() const {
    std::vector<double> values;
    values.reserve(list_sites_.size());
    for (const Site& site : list_sites_) {
        values.push_back(site.location.x);
    }
    return values;
}

std::vector<double> SiteSet::y() const {
    std::vector<double> values;
    values.reserve(list_sites_.size());
    for (const Site& site : list_sites_) {
        values.push_back(site.location.y);
    }
    return values;
}

std::vector<std::string> SiteSet::identifiers() const {
    std::vector<std::string> values;
    values.reserve(list_sites_.size());
    for (const Site& site : list_sites_) {
        values.push_back(site.identifier);
    }
    return values;
}

SiteIndex SiteSet::index_of(const std::string& identifier) const {
    const auto iterator_site = map_index_by_identifier_.find(identifier);
    if (iterator_site == map_index_by_identifier_.end()) {
        throw InvalidParameterError(fmt::format("Unknown site {} in region {}", identifier, str_region_id_));
    }
    return iterator_site->second;
}

Placement SiteSet::placement_from_identifiers(const std::vector<std::string>& identifiers) const {
    Placement placement(list_sites_.size(), 0);
    for (const std::string& identifier : identifiers) {
        placement[index_of(identifier)] = 1;
    }
    return placement;
}

RegionData::RegionData(SiteSet sites)
    : sites_(std::move(sites)) {}

const SiteSet& RegionData::sites() const noexcept {
    return sites_;
}

std::size_t RegionData::n_sites() const noexcept {
    return sites_.size();
}

void RegionData::add_column(const std::string& dataset, const std::string& column, std::vector<double> values) {
    if (values.size() != sites_.size()) {
        throw InvalidParameterError(fmt::format(
            "Column {}.{} has {} values but region {} has {} sites",
            dataset,
            column,
            values.size(),
            sites_.region_id(),
            sites_.size()
        ));
    }
    map_columns_[{dataset, column}] = std::move(values);
}

bool RegionData::has_column(const std::string& dataset, const std::string& column) const {
    return map_columns_.find({dataset, column}) != map_columns_.end();
}

const std::vector<double>& RegionData::column_values(const std::string& dataset, const std::string& column) const {
    const auto iterator_column = map_columns_.find({dataset, column});
    if (iterator_column == map_columns_.end()) {
        throw InvalidParameterError(fmt::format("Region {} has no column {}.{}", sites_.region_id(), dataset, column));
    }
    return iterator_column->second;
}

}  // namespace sensor_placement
