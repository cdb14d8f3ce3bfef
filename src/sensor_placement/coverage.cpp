#include "sensor_placement/coverage.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "sensor_placement/errors.hpp"

namespace sensor_placement {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void require_same_length(const std::vector<double>& x, const std::vector<double>& y, std::string_view label) {
    if (x.size() != y.size()) {
        throw InvalidParameterError(fmt::format(
            "{} coordinates have mismatched lengths: {} x values, {} y values",
            label,
            x.size(),
            y.size()
        ));
    }
}

std::vector<std::string> index_identifiers(std::size_t count) {
    std::vector<std::string> identifiers;
    identifiers.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        identifiers.push_back(std::to_string(index));
    }
    return identifiers;
}

std::vector<double> decayed_values(const std::vector<std::vector<double>>& distances, const DecayFunction& decay) {
    std::vector<double> values;
    values.reserve(distances.empty() ? 0 : distances.size() * distances.front().size());
    for (const auto& row : distances) {
        for (const double distance : row) {
            values.push_back(apply_decay(decay, distance));
        }
    }
    return values;
}

}  // namespace

double apply_decay(const DecayFunction& decay, double distance) {
    return std::visit(
        Overloaded{
            [distance](const BinaryDecay& binary) { return distance < binary.radius ? 1.0 : 0.0; },
            [distance](const ExponentialDecay& exponential) { return std::exp(-distance / exponential.theta); },
        },
        decay
    );
}

double decay_parameter(const DecayFunction& decay) noexcept {
    return std::visit(
        Overloaded{
            [](const BinaryDecay& binary) { return binary.radius; },
            [](const ExponentialDecay& exponential) { return exponential.theta; },
        },
        decay
    );
}

std::string_view decay_kind_name(const DecayFunction& decay) noexcept {
    return std::holds_alternative<BinaryDecay>(decay) ? std::string_view{"binary"} : std::string_view{"exponential"};
}

DecayFunction make_decay(std::string_view kind, double parameter) {
    DecayFunction decay{};
    if (kind == "binary") {
        decay = BinaryDecay{parameter};
    } else if (kind == "exponential") {
        decay = ExponentialDecay{parameter};
    } else {
        throw InvalidParameterError(fmt::format("Unknown decay kind '{}'", kind));
    }
    validate_decay(decay);
    return decay;
}

void validate_decay(const DecayFunction& decay) {
    const double parameter = decay_parameter(decay);
    if (!std::isfinite(parameter) || parameter <= 0.0) {
        throw InvalidParameterError(fmt::format(
            "{} decay parameter must be positive, got {}",
            decay_kind_name(decay),
            parameter
        ));
    }
}

std::vector<std::vector<double>> distance_matrix(
    const std::vector<double>& sensor_x,
    const std::vector<double>& sensor_y,
    const std::vector<double>& site_x,
    const std::vector<double>& site_y
) {
    require_same_length(sensor_x, sensor_y, "Sensor");
    require_same_length(site_x, site_y, "Site");

    std::vector<std::vector<double>> distances(sensor_x.size(), std::vector<double>(site_x.size(), 0.0));
    for (std::size_t sensor = 0; sensor < sensor_x.size(); ++sensor) {
        for (std::size_t site = 0; site < site_x.size(); ++site) {
            const double delta_x = sensor_x[sensor] - site_x[site];
            const double delta_y = sensor_y[sensor] - site_y[site];
            distances[sensor][site] = std::sqrt(delta_x * delta_x + delta_y * delta_y);
        }
    }
    return distances;
}

std::vector<std::vector<double>> distance_matrix(const std::vector<double>& x, const std::vector<double>& y) {
    return distance_matrix(x, y, x, y);
}

CoverageMatrix::CoverageMatrix(
    std::string region_id,
    std::vector<std::string> sensor_identifiers,
    std::vector<std::string> site_identifiers,
    DecayFunction decay,
    std::vector<double> values
)
    : str_region_id_(std::move(region_id)),
      list_sensor_identifiers_(std::move(sensor_identifiers)),
      list_site_identifiers_(std::move(site_identifiers)),
      decay_(decay),
      list_values_(std::move(values)) {
    validate_decay(decay_);
    if (list_values_.size() != list_sensor_identifiers_.size() * list_site_identifiers_.size()) {
        throw InvalidParameterError(fmt::format(
            "Coverage matrix holds {} values, expected {} x {}",
            list_values_.size(),
            list_sensor_identifiers_.size(),
            list_site_identifiers_.size()
        ));
    }
    const bool out_of_range = std::any_of(list_values_.begin(), list_values_.end(), [](double value) {
        return !(value >= 0.0 && value <= 1.0);
    });
    if (out_of_range) {
        throw InvalidParameterError("Coverage values must lie in [0, 1]");
    }
}

std::shared_ptr<const CoverageMatrix> CoverageMatrix::build(const SiteSet& sites, const DecayFunction& decay) {
    return build(sites, sites, decay);
}

std::shared_ptr<const CoverageMatrix> CoverageMatrix::build(
    const SiteSet& sensors,
    const SiteSet& sites,
    const DecayFunction& decay
) {
    validate_decay(decay);
    const auto distances = distance_matrix(sensors.x(), sensors.y(), sites.x(), sites.y());
    return std::make_shared<const CoverageMatrix>(
        sites.region_id(),
        sensors.identifiers(),
        sites.identifiers(),
        decay,
        decayed_values(distances, decay)
    );
}

std::shared_ptr<const CoverageMatrix> CoverageMatrix::build(
    const std::vector<double>& x,
    const std::vector<double>& y,
    const DecayFunction& decay
) {
    return build(x, y, x, y, decay);
}

std::shared_ptr<const CoverageMatrix> CoverageMatrix::build(
    const std::vector<double>& sensor_x,
    const std::vector<double>& sensor_y,
    const std::vector<double>& site_x,
    const std::vector<double>& site_y,
    const DecayFunction& decay
) {
    validate_decay(decay);
    const auto distances = distance_matrix(sensor_x, sensor_y, site_x, site_y);
    return std::make_shared<const CoverageMatrix>(
        std::string{},
        index_identifiers(sensor_x.size()),
        index_identifiers(site_x.size()),
        decay,
        decayed_values(distances, decay)
    );
}

const std::string& CoverageMatrix::region_id() const noexcept {
    return str_region_id_;
}

std::size_t CoverageMatrix::n_sensors() const noexcept {
    return list_sensor_identifiers_.size();
}

std::size_t CoverageMatrix::n_sites() const noexcept {
    return list_site_identifiers_.size();
}

const DecayFunction& CoverageMatrix::decay() const noexcept {
    return decay_;
}

const std::vector<std::string>& CoverageMatrix::sensor_identifiers() const noexcept {
    return list_sensor_identifiers_;
}

const std::vector<std::string>& CoverageMatrix::site_identifiers() const noexcept {
    return list_site_identifiers_;
}

double CoverageMatrix::at(SiteIndex sensor, SiteIndex site) const {
    if (sensor >= n_sensors() || site >= n_sites()) {
        throw std::out_of_range(fmt::format("Coverage index ({}, {}) outside {} x {}", sensor, site, n_sensors(), n_sites()));
    }
    return list_values_[sensor * n_sites() + site];
}

std::vector<double> CoverageMatrix::coverage_for_placement(const Placement& placement) const {
    if (placement.size() != n_sensors()) {
        throw InvalidParameterError(fmt::format(
            "Placement has {} entries but the coverage matrix has {} sensor candidates",
            placement.size(),
            n_sensors()
        ));
    }
    const std::size_t site_count = n_sites();
    std::vector<double> site_coverage(site_count, 0.0);
    for (SiteIndex sensor = 0; sensor < placement.size(); ++sensor) {
        if (placement[sensor] == 0) {
            continue;
        }
        const double* row = list_values_.data() + sensor * site_count;
        for (SiteIndex site = 0; site < site_count; ++site) {
            site_coverage[site] = std::max(site_coverage[site], row[site]);
        }
    }
    return site_coverage;
}

std::vector<double> coverage_for_placement(const CoverageMatrix& matrix, const Placement& placement) {
    return matrix.coverage_for_placement(placement);
}

}  // namespace sensor_placement
