#include "sensor_placement/objectives.hpp"

#include <cmath>
#include <numeric>

#include <fmt/format.h>

#include "sensor_placement/errors.hpp"

namespace sensor_placement {

namespace {

double checked_sum(const std::vector<double>& values, std::string_view what) {
    double total = 0.0;
    for (std::size_t index = 0; index < values.size(); ++index) {
        const double value = values[index];
        if (!std::isfinite(value) || value < 0.0) {
            throw InvalidParameterError(fmt::format("{} must be finite and non-negative; entry {} is {}", what, index, value));
        }
        total += value;
    }
    return total;
}

void normalize_in_place(std::vector<double>& values, double total) {
    if (total <= 0.0) {
        return;
    }
    for (double& value : values) {
        value /= total;
    }
}

std::vector<double> filled_column(const RegionData& region, const Column& column) {
    std::vector<double> values = region.column_values(column.dataset, column.column);
    for (double& value : values) {
        if (std::isnan(value)) {
            value = column.fill_na;
        }
    }
    return values;
}

std::vector<Objective> objectives_from_columns(const RegionData& region, const std::vector<Column>& columns, bool normalize) {
    std::vector<Objective> objectives;
    objectives.reserve(columns.size());
    for (const Column& column : columns) {
        objectives.emplace_back(filled_column(region, column), column.resolved_label(), normalize);
    }
    return objectives;
}

std::string join_labels(const std::vector<std::string>& labels) {
    std::string joined;
    for (const std::string& label : labels) {
        if (!joined.empty()) {
            joined += '+';
        }
        joined += label;
    }
    return joined;
}

}  // namespace

std::string Column::resolved_label() const {
    if (!label.empty()) {
        return label;
    }
    return dataset + "_" + column;
}

Objective::Objective(std::vector<double> weights, std::string label, bool normalize)
    : str_label_(std::move(label)),
      list_weights_(std::move(weights)) {
    const double total = checked_sum(list_weights_, fmt::format("Weights of objective '{}'", str_label_));
    if (normalize) {
        normalize_in_place(list_weights_, total);
    }
}

const std::string& Objective::label() const noexcept {
    return str_label_;
}

const std::vector<double>& Objective::weights() const noexcept {
    return list_weights_;
}

std::size_t Objective::size() const noexcept {
    return list_weights_.size();
}

double Objective::score(const std::vector<double>& site_coverage) const {
    if (site_coverage.size() != list_weights_.size()) {
        throw InvalidParameterError(fmt::format(
            "Objective '{}' has {} weights but coverage has {} sites",
            str_label_,
            list_weights_.size(),
            site_coverage.size()
        ));
    }
    double weighted_total = 0.0;
    double weight_total = 0.0;
    for (std::size_t site = 0; site < list_weights_.size(); ++site) {
        weighted_total += list_weights_[site] * site_coverage[site];
        weight_total += list_weights_[site];
    }
    if (weight_total <= 0.0) {
        throw DegenerateObjectiveError(fmt::format("Objective '{}' has weights summing to zero", str_label_));
    }
    return weighted_total / weight_total;
}

FitnessFunction::FitnessFunction(CoverageMatrixPtr coverage)
    : coverage_(std::move(coverage)) {
    if (coverage_ == nullptr) {
        throw InvalidParameterError("Objectives require a coverage matrix");
    }
}

std::vector<double> FitnessFunction::fitness(const Placement& placement) const {
    return evaluate(coverage_->coverage_for_placement(placement));
}

std::vector<double> FitnessFunction::fitness(const IndexVector& sensor_indices) const {
    return fitness(placement_from_indices(sensor_indices, n_candidates()));
}

std::vector<double> FitnessFunction::site_coverage(const Placement& placement) const {
    return coverage_->coverage_for_placement(placement);
}

const CoverageMatrix& FitnessFunction::coverage() const noexcept {
    return *coverage_;
}

const CoverageMatrixPtr& FitnessFunction::coverage_ptr() const noexcept {
    return coverage_;
}

std::size_t FitnessFunction::n_candidates() const noexcept {
    return coverage_->n_sensors();
}

std::size_t FitnessFunction::n_sites() const noexcept {
    return coverage_->n_sites();
}

void FitnessFunction::require_aligned(const Objective& objective) const {
    if (objective.size() != coverage_->n_sites()) {
        throw InvalidParameterError(fmt::format(
            "Objective '{}' has {} weights but the coverage matrix has {} sites",
            objective.label(),
            objective.size(),
            coverage_->n_sites()
        ));
    }
}

Objectives::Objectives(CoverageMatrixPtr coverage, std::vector<Objective> objectives)
    : FitnessFunction(std::move(coverage)),
      list_objectives_(std::move(objectives)) {
    if (list_objectives_.empty()) {
        throw InvalidParameterError("At least one objective is required");
    }
    for (const Objective& objective : list_objectives_) {
        require_aligned(objective);
    }
}

std::shared_ptr<const Objectives> Objectives::from_region(
    const RegionData& region,
    const std::vector<Column>& columns,
    CoverageMatrixPtr coverage,
    bool normalize
) {
    return std::make_shared<const Objectives>(std::move(coverage), objectives_from_columns(region, columns, normalize));
}

std::size_t Objectives::n_obj() const noexcept {
    return list_objectives_.size();
}

std::vector<std::string> Objectives::labels() const {
    std::vector<std::string> labels;
    labels.reserve(list_objectives_.size());
    for (const Objective& objective : list_objectives_) {
        labels.push_back(objective.label());
    }
    return labels;
}

std::vector<double> Objectives::evaluate(const std::vector<double>& site_coverage) const {
    std::vector<double> scores;
    scores.reserve(list_objectives_.size());
    for (const Objective& objective : list_objectives_) {
        scores.push_back(objective.score(site_coverage));
    }
    return scores;
}

const std::vector<Objective>& Objectives::objectives() const noexcept {
    return list_objectives_;
}

namespace {

Objective combine_objectives(
    const std::vector<Objective>& objectives,
    std::vector<double>& importance,
    bool normalize,
    std::size_t n_sites
) {
    if (objectives.empty()) {
        throw InvalidParameterError("At least one objective is required");
    }
    if (importance.size() != objectives.size()) {
        throw InvalidParameterError(fmt::format(
            "{} importance values given for {} objectives",
            importance.size(),
            objectives.size()
        ));
    }
    const double importance_total = checked_sum(importance, "Objective importance");
    if (normalize) {
        normalize_in_place(importance, importance_total);
    }

    std::vector<double> combined(n_sites, 0.0);
    std::vector<std::string> labels;
    for (std::size_t index = 0; index < objectives.size(); ++index) {
        const Objective& objective = objectives[index];
        if (objective.size() != n_sites) {
            throw InvalidParameterError(fmt::format(
                "Objective '{}' has {} weights but the coverage matrix has {} sites",
                objective.label(),
                objective.size(),
                n_sites
            ));
        }
        for (std::size_t site = 0; site < n_sites; ++site) {
            combined[site] += importance[index] * objective.weights()[site];
        }
        labels.push_back(objective.label());
    }
    return Objective(std::move(combined), join_labels(labels), false);
}

}  // namespace

CombinedObjective::CombinedObjective(
    CoverageMatrixPtr coverage,
    std::vector<Objective> objectives,
    std::vector<double> importance,
    bool normalize
)
    : FitnessFunction(std::move(coverage)),
      list_importance_(std::move(importance)),
      objective_combined_(combine_objectives(objectives, list_importance_, normalize, coverage_->n_sites())) {
    list_component_labels_.reserve(objectives.size());
    for (const Objective& objective : objectives) {
        list_component_labels_.push_back(objective.label());
    }
}

std::shared_ptr<const CombinedObjective> CombinedObjective::from_region(
    const RegionData& region,
    const std::vector<Column>& columns,
    CoverageMatrixPtr coverage,
    bool normalize
) {
    std::vector<double> importance;
    importance.reserve(columns.size());
    for (const Column& column : columns) {
        importance.push_back(column.weight);
    }
    return std::make_shared<const CombinedObjective>(
        std::move(coverage),
        objectives_from_columns(region, columns, normalize),
        std::move(importance),
        normalize
    );
}

std::size_t CombinedObjective::n_obj() const noexcept {
    return 1;
}

std::vector<std::string> CombinedObjective::labels() const {
    return {objective_combined_.label()};
}

std::vector<double> CombinedObjective::evaluate(const std::vector<double>& site_coverage) const {
    return {objective_combined_.score(site_coverage)};
}

const std::vector<double>& CombinedObjective::importance() const noexcept {
    return list_importance_;
}

const std::vector<std::string>& CombinedObjective::component_labels() const noexcept {
    return list_component_labels_;
}

const Objective& CombinedObjective::combined() const noexcept {
    return objective_combined_;
}

Placement placement_from_indices(const IndexVector& sensor_indices, std::size_t n_candidates) {
    Placement placement(n_candidates, 0);
    for (const std::int64_t index : sensor_indices) {
        if (index < 0 || static_cast<std::size_t>(index) >= n_candidates) {
            throw InvalidParameterError(fmt::format("Sensor index {} outside [0, {})", index, n_candidates));
        }
        placement[static_cast<std::size_t>(index)] = 1;
    }
    return placement;
}

}  // namespace sensor_placement
