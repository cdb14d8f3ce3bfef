#include "sensor_placement/result.hpp"

#include <initializer_list>
#include <string_view>

#include <fmt/format.h>

#include "sensor_placement/errors.hpp"
#include "sensor_placement/evolutionary_algorithm.hpp"
#include "sensor_placement/pareto.hpp"
#include "sensor_placement/version.hpp"

namespace sensor_placement {

namespace {

constexpr char k_type_single[] = "single";
constexpr char k_type_greedy[] = "greedy";
constexpr char k_type_population[] = "population";

std::size_t to_size(std::int64_t value, const std::string& key) {
    if (value < 0) {
        throw RecordFormatError(fmt::format("Field '{}' must not be negative, got {}", key, value));
    }
    return static_cast<std::size_t>(value);
}

/** @brief Reject sensor indices that do not name one of @p n_candidates sites. */
void check_indices(const std::vector<std::int64_t>& indices, std::size_t n_candidates, const std::string& key) {
    for (const std::int64_t index : indices) {
        if (index < 0 || static_cast<std::size_t>(index) >= n_candidates) {
            throw RecordFormatError(fmt::format(
                "Field '{}' holds sensor index {} outside [0, {})",
                key,
                index,
                n_candidates
            ));
        }
    }
}

std::vector<std::int64_t> to_int64(const std::vector<SiteIndex>& indices) {
    return {indices.begin(), indices.end()};
}

/** @brief Reject records produced for a different objective set or candidate count. */
void check_compatible(const FlatRecord& record, const FitnessFunction& objectives) {
    const auto& labels = get_field<std::vector<std::string>>(record, "objectives");
    if (labels != objectives.labels()) {
        throw RecordFormatError("Record objectives do not match the supplied objectives");
    }
    const std::size_t n_candidates = to_size(get_field<std::int64_t>(record, "n_candidates"), "n_candidates");
    if (n_candidates != objectives.n_candidates()) {
        throw RecordFormatError(fmt::format(
            "Record was produced for {} candidates, objectives have {}",
            n_candidates,
            objectives.n_candidates()
        ));
    }
}

void check_result_type(const FlatRecord& record, std::initializer_list<std::string_view> accepted) {
    const auto& result_type = get_field<std::string>(record, "result_type");
    for (const std::string_view type : accepted) {
        if (result_type == type) {
            return;
        }
    }
    throw RecordFormatError(fmt::format("Unexpected result type '{}'", result_type));
}

std::vector<std::vector<double>> unflatten(const std::vector<double>& values, std::size_t rows, std::size_t columns) {
    if (values.size() != rows * columns) {
        throw RecordFormatError(fmt::format("Expected {} x {} values, got {}", rows, columns, values.size()));
    }
    std::vector<std::vector<double>> matrix(rows);
    for (std::size_t row = 0; row < rows; ++row) {
        matrix[row].assign(values.begin() + static_cast<std::ptrdiff_t>(row * columns),
                           values.begin() + static_cast<std::ptrdiff_t>((row + 1) * columns));
    }
    return matrix;
}

}  // namespace

// --- Result ------------------------------------------------------------------

Result::Result(FitnessFunctionPtr objectives, std::size_t n_sensors, std::string optimiser)
    : objectives_(std::move(objectives)),
      n_sensors_(n_sensors),
      str_optimiser_(std::move(optimiser)) {
    if (objectives_ == nullptr) {
        throw InvalidParameterError("Results require objectives");
    }
}

const FitnessFunction& Result::objectives() const noexcept {
    return *objectives_;
}

const FitnessFunctionPtr& Result::objectives_ptr() const noexcept {
    return objectives_;
}

std::size_t Result::n_sensors() const noexcept {
    return n_sensors_;
}

std::size_t Result::n_obj() const noexcept {
    return objectives_->n_obj();
}

const std::string& Result::optimiser() const noexcept {
    return str_optimiser_;
}

FlatRecord Result::to_flat() const {
    const CoverageMatrix& coverage = objectives_->coverage();
    FlatRecord record;
    record["library_version"] = std::string{k_version};
    record["optimiser"] = str_optimiser_;
    record["region_id"] = coverage.region_id();
    record["decay_kind"] = std::string{decay_kind_name(coverage.decay())};
    record["decay_param"] = decay_parameter(coverage.decay());
    record["n_sensors"] = static_cast<std::int64_t>(n_sensors_);
    record["n_candidates"] = static_cast<std::int64_t>(objectives_->n_candidates());
    record["n_obj"] = static_cast<std::int64_t>(objectives_->n_obj());
    record["objectives"] = objectives_->labels();
    return record;
}

// --- SingleNetworkResult -----------------------------------------------------

SingleNetworkResult::SingleNetworkResult(FitnessFunctionPtr objectives, std::size_t n_sensors, std::string optimiser)
    : Result(std::move(objectives), n_sensors, std::move(optimiser)),
      placement_(objectives_->n_candidates(), 0),
      list_total_coverage_(objectives_->n_obj(), 0.0) {}

SingleNetworkResult::SingleNetworkResult(
    FitnessFunctionPtr objectives,
    std::size_t n_sensors,
    Placement placement,
    std::vector<double> total_coverage,
    std::string optimiser
)
    : Result(std::move(objectives), n_sensors, std::move(optimiser)),
      placement_(std::move(placement)),
      list_total_coverage_(std::move(total_coverage)) {
    if (placement_.size() != objectives_->n_candidates()) {
        throw InvalidParameterError(fmt::format(
            "Placement has {} entries, expected {}",
            placement_.size(),
            objectives_->n_candidates()
        ));
    }
    if (list_total_coverage_.size() != objectives_->n_obj()) {
        throw InvalidParameterError(fmt::format(
            "Got {} coverage values for {} objectives",
            list_total_coverage_.size(),
            objectives_->n_obj()
        ));
    }
    if (n_placed() > n_sensors_) {
        throw InvalidParameterError(fmt::format(
            "Placement holds {} sensors, more than the {} requested",
            n_placed(),
            n_sensors_
        ));
    }
}

const Placement& SingleNetworkResult::placement() const noexcept {
    return placement_;
}

const std::vector<double>& SingleNetworkResult::total_coverage() const noexcept {
    return list_total_coverage_;
}

std::size_t SingleNetworkResult::n_placed() const noexcept {
    std::size_t count = 0;
    for (const std::uint8_t flag : placement_) {
        count += flag != 0 ? 1 : 0;
    }
    return count;
}

std::vector<SiteIndex> SingleNetworkResult::sensor_indices() const {
    std::vector<SiteIndex> indices;
    for (SiteIndex index = 0; index < placement_.size(); ++index) {
        if (placement_[index] != 0) {
            indices.push_back(index);
        }
    }
    return indices;
}

std::vector<std::string> SingleNetworkResult::sensor_identifiers() const {
    const auto& identifiers = objectives_->coverage().sensor_identifiers();
    std::vector<std::string> chosen;
    for (const SiteIndex index : sensor_indices()) {
        chosen.push_back(identifiers[index]);
    }
    return chosen;
}

std::vector<double> SingleNetworkResult::site_coverage() const {
    return objectives_->site_coverage(placement_);
}

FlatRecord SingleNetworkResult::to_flat() const {
    FlatRecord record = Result::to_flat();
    record["result_type"] = std::string{k_type_single};
    record["sensors"] = to_int64(sensor_indices());
    record["total_coverage"] = list_total_coverage_;
    return record;
}

SingleNetworkResult SingleNetworkResult::from_flat(const FlatRecord& record, FitnessFunctionPtr objectives) {
    if (objectives == nullptr) {
        throw InvalidParameterError("Results require objectives");
    }
    check_result_type(record, {k_type_single, k_type_greedy});
    check_compatible(record, *objectives);
    const std::size_t n_candidates = objectives->n_candidates();
    const auto& sensors = get_field<std::vector<std::int64_t>>(record, "sensors");
    check_indices(sensors, n_candidates, "sensors");
    Placement placement = placement_from_indices(sensors, n_candidates);
    return SingleNetworkResult(
        std::move(objectives),
        to_size(get_field<std::int64_t>(record, "n_sensors"), "n_sensors"),
        std::move(placement),
        get_field<std::vector<double>>(record, "total_coverage"),
        get_field<std::string>(record, "optimiser")
    );
}

// --- GreedyResult ------------------------------------------------------------

GreedyResult::GreedyResult(FitnessFunctionPtr objectives, std::size_t n_sensors)
    : SingleNetworkResult(std::move(objectives), n_sensors, "greedy") {}

GreedyResult::GreedyResult(
    FitnessFunctionPtr objectives,
    std::size_t n_sensors,
    Placement placement,
    double total_coverage,
    std::vector<SiteIndex> placement_history,
    std::vector<double> coverage_history
)
    : SingleNetworkResult(std::move(objectives), n_sensors, std::move(placement), {total_coverage}, "greedy"),
      list_placement_history_(std::move(placement_history)),
      list_coverage_history_(std::move(coverage_history)) {
    if (list_placement_history_.size() != list_coverage_history_.size()) {
        throw InvalidParameterError("Placement and coverage histories must have the same length");
    }
}

const std::vector<SiteIndex>& GreedyResult::placement_history() const noexcept {
    return list_placement_history_;
}

const std::vector<double>& GreedyResult::coverage_history() const noexcept {
    return list_coverage_history_;
}

FlatRecord GreedyResult::to_flat() const {
    FlatRecord record = SingleNetworkResult::to_flat();
    record["result_type"] = std::string{k_type_greedy};
    record["placement_history"] = to_int64(list_placement_history_);
    record["coverage_history"] = list_coverage_history_;
    return record;
}

GreedyResult GreedyResult::from_flat(const FlatRecord& record, FitnessFunctionPtr objectives) {
    if (objectives == nullptr) {
        throw InvalidParameterError("Results require objectives");
    }
    check_result_type(record, {k_type_greedy});
    check_compatible(record, *objectives);
    const auto& total_coverage = get_field<std::vector<double>>(record, "total_coverage");
    if (total_coverage.size() != 1) {
        throw RecordFormatError("Greedy records hold exactly one coverage value");
    }

    const std::size_t n_candidates = objectives->n_candidates();
    const auto& flat_history = get_field<std::vector<std::int64_t>>(record, "placement_history");
    check_indices(flat_history, n_candidates, "placement_history");
    std::vector<SiteIndex> placement_history(flat_history.begin(), flat_history.end());

    const auto& sensors = get_field<std::vector<std::int64_t>>(record, "sensors");
    check_indices(sensors, n_candidates, "sensors");
    Placement placement = placement_from_indices(sensors, n_candidates);
    return GreedyResult(
        std::move(objectives),
        to_size(get_field<std::int64_t>(record, "n_sensors"), "n_sensors"),
        std::move(placement),
        total_coverage.front(),
        std::move(placement_history),
        get_field<std::vector<double>>(record, "coverage_history")
    );
}

// --- PopulationResult --------------------------------------------------------

PopulationResult::PopulationResult(
    FitnessFunctionPtr objectives,
    std::size_t n_sensors,
    std::size_t population_size,
    std::string optimiser
)
    : Result(std::move(objectives), n_sensors, std::move(optimiser)),
      list_population_(population_size, IndexVector(n_sensors, 0)),
      list_total_coverage_(population_size, std::vector<double>(objectives_->n_obj(), 0.0)),
      generations_(0) {}

PopulationResult::PopulationResult(
    FitnessFunctionPtr objectives,
    std::size_t n_sensors,
    std::vector<IndexVector> population,
    std::vector<std::vector<double>> total_coverage,
    std::size_t generations,
    std::string optimiser,
    std::shared_ptr<const EvolutionaryAlgorithm> algorithm
)
    : Result(std::move(objectives), n_sensors, std::move(optimiser)),
      list_population_(std::move(population)),
      list_total_coverage_(std::move(total_coverage)),
      generations_(generations),
      algorithm_(std::move(algorithm)) {
    if (list_total_coverage_.size() != list_population_.size()) {
        throw InvalidParameterError(fmt::format(
            "Population has {} individuals but {} coverage rows",
            list_population_.size(),
            list_total_coverage_.size()
        ));
    }
    for (std::size_t individual = 0; individual < list_population_.size(); ++individual) {
        if (list_population_[individual].size() != n_sensors_) {
            throw InvalidParameterError(fmt::format(
                "Individual {} has {} sensors, expected {}",
                individual,
                list_population_[individual].size(),
                n_sensors_
            ));
        }
        if (list_total_coverage_[individual].size() != objectives_->n_obj()) {
            throw InvalidParameterError(fmt::format(
                "Individual {} has {} coverage values, expected {}",
                individual,
                list_total_coverage_[individual].size(),
                objectives_->n_obj()
            ));
        }
    }
}

std::size_t PopulationResult::population_size() const noexcept {
    return list_population_.size();
}

const std::vector<IndexVector>& PopulationResult::population() const noexcept {
    return list_population_;
}

const std::vector<std::vector<double>>& PopulationResult::total_coverage() const noexcept {
    return list_total_coverage_;
}

std::size_t PopulationResult::generations() const noexcept {
    return generations_;
}

const std::shared_ptr<const EvolutionaryAlgorithm>& PopulationResult::algorithm() const noexcept {
    return algorithm_;
}

std::size_t PopulationResult::best_index(std::size_t obj_idx) const {
    if (obj_idx >= objectives_->n_obj()) {
        throw std::out_of_range(fmt::format("Objective {} outside [0, {})", obj_idx, objectives_->n_obj()));
    }
    if (list_population_.empty()) {
        throw std::out_of_range("Population is empty");
    }
    std::size_t best = 0;
    for (std::size_t individual = 1; individual < list_total_coverage_.size(); ++individual) {
        if (list_total_coverage_[individual][obj_idx] > list_total_coverage_[best][obj_idx]) {
            best = individual;
        }
    }
    return best;
}

SingleNetworkResult PopulationResult::best_result(std::size_t obj_idx) const {
    return get_single_result(best_index(obj_idx));
}

std::vector<double> PopulationResult::best_coverage() const {
    std::vector<double> best;
    best.reserve(objectives_->n_obj());
    for (std::size_t objective = 0; objective < objectives_->n_obj(); ++objective) {
        best.push_back(list_total_coverage_[best_index(objective)][objective]);
    }
    return best;
}

SingleNetworkResult PopulationResult::get_single_result(std::size_t idx) const {
    if (idx >= list_population_.size()) {
        throw std::out_of_range(fmt::format("Individual {} outside population of {}", idx, list_population_.size()));
    }
    return SingleNetworkResult(
        objectives_,
        n_sensors_,
        placement_from_indices(list_population_[idx], objectives_->n_candidates()),
        list_total_coverage_[idx],
        str_optimiser_
    );
}

std::vector<std::size_t> PopulationResult::pareto_front() const {
    return non_dominated_front(to_minimisation(list_total_coverage_));
}

FlatRecord PopulationResult::to_flat() const {
    FlatRecord record = Result::to_flat();
    record["result_type"] = std::string{k_type_population};
    record["population_size"] = static_cast<std::int64_t>(list_population_.size());
    record["generations"] = static_cast<std::int64_t>(generations_);

    std::vector<std::int64_t> population;
    population.reserve(list_population_.size() * n_sensors_);
    for (const IndexVector& individual : list_population_) {
        population.insert(population.end(), individual.begin(), individual.end());
    }
    record["population"] = std::move(population);

    std::vector<double> total_coverage;
    total_coverage.reserve(list_total_coverage_.size() * objectives_->n_obj());
    for (const auto& row : list_total_coverage_) {
        total_coverage.insert(total_coverage.end(), row.begin(), row.end());
    }
    record["total_coverage"] = std::move(total_coverage);
    return record;
}

PopulationResult PopulationResult::from_flat(const FlatRecord& record, FitnessFunctionPtr objectives) {
    if (objectives == nullptr) {
        throw InvalidParameterError("Results require objectives");
    }
    check_result_type(record, {k_type_population});
    check_compatible(record, *objectives);

    const std::size_t population_size = to_size(get_field<std::int64_t>(record, "population_size"), "population_size");
    const std::size_t n_sensors = to_size(get_field<std::int64_t>(record, "n_sensors"), "n_sensors");
    const std::size_t n_obj = to_size(get_field<std::int64_t>(record, "n_obj"), "n_obj");

    const auto& flat_population = get_field<std::vector<std::int64_t>>(record, "population");
    if (flat_population.size() != population_size * n_sensors) {
        throw RecordFormatError(fmt::format(
            "Expected {} x {} sensor indices, got {}",
            population_size,
            n_sensors,
            flat_population.size()
        ));
    }
    check_indices(flat_population, objectives->n_candidates(), "population");
    std::vector<IndexVector> population(population_size);
    for (std::size_t individual = 0; individual < population_size; ++individual) {
        population[individual].assign(
            flat_population.begin() + static_cast<std::ptrdiff_t>(individual * n_sensors),
            flat_population.begin() + static_cast<std::ptrdiff_t>((individual + 1) * n_sensors)
        );
    }

    return PopulationResult(
        std::move(objectives),
        n_sensors,
        std::move(population),
        unflatten(get_field<std::vector<double>>(record, "total_coverage"), population_size, n_obj),
        to_size(get_field<std::int64_t>(record, "generations"), "generations"),
        get_field<std::string>(record, "optimiser")
    );
}

}  // namespace sensor_placement
