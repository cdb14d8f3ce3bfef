#include "sensor_placement/evolutionary_algorithm.hpp"

#include <fmt/format.h>

#include "sensor_placement/errors.hpp"

namespace sensor_placement {

CoverageProblem::CoverageProblem(FitnessFunctionPtr objectives, std::size_t n_sensors)
    : objectives_(std::move(objectives)),
      n_sensors_(n_sensors) {
    if (objectives_ == nullptr) {
        throw InvalidParameterError("CoverageProblem requires objectives");
    }
    if (n_sensors_ == 0 || n_sensors_ > objectives_->n_candidates()) {
        throw InvalidSensorCountError(fmt::format(
            "Cannot place {} sensors among {} candidates",
            n_sensors_,
            objectives_->n_candidates()
        ));
    }
}

const FitnessFunction& CoverageProblem::objectives() const noexcept {
    return *objectives_;
}

std::size_t CoverageProblem::n_sensors() const noexcept {
    return n_sensors_;
}

std::size_t CoverageProblem::n_obj() const noexcept {
    return objectives_->n_obj();
}

std::int64_t CoverageProblem::lower_bound() const noexcept {
    return 0;
}

std::int64_t CoverageProblem::upper_bound() const noexcept {
    return static_cast<std::int64_t>(objectives_->n_candidates()) - 1;
}

std::vector<double> CoverageProblem::fitness(const IndexVector& sensor_indices) const {
    if (sensor_indices.size() != n_sensors_) {
        throw InvalidParameterError(fmt::format(
            "Decision vector has {} entries, expected {}",
            sensor_indices.size(),
            n_sensors_
        ));
    }
    return to_minimisation(objectives_->fitness(sensor_indices));
}

std::vector<double> to_minimisation(const std::vector<double>& scores) {
    std::vector<double> minimised;
    minimised.reserve(scores.size());
    for (const double score : scores) {
        minimised.push_back(-score);
    }
    return minimised;
}

std::vector<double> to_maximisation(const std::vector<double>& minimised) {
    return to_minimisation(minimised);
}

FitnessMatrix to_minimisation(const FitnessMatrix& scores) {
    FitnessMatrix minimised;
    minimised.reserve(scores.size());
    for (const auto& row : scores) {
        minimised.push_back(to_minimisation(row));
    }
    return minimised;
}

FitnessMatrix to_maximisation(const FitnessMatrix& minimised) {
    return to_minimisation(minimised);
}

Population random_population(const CoverageProblem& problem, std::size_t size, std::mt19937_64& rng) {
    std::uniform_int_distribution<std::int64_t> distribution(problem.lower_bound(), problem.upper_bound());
    Population population{};
    population.decision_vectors.reserve(size);
    population.fitness.reserve(size);
    for (std::size_t individual = 0; individual < size; ++individual) {
        IndexVector decision(problem.n_sensors());
        for (auto& gene : decision) {
            gene = distribution(rng);
        }
        population.fitness.push_back(problem.fitness(decision));
        population.decision_vectors.push_back(std::move(decision));
    }
    return population;
}

}  // namespace sensor_placement
