#include "sensor_placement/population_optimiser.hpp"

#include <algorithm>
#include <random>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "sensor_placement/errors.hpp"
#include "sensor_placement/pareto.hpp"

namespace sensor_placement {

namespace {
constexpr std::size_t k_min_population_size{2};
}  // namespace

void ConvergenceLog::record(const PopulationResult& result) {
    ConvergenceEntry entry{};
    entry.generations = result.generations();
    entry.best_coverage = result.best_coverage();
    entry.hypervolume = hypervolume(result.total_coverage(), std::vector<double>(result.n_obj(), 0.0));
    list_entries_.push_back(std::move(entry));
}

const std::vector<ConvergenceEntry>& ConvergenceLog::entries() const noexcept {
    return list_entries_;
}

bool ConvergenceLog::empty() const noexcept {
    return list_entries_.empty();
}

FlatRecord ConvergenceLog::to_flat() const {
    std::vector<std::int64_t> generations;
    std::vector<double> hypervolumes;
    std::vector<double> best_coverage;
    generations.reserve(list_entries_.size());
    hypervolumes.reserve(list_entries_.size());
    for (const auto& entry : list_entries_) {
        generations.push_back(static_cast<std::int64_t>(entry.generations));
        hypervolumes.push_back(entry.hypervolume);
        best_coverage.insert(best_coverage.end(), entry.best_coverage.begin(), entry.best_coverage.end());
    }

    FlatRecord record;
    record["generations"] = std::move(generations);
    record["hypervolume"] = std::move(hypervolumes);
    record["best_coverage"] = std::move(best_coverage);
    record["n_obj"] = static_cast<std::int64_t>(list_entries_.empty() ? 0 : list_entries_.front().best_coverage.size());
    return record;
}

PopulationOptimiser::PopulationOptimiser(std::shared_ptr<const EvolutionaryAlgorithm> algorithm,
                                         PopulationOptimiserOptions options)
    : algorithm_(std::move(algorithm)),
      options_(std::move(options)),
      logger_(get_logger()) {
    if (algorithm_ == nullptr) {
        throw InvalidParameterError("PopulationOptimiser requires an evolutionary algorithm");
    }
    if (options_.population_size < k_min_population_size) {
        throw InvalidParameterError(fmt::format(
            "Population size must be at least {}, got {}",
            k_min_population_size,
            options_.population_size
        ));
    }
}

PopulationResult PopulationOptimiser::run(FitnessFunctionPtr objectives, std::size_t n_sensors) {
    if (objectives == nullptr) {
        throw InvalidParameterError("Population optimisation requires objectives");
    }
    const CoverageProblem problem(objectives, n_sensors);

    logger_->info("{} optimisation of {} sensors among {} candidates: population {} objectives {}",
                  algorithm_->name(),
                  n_sensors,
                  objectives->n_candidates(),
                  options_.population_size,
                  fmt::join(objectives->labels(), ", "));

    std::mt19937_64 rng(options_.seed);
    Population population = random_population(problem, options_.population_size, rng);
    return evolve_batch(objectives, n_sensors, std::move(population), algorithm_->clone(), 0, 0);
}

PopulationResult PopulationOptimiser::update(const PopulationResult& result) {
    return resume(result, 0);
}

PopulationResult PopulationOptimiser::resume(const PopulationResult& result, std::size_t target_generations) {
    std::unique_ptr<EvolutionaryAlgorithm> algorithm;
    if (result.algorithm() != nullptr) {
        algorithm = result.algorithm()->clone();
    } else {
        logger_->warn("Result carries no algorithm state; continuing with a fresh {} instance",
                      algorithm_->name());
        algorithm = algorithm_->clone();
    }

    Population population{};
    population.decision_vectors = result.population();
    population.fitness = to_minimisation(result.total_coverage());
    return evolve_batch(result.objectives_ptr(),
                        result.n_sensors(),
                        std::move(population),
                        std::move(algorithm),
                        result.generations(),
                        target_generations);
}

PopulationResult PopulationOptimiser::evolve_for(const PopulationResult& result,
                                                 std::size_t total_generations,
                                                 ConvergenceLog& log) {
    if (log.empty()) {
        log.record(result);
    }
    PopulationResult current = result;
    while (current.generations() < total_generations) {
        current = resume(current, total_generations);
        log.record(current);
        logger_->info("Generation {}/{}: best {:.4f} hypervolume {:.6f}",
                      current.generations(),
                      total_generations,
                      fmt::join(log.entries().back().best_coverage, "/"),
                      log.entries().back().hypervolume);
    }
    return current;
}

const EvolutionaryAlgorithm& PopulationOptimiser::algorithm() const noexcept {
    return *algorithm_;
}

PopulationResult PopulationOptimiser::evolve_batch(const FitnessFunctionPtr& objectives,
                                                   std::size_t n_sensors,
                                                   Population population,
                                                   std::unique_ptr<EvolutionaryAlgorithm> algorithm,
                                                   std::size_t generations_before,
                                                   std::size_t target_generations) {
    const CoverageProblem problem(objectives, n_sensors);
    Population evolved = algorithm->evolve(problem, std::move(population));

    const std::size_t generations = generations_before + algorithm->generations_per_evolve();
    logger_->debug("{} evolved {} generations ({} total)",
                   algorithm->name(),
                   algorithm->generations_per_evolve(),
                   generations);

    const std::string name = algorithm->name();
    PopulationResult result(objectives,
                            n_sensors,
                            std::move(evolved.decision_vectors),
                            to_maximisation(evolved.fitness),
                            generations,
                            name,
                            std::shared_ptr<const EvolutionaryAlgorithm>(std::move(algorithm)));

    if (options_.progress) {
        Progress progress{};
        progress.optimiser = name;
        progress.completed = generations;
        progress.total = std::max(generations, target_generations);
        progress.fraction = static_cast<double>(generations) / static_cast<double>(progress.total);
        options_.progress(progress);
    }
    return result;
}

}  // namespace sensor_placement
