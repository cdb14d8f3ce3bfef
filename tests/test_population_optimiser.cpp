#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "placement_fixtures.hpp"
#include "sensor_placement/errors.hpp"
#include "sensor_placement/nsga2.hpp"
#include "sensor_placement/population_optimiser.hpp"

using namespace sensor_placement;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    sensor_placement::test::ensure_logger_initialized();
    return true;
}();

std::shared_ptr<const Objectives> make_two_column_objectives() {
    const RegionData region = test::make_two_column_region();
    return Objectives::from_region(region, test::two_columns(), test::make_two_column_coverage(region));
}

PopulationOptimiser make_optimiser(std::size_t generations, std::size_t population_size, ProgressCallback progress = {}) {
    Nsga2Options nsga_options{};
    nsga_options.generations = generations;
    nsga_options.seed = 11;

    PopulationOptimiserOptions options{};
    options.population_size = population_size;
    options.seed = 5;
    options.progress = std::move(progress);
    return PopulationOptimiser(std::make_shared<Nsga2>(nsga_options), options);
}

void require_scores_match(const PopulationResult& result, const FitnessFunction& objectives) {
    for (std::size_t individual = 0; individual < result.population_size(); ++individual) {
        CHECK(result.total_coverage()[individual] == objectives.fitness(result.population()[individual]));
    }
}
}  // namespace

TEST_CASE("Population optimiser results have population and objective shapes") {
    const auto objectives = make_two_column_objectives();
    PopulationOptimiser optimiser = make_optimiser(3, 10);
    const PopulationResult result = optimiser.run(objectives, 4);

    REQUIRE(result.population_size() == 10);
    REQUIRE(result.population().size() == 10);
    REQUIRE(result.total_coverage().size() == 10);
    for (std::size_t individual = 0; individual < 10; ++individual) {
        CHECK(result.population()[individual].size() == 4);
        CHECK(result.total_coverage()[individual].size() == 2);
    }
    CHECK(result.generations() == 3);
    CHECK(result.optimiser() == "nsga2");
    CHECK(result.algorithm() != nullptr);
    require_scores_match(result, *objectives);
}

TEST_CASE("Single objective populations keep a column per objective") {
    const auto objectives = test::make_worker_objectives();
    PopulationOptimiser optimiser = make_optimiser(2, 8);
    const PopulationResult result = optimiser.run(objectives, 3);

    REQUIRE(result.n_obj() == 1);
    for (const auto& row : result.total_coverage()) {
        CHECK(row.size() == 1);
    }
    CHECK(result.best_result().total_coverage().front() == result.best_coverage().front());
    require_scores_match(result, *objectives);
}

TEST_CASE("Population update leaves its input untouched and is repeatable") {
    const auto objectives = make_two_column_objectives();
    PopulationOptimiser optimiser = make_optimiser(2, 10);
    const PopulationResult first = optimiser.run(objectives, 3);
    const auto population_before = first.population();
    const auto coverage_before = first.total_coverage();
    const std::size_t log_before = first.algorithm()->get_log().size();

    const PopulationResult second = optimiser.update(first);
    const PopulationResult retried = optimiser.update(first);

    CHECK(first.population() == population_before);
    CHECK(first.total_coverage() == coverage_before);
    CHECK(first.generations() == 2);
    CHECK(first.algorithm()->get_log().size() == log_before);

    CHECK(second.generations() == 4);
    CHECK(second.algorithm()->get_log().size() == 4);
    CHECK(second.population() == retried.population());
    require_scores_match(second, *objectives);
}

TEST_CASE("Restored population results continue from a fresh algorithm") {
    const auto objectives = make_two_column_objectives();
    PopulationOptimiser optimiser = make_optimiser(2, 10);
    const PopulationResult first = optimiser.run(objectives, 3);

    const PopulationResult restored = PopulationResult::from_flat(first.to_flat(), objectives);
    REQUIRE(restored.algorithm() == nullptr);

    const PopulationResult continued = optimiser.update(restored);
    CHECK(continued.generations() == 4);
    CHECK(continued.algorithm() != nullptr);
    CHECK(continued.population_size() == 10);
}

TEST_CASE("Evolving never loses the best network found") {
    const auto objectives = test::make_worker_objectives();
    PopulationOptimiser optimiser = make_optimiser(5, 20);
    const PopulationResult start = optimiser.run(objectives, 3);

    ConvergenceLog log;
    const PopulationResult finished = optimiser.evolve_for(start, 30, log);

    CHECK(finished.generations() == 30);
    CHECK(finished.best_coverage().front() >= start.best_coverage().front());
    CHECK(finished.best_coverage().front() <= 2550.0 / test::k_total_workers + 1e-12);

    const auto& entries = log.entries();
    REQUIRE(entries.size() == 6);
    CHECK(entries.front().generations == 5);
    CHECK(entries.back().generations == 30);
    for (std::size_t entry = 1; entry < entries.size(); ++entry) {
        CHECK(entries[entry].generations == entries[entry - 1].generations + 5);
        CHECK(entries[entry].best_coverage.front() >= entries[entry - 1].best_coverage.front());
    }
}

TEST_CASE("Convergence log measures hypervolume against the origin") {
    const auto objectives = make_two_column_objectives();
    PopulationOptimiser optimiser = make_optimiser(2, 10);
    const PopulationResult start = optimiser.run(objectives, 2);

    ConvergenceLog log;
    const PopulationResult finished = optimiser.evolve_for(start, 6, log);
    REQUIRE(log.entries().size() == 3);
    for (const auto& entry : log.entries()) {
        CHECK(entry.hypervolume > 0.0);
        CHECK(entry.hypervolume <= 1.0);
        CHECK(entry.best_coverage.size() == 2);
    }
    CHECK(log.entries().back().best_coverage == finished.best_coverage());

    const FlatRecord record = log.to_flat();
    CHECK(get_field<std::vector<std::int64_t>>(record, "generations") == std::vector<std::int64_t>{2, 4, 6});
    CHECK(get_field<std::vector<double>>(record, "hypervolume").size() == 3);
    CHECK(get_field<std::vector<double>>(record, "best_coverage").size() == 6);
    CHECK(get_field<std::int64_t>(record, "n_obj") == 2);
}

TEST_CASE("Population optimiser reports progress after every batch") {
    std::vector<Progress> list_progress;
    PopulationOptimiser optimiser = make_optimiser(2, 8, [&list_progress](const Progress& progress) {
        list_progress.push_back(progress);
    });

    const PopulationResult start = optimiser.run(make_two_column_objectives(), 2);
    ConvergenceLog log;
    const PopulationResult finished = optimiser.evolve_for(start, 6, log);

    REQUIRE(list_progress.size() == 3);
    CHECK(list_progress[0].optimiser == "nsga2");
    CHECK(list_progress[0].completed == 2);
    CHECK(list_progress[1].completed == 4);
    CHECK(list_progress[1].total == 6);
    CHECK(list_progress[2].fraction == 1.0);
    CHECK(finished.generations() == 6);
}

TEST_CASE("Population optimiser rejects invalid settings") {
    REQUIRE_THROWS_AS(PopulationOptimiser(nullptr), InvalidParameterError);
    REQUIRE_THROWS_AS(make_optimiser(1, 1), InvalidParameterError);

    PopulationOptimiser optimiser = make_optimiser(1, 4);
    const auto objectives = make_two_column_objectives();
    REQUIRE_THROWS_AS(optimiser.run(objectives, 0), InvalidSensorCountError);
    REQUIRE_THROWS_AS(optimiser.run(objectives, 10), InvalidSensorCountError);
}
