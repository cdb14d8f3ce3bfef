#include <algorithm>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "placement_fixtures.hpp"
#include "sensor_placement/errors.hpp"
#include "sensor_placement/evolutionary_algorithm.hpp"
#include "sensor_placement/greedy.hpp"
#include "sensor_placement/pareto.hpp"
#include "sensor_placement/result.hpp"
#include "sensor_placement/version.hpp"

using namespace sensor_placement;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    sensor_placement::test::ensure_logger_initialized();
    return true;
}();

struct TwoColumnStudy final {
    RegionData region = test::make_two_column_region();
    std::shared_ptr<const Objectives> objectives =
        Objectives::from_region(region, test::two_columns(), test::make_two_column_coverage(region));
};

PopulationResult make_population(const std::shared_ptr<const Objectives>& objectives) {
    const std::vector<IndexVector> population{{0, 1}, {7, 8}, {4, 4}, {0, 8}, {3, 5}};
    std::vector<std::vector<double>> scores;
    for (const IndexVector& individual : population) {
        scores.push_back(objectives->fitness(individual));
    }
    return PopulationResult(objectives, 2, population, scores, 7, "nsga2");
}
}  // namespace

TEST_CASE("Empty single network result has zero coverage") {
    const auto objectives = test::make_worker_objectives();
    const SingleNetworkResult result(objectives, 3);
    CHECK(result.n_placed() == 0);
    CHECK(result.total_coverage() == std::vector<double>{0.0});
    CHECK(result.sensor_indices().empty());
    CHECK(result.site_coverage() == std::vector<double>(12, 0.0));
}

TEST_CASE("Single network results validate their shape") {
    const auto objectives = test::make_worker_objectives();
    REQUIRE_THROWS_AS(SingleNetworkResult(objectives, 1, Placement(11, 0), {0.0}), InvalidParameterError);
    REQUIRE_THROWS_AS(SingleNetworkResult(objectives, 1, Placement(12, 0), {0.0, 0.0}), InvalidParameterError);
    REQUIRE_THROWS_AS(SingleNetworkResult(nullptr, 1), InvalidParameterError);
    REQUIRE_THROWS_AS(SingleNetworkResult(objectives, 1, Placement(12, 1), {1.0}), InvalidParameterError);

    Placement two_sites(12, 0);
    two_sites[4] = 1;
    two_sites[10] = 1;
    REQUIRE_THROWS_AS(SingleNetworkResult(objectives, 1, two_sites, {0.7}), InvalidParameterError);
    CHECK(SingleNetworkResult(objectives, 2, two_sites, {0.7}).n_placed() == 2);
    CHECK(SingleNetworkResult(objectives, 5, two_sites, {0.7}).n_placed() == 2);
}

TEST_CASE("Greedy result flat record carries metadata and histories") {
    const auto objectives = test::make_worker_objectives();
    Greedy greedy{};
    const GreedyResult result = greedy.run(objectives, 3);
    const FlatRecord record = result.to_flat();

    CHECK(get_field<std::string>(record, "library_version") == std::string{k_version});
    CHECK(get_field<std::string>(record, "result_type") == "greedy");
    CHECK(get_field<std::string>(record, "optimiser") == "greedy");
    CHECK(get_field<std::string>(record, "region_id") == "E08000021");
    CHECK(get_field<std::string>(record, "decay_kind") == "binary");
    CHECK(get_field<double>(record, "decay_param") == 1.0);
    CHECK(get_field<std::int64_t>(record, "n_sensors") == 3);
    CHECK(get_field<std::int64_t>(record, "n_candidates") == 12);
    CHECK(get_field<std::vector<std::string>>(record, "objectives") == std::vector<std::string>{"workplace_workers"});
    CHECK(get_field<std::vector<std::int64_t>>(record, "placement_history") == std::vector<std::int64_t>{4, 10, 2});
    CHECK(get_field<std::vector<std::int64_t>>(record, "sensors") == std::vector<std::int64_t>{2, 4, 10});

    const GreedyResult restored = GreedyResult::from_flat(flat_record_from_json(to_json(record)), objectives);
    CHECK(restored.placement() == result.placement());
    CHECK(restored.placement_history() == result.placement_history());
    CHECK(restored.coverage_history() == result.coverage_history());
    CHECK(restored.total_coverage() == result.total_coverage());
    CHECK(restored.n_sensors() == 3);
}

TEST_CASE("Restored greedy result can be extended") {
    const auto objectives = test::make_worker_objectives();
    Greedy greedy{};
    const GreedyResult two = greedy.run(objectives, 2);
    const GreedyResult restored = GreedyResult::from_flat(two.to_flat(), objectives);
    CHECK(greedy.update(restored).placement_history() == std::vector<SiteIndex>{4, 10, 2});
}

TEST_CASE("Flat records are checked against the supplied objectives") {
    const auto workers = test::make_worker_objectives();
    const TwoColumnStudy study{};
    Greedy greedy{};
    const FlatRecord record = greedy.run(workers, 2).to_flat();

    REQUIRE_THROWS_AS(GreedyResult::from_flat(record, study.objectives), RecordFormatError);
    REQUIRE_THROWS_AS(PopulationResult::from_flat(record, workers), RecordFormatError);

    FlatRecord truncated = record;
    truncated.erase("coverage_history");
    REQUIRE_THROWS_AS(GreedyResult::from_flat(truncated, workers), RecordFormatError);

    const SingleNetworkResult single = SingleNetworkResult::from_flat(record, workers);
    CHECK(single.sensor_indices() == std::vector<SiteIndex>{4, 10});
}

TEST_CASE("Population result shapes follow population size, sensors and objectives") {
    const TwoColumnStudy study{};
    const PopulationResult zeros(study.objectives, 3, 6);
    CHECK(zeros.population_size() == 6);
    CHECK(zeros.generations() == 0);
    CHECK(zeros.algorithm() == nullptr);
    for (std::size_t individual = 0; individual < 6; ++individual) {
        CHECK(zeros.population()[individual].size() == 3);
        CHECK(zeros.total_coverage()[individual].size() == 2);
    }

    REQUIRE_THROWS_AS(
        PopulationResult(study.objectives, 2, {{0, 1}}, {{0.0, 0.0}, {0.0, 0.0}}, 0, "x"),
        InvalidParameterError
    );
    REQUIRE_THROWS_AS(PopulationResult(study.objectives, 2, {{0, 1, 2}}, {{0.0, 0.0}}, 0, "x"), InvalidParameterError);
    REQUIRE_THROWS_AS(PopulationResult(study.objectives, 2, {{0, 1}}, {{0.0}}, 0, "x"), InvalidParameterError);
}

TEST_CASE("best_result matches the brute-force argmax per objective") {
    const TwoColumnStudy study{};
    const PopulationResult result = make_population(study.objectives);

    for (std::size_t objective = 0; objective < 2; ++objective) {
        std::size_t expected = 0;
        for (std::size_t individual = 1; individual < result.population_size(); ++individual) {
            if (result.total_coverage()[individual][objective] > result.total_coverage()[expected][objective]) {
                expected = individual;
            }
        }
        const SingleNetworkResult best = result.best_result(objective);
        CHECK(result.best_index(objective) == expected);
        CHECK(best.total_coverage() == result.total_coverage()[expected]);
        CHECK(best.placement() == placement_from_indices(result.population()[expected], 9));
        CHECK(result.best_coverage()[objective] == result.total_coverage()[expected][objective]);
    }

    // Residents live in the top-left corner and workers in the bottom-right.
    CHECK(result.best_index(0) == 0);
    CHECK(result.best_index(1) == 1);
}

TEST_CASE("best_result breaks ties by first occurrence") {
    const TwoColumnStudy study{};
    const std::vector<IndexVector> population{{4, 4}, {8, 0}, {0, 8}};
    std::vector<std::vector<double>> scores;
    for (const IndexVector& individual : population) {
        scores.push_back(study.objectives->fitness(individual));
    }
    const PopulationResult result(study.objectives, 2, population, scores, 0, "random");
    CHECK(result.best_index(0) == 1);
    CHECK(result.best_index(1) == 1);
}

TEST_CASE("Out-of-range population queries throw") {
    const TwoColumnStudy study{};
    const PopulationResult result = make_population(study.objectives);
    REQUIRE_THROWS_AS(result.best_result(2), std::out_of_range);
    REQUIRE_THROWS_AS(result.get_single_result(5), std::out_of_range);
    CHECK(result.get_single_result(2).n_placed() == 1);
}

TEST_CASE("Pareto front excludes dominated networks") {
    const TwoColumnStudy study{};
    const PopulationResult result = make_population(study.objectives);
    const auto front = result.pareto_front();

    for (const std::size_t member : front) {
        for (std::size_t other = 0; other < result.population_size(); ++other) {
            CHECK_FALSE(dominates(to_minimisation(result.total_coverage()[other]),
                                  to_minimisation(result.total_coverage()[member])));
        }
    }
    CHECK(std::find(front.begin(), front.end(), std::size_t{0}) != front.end());
    CHECK(std::find(front.begin(), front.end(), std::size_t{1}) != front.end());
}

TEST_CASE("Population result flat record round trips") {
    const TwoColumnStudy study{};
    const PopulationResult result = make_population(study.objectives);
    const FlatRecord record = result.to_flat();

    CHECK(get_field<std::int64_t>(record, "population_size") == 5);
    CHECK(get_field<std::int64_t>(record, "generations") == 7);
    CHECK(get_field<std::vector<std::int64_t>>(record, "population").size() == 10);
    CHECK(get_field<std::vector<double>>(record, "total_coverage").size() == 10);

    const PopulationResult restored = PopulationResult::from_flat(flat_record_from_json(to_json(record)), study.objectives);
    CHECK(restored.population() == result.population());
    CHECK(restored.total_coverage() == result.total_coverage());
    CHECK(restored.generations() == 7);
    CHECK(restored.optimiser() == "nsga2");
    CHECK(restored.algorithm() == nullptr);
}

TEST_CASE("Flat records reject sensor indices outside the candidate range") {
    const TwoColumnStudy study{};
    FlatRecord population = make_population(study.objectives).to_flat();
    population["population"] = std::vector<std::int64_t>{0, 1, 7, 50, 4, 4, 0, 8, 3, 5};
    REQUIRE_THROWS_AS(PopulationResult::from_flat(population, study.objectives), RecordFormatError);
    population["population"] = std::vector<std::int64_t>{0, 1, 7, 9, 4, 4, 0, 8, 3, 5};
    REQUIRE_THROWS_AS(PopulationResult::from_flat(population, study.objectives), RecordFormatError);
    population["population"] = std::vector<std::int64_t>{0, -1, 7, 8, 4, 4, 0, 8, 3, 5};
    REQUIRE_THROWS_AS(PopulationResult::from_flat(population, study.objectives), RecordFormatError);

    const auto workers = test::make_worker_objectives();
    Greedy greedy{};
    const FlatRecord greedy_record = greedy.run(workers, 2).to_flat();

    FlatRecord bad_history = greedy_record;
    bad_history["placement_history"] = std::vector<std::int64_t>{4, 12};
    REQUIRE_THROWS_AS(GreedyResult::from_flat(bad_history, workers), RecordFormatError);
    bad_history["placement_history"] = std::vector<std::int64_t>{-3, 10};
    REQUIRE_THROWS_AS(GreedyResult::from_flat(bad_history, workers), RecordFormatError);

    FlatRecord bad_sensors = greedy_record;
    bad_sensors["sensors"] = std::vector<std::int64_t>{4, 40};
    REQUIRE_THROWS_AS(GreedyResult::from_flat(bad_sensors, workers), RecordFormatError);
    REQUIRE_THROWS_AS(SingleNetworkResult::from_flat(bad_sensors, workers), RecordFormatError);
}
