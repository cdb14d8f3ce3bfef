#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "placement_fixtures.hpp"
#include "sensor_placement/errors.hpp"
#include "sensor_placement/random_networks.hpp"

using namespace sensor_placement;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    sensor_placement::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("Random networks are scored with the supplied objectives") {
    const auto objectives = test::make_worker_objectives();
    RandomNetworks random_networks(25, 123);
    const PopulationResult result = random_networks.run(objectives, 3);

    REQUIRE(result.population_size() == 25);
    CHECK(result.generations() == 0);
    CHECK(result.optimiser() == "random");
    CHECK(result.algorithm() == nullptr);
    for (std::size_t individual = 0; individual < result.population_size(); ++individual) {
        const IndexVector& network = result.population()[individual];
        REQUIRE(network.size() == 3);
        for (const std::int64_t index : network) {
            CHECK(index >= 0);
            CHECK(index < 12);
        }
        CHECK(result.total_coverage()[individual] == objectives->fitness(network));
    }
}

TEST_CASE("Random networks are reproducible for a seed and resampled on update") {
    const auto objectives = test::make_worker_objectives();
    RandomNetworks first(30, 99);
    RandomNetworks second(30, 99);

    const PopulationResult sample = first.run(objectives, 4);
    CHECK(sample.population() == second.run(objectives, 4).population());

    const PopulationResult resampled = first.update(sample);
    CHECK(resampled.n_sensors() == 4);
    CHECK(resampled.population() != sample.population());
}

TEST_CASE("Random networks reject invalid sizes") {
    REQUIRE_THROWS_AS(RandomNetworks(0, 1), InvalidParameterError);
    RandomNetworks random_networks(5, 1);
    REQUIRE_THROWS_AS(random_networks.run(test::make_worker_objectives(), 0), InvalidSensorCountError);
}
