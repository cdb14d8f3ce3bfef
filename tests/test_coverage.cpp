#include <cmath>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "sensor_placement/coverage.hpp"
#include "sensor_placement/errors.hpp"

using namespace sensor_placement;

namespace {
const std::vector<double> k_x{0.0, 3.0, 6.0};
const std::vector<double> k_y{0.0, 4.0, 8.0};
}  // namespace

TEST_CASE("distance_matrix of three collinear points") {
    const auto distances = distance_matrix(k_x, k_y);
    const std::vector<std::vector<double>> expected{{0.0, 5.0, 10.0}, {5.0, 0.0, 5.0}, {10.0, 5.0, 0.0}};
    REQUIRE(distances == expected);
}

TEST_CASE("distance_matrix between distinct sensor and site sets") {
    const auto distances = distance_matrix({0.0, 6.0}, {0.0, 8.0}, k_x, k_y);
    const std::vector<std::vector<double>> expected{{0.0, 5.0, 10.0}, {10.0, 5.0, 0.0}};
    REQUIRE(distances == expected);
}

TEST_CASE("distance_matrix rejects mismatched coordinate lengths") {
    REQUIRE_THROWS_AS(distance_matrix({0.0, 1.0}, {0.0}), InvalidParameterError);
}

TEST_CASE("Exponential decay coverage equals exp(-d / theta)") {
    const auto matrix = CoverageMatrix::build(k_x, k_y, ExponentialDecay{2.0});
    REQUIRE(matrix->n_sensors() == 3);
    REQUIRE(matrix->n_sites() == 3);
    const std::vector<std::vector<double>> distances{{0.0, 5.0, 10.0}, {5.0, 0.0, 5.0}, {10.0, 5.0, 0.0}};
    for (std::size_t sensor = 0; sensor < 3; ++sensor) {
        for (std::size_t site = 0; site < 3; ++site) {
            CHECK(matrix->at(sensor, site) == Approx(std::exp(-distances[sensor][site] / 2.0)));
        }
    }
}

TEST_CASE("Binary decay covers only sites strictly inside the radius") {
    const auto matrix = CoverageMatrix::build(k_x, k_y, BinaryDecay{5.0});
    CHECK(matrix->at(0, 0) == 1.0);
    CHECK(matrix->at(0, 1) == 0.0);
    CHECK(matrix->at(1, 0) == 0.0);
    CHECK(matrix->at(1, 1) == 1.0);
    CHECK(matrix->at(0, 2) == 0.0);

    const auto wider = CoverageMatrix::build(k_x, k_y, BinaryDecay{5.5});
    CHECK(wider->at(0, 1) == 1.0);
    CHECK(wider->at(0, 2) == 0.0);
}

TEST_CASE("Decay parameters must be positive and finite") {
    REQUIRE_THROWS_AS(CoverageMatrix::build(k_x, k_y, BinaryDecay{0.0}), InvalidParameterError);
    REQUIRE_THROWS_AS(CoverageMatrix::build(k_x, k_y, ExponentialDecay{-1.0}), InvalidParameterError);
    REQUIRE_THROWS_AS(make_decay("exponential", std::nan("")), InvalidParameterError);
    REQUIRE_THROWS_AS(make_decay("gaussian", 1.0), InvalidParameterError);
}

TEST_CASE("make_decay round trips kind and parameter") {
    const DecayFunction binary = make_decay("binary", 250.0);
    CHECK(decay_kind_name(binary) == "binary");
    CHECK(decay_parameter(binary) == 250.0);

    const DecayFunction exponential = make_decay("exponential", 500.0);
    CHECK(decay_kind_name(exponential) == "exponential");
    CHECK(decay_parameter(exponential) == 500.0);
}

TEST_CASE("Coverage for a placement takes the best selected sensor per site") {
    const auto matrix = CoverageMatrix::build(k_x, k_y, ExponentialDecay{2.0});

    const auto empty = matrix->coverage_for_placement(Placement{0, 0, 0});
    CHECK(empty == std::vector<double>{0.0, 0.0, 0.0});

    const auto ends = coverage_for_placement(*matrix, Placement{1, 0, 1});
    CHECK(ends[0] == 1.0);
    CHECK(ends[1] == Approx(std::exp(-2.5)));
    CHECK(ends[2] == 1.0);

    REQUIRE_THROWS_AS(matrix->coverage_for_placement(Placement{1, 0}), InvalidParameterError);
}

TEST_CASE("Coverage matrix built from site sets keeps identifiers and region") {
    const SiteSet sites("E08000021", {
        Site{"a", PlanarCoordinate{0.0, 0.0}},
        Site{"b", PlanarCoordinate{3.0, 4.0}},
        Site{"c", PlanarCoordinate{6.0, 8.0}},
    });
    const SiteSet sensors("E08000021", {
        Site{"a", PlanarCoordinate{0.0, 0.0}},
        Site{"c", PlanarCoordinate{6.0, 8.0}},
    });

    const auto matrix = CoverageMatrix::build(sensors, sites, BinaryDecay{6.0});
    CHECK(matrix->region_id() == "E08000021");
    CHECK(matrix->sensor_identifiers() == std::vector<std::string>{"a", "c"});
    CHECK(matrix->site_identifiers() == std::vector<std::string>{"a", "b", "c"});
    CHECK(matrix->coverage_for_placement(Placement{0, 1}) == std::vector<double>{0.0, 1.0, 1.0});
    REQUIRE_THROWS_AS(matrix->at(2, 0), std::out_of_range);
}

TEST_CASE("Coverage matrix rejects values outside [0, 1]") {
    REQUIRE_THROWS_AS(
        CoverageMatrix("r", {"s"}, {"t"}, BinaryDecay{1.0}, {1.5}),
        InvalidParameterError
    );
    REQUIRE_THROWS_AS(
        CoverageMatrix("r", {"s"}, {"t", "u"}, BinaryDecay{1.0}, {1.0}),
        InvalidParameterError
    );
}

TEST_CASE("Coverage matrix over one site set is symmetric with a unit diagonal") {
    const SiteSet sites("grid", {
        Site{"a", PlanarCoordinate{0.0, 0.0}},
        Site{"b", PlanarCoordinate{120.0, 35.0}},
        Site{"c", PlanarCoordinate{-40.0, 310.0}},
        Site{"d", PlanarCoordinate{275.5, 260.25}},
    });
    const std::vector<DecayFunction> decays{BinaryDecay{200.0}, ExponentialDecay{150.0}};
    for (const DecayFunction& decay : decays) {
        const auto matrix = CoverageMatrix::build(sites, decay);
        REQUIRE(matrix->n_sensors() == 4);
        REQUIRE(matrix->n_sites() == 4);
        for (std::size_t i = 0; i < 4; ++i) {
            CHECK(matrix->at(i, i) == 1.0);
            for (std::size_t j = 0; j < 4; ++j) {
                CHECK(matrix->at(i, j) == matrix->at(j, i));
            }
        }
    }
}
