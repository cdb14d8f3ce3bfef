#include "sensor_placement/random_networks.hpp"

#include <fmt/format.h>

#include "sensor_placement/errors.hpp"
#include "sensor_placement/evolutionary_algorithm.hpp"

namespace sensor_placement {

namespace {
constexpr char k_optimiser_name[] = "random";
}  // namespace

RandomNetworks::RandomNetworks(std::size_t population_size, std::uint64_t seed)
    : population_size_(population_size),
      rng_(seed),
      logger_(get_logger()) {
    if (population_size_ == 0) {
        throw InvalidParameterError("Random network sample needs at least one network");
    }
}

PopulationResult RandomNetworks::run(FitnessFunctionPtr objectives, std::size_t n_sensors) {
    if (objectives == nullptr) {
        throw InvalidParameterError("Random networks require objectives");
    }
    const CoverageProblem problem(objectives, n_sensors);
    Population sample = random_population(problem, population_size_, rng_);
    logger_->debug("Drew {} random networks of {} sensors", population_size_, n_sensors);

    return PopulationResult(std::move(objectives),
                            n_sensors,
                            std::move(sample.decision_vectors),
                            to_maximisation(sample.fitness),
                            0,
                            k_optimiser_name);
}

PopulationResult RandomNetworks::update(const PopulationResult& result) {
    return run(result.objectives_ptr(), result.n_sensors());
}

}  // namespace sensor_placement
