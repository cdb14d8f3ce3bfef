#include <algorithm>
#include <atomic>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <random>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sensor_placement/configuration.hpp"
#include "sensor_placement/coverage.hpp"
#include "sensor_placement/greedy.hpp"
#include "sensor_placement/logging.hpp"
#include "sensor_placement/nsga2.hpp"
#include "sensor_placement/objectives.hpp"
#include "sensor_placement/population_optimiser.hpp"
#include "sensor_placement/site_set.hpp"

namespace {
std::atomic<bool> should_terminate{false};

constexpr std::size_t k_grid_width{12};
constexpr double k_grid_spacing_m{250.0};

void handle_signal(int) {
    should_terminate.store(true);
}

/**
 * @brief Grid of synthetic output areas with a busy centre.
 *
 * Residents fall off with distance from the centre; workers are concentrated
 * in a small business district.
 */
sensor_placement::RegionData make_demo_region(std::uint64_t seed) {
    using namespace sensor_placement;

    std::mt19937_64 rng(seed);
    std::vector<Site> list_sites;
    std::vector<double> residents;
    std::vector<double> children;
    std::vector<double> elderly;
    std::vector<double> workers;

    const double centre = 0.5 * static_cast<double>(k_grid_width - 1) * k_grid_spacing_m;
    for (std::size_t row = 0; row < k_grid_width; ++row) {
        for (std::size_t column = 0; column < k_grid_width; ++column) {
            const double x = static_cast<double>(column) * k_grid_spacing_m;
            const double y = static_cast<double>(row) * k_grid_spacing_m;
            list_sites.push_back(Site{fmt::format("OA{:03d}", row * k_grid_width + column), PlanarCoordinate{x, y}});

            const double distance = std::hypot(x - centre, y - centre);
            std::poisson_distribution<int> resident_draw(150.0 + 250.0 * std::exp(-distance / 1000.0));
            const double resident_count = resident_draw(rng);
            std::binomial_distribution<int> child_draw(static_cast<int>(resident_count), 0.2);
            std::binomial_distribution<int> elderly_draw(static_cast<int>(resident_count), 0.15 + distance / 20000.0);
            std::poisson_distribution<int> worker_draw(20.0 + 800.0 * std::exp(-distance / 300.0));

            residents.push_back(resident_count);
            children.push_back(child_draw(rng));
            elderly.push_back(elderly_draw(rng));
            workers.push_back(worker_draw(rng));
        }
    }

    RegionData region(SiteSet("demo_grid", std::move(list_sites)));
    region.add_column("population", "total", std::move(residents));
    region.add_column("population", "children", std::move(children));
    region.add_column("population", "elderly", std::move(elderly));
    region.add_column("workplace", "workers", std::move(workers));
    return region;
}
}  // namespace

int main() {
    using namespace sensor_placement;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        const Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);
        auto logger = get_logger();

        const RegionData region = make_demo_region(configuration.seed);
        const CoverageMatrixPtr coverage = CoverageMatrix::build(region.sites(), configuration.decay);
        const std::size_t n_sensors = std::min(configuration.n_sensors, region.n_sites());
        logger->info("Demo region {} with {} output areas", region.sites().region_id(), region.n_sites());

        const std::vector<Column> columns{
            Column{"population", "total", 1.0, "residents"},
            Column{"population", "children", 1.0, "children"},
            Column{"population", "elderly", 1.0, "elderly"},
            Column{"workplace", "workers", 1.0, "workers"},
        };

        Greedy greedy{};
        const GreedyResult greedy_result = greedy.run(CombinedObjective::from_region(region, columns, coverage), n_sensors);
        std::cout << to_json(greedy_result.to_flat()).dump() << '\n';

        Nsga2Options nsga_options{};
        nsga_options.generations = configuration.log_every;
        nsga_options.seed = configuration.seed;

        PopulationOptimiserOptions population_options{};
        population_options.population_size = configuration.population_size;
        population_options.seed = configuration.seed;
        population_options.progress = [&logger](const Progress& progress) {
            logger->debug("{} progress {:.0f}%", progress.optimiser, 100.0 * progress.fraction);
        };

        PopulationOptimiser optimiser(std::make_shared<Nsga2>(nsga_options), population_options);
        ConvergenceLog convergence;
        PopulationResult population_result = optimiser.run(Objectives::from_region(region, columns, coverage), n_sensors);
        convergence.record(population_result);

        // Batches are the cancellation points: a signal stops the search after the current one.
        while (population_result.generations() < configuration.generations && !should_terminate.load()) {
            population_result = optimiser.evolve_for(
                population_result,
                std::min(population_result.generations() + configuration.log_every, configuration.generations),
                convergence
            );
        }
        if (should_terminate.load()) {
            logger->warn("Stopped after {} generations", population_result.generations());
        }

        logger->info("Pareto front holds {} of {} networks",
                     population_result.pareto_front().size(),
                     population_result.population_size());

        nlohmann::json document{};
        document["population"] = to_json(population_result.to_flat());
        document["convergence"] = to_json(convergence.to_flat());
        std::cout << document.dump() << '\n';
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
