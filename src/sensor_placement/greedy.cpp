#include "sensor_placement/greedy.hpp"

#include <algorithm>
#include <limits>

#include <fmt/format.h>

#include "sensor_placement/errors.hpp"

namespace sensor_placement {

namespace {
constexpr char k_optimiser_name[] = "greedy";

void require_single_objective(const FitnessFunction& objectives) {
    if (objectives.n_obj() != 1) {
        throw InvalidParameterError(fmt::format(
            "Greedy optimisation needs a single objective, got {}; combine them first",
            objectives.n_obj()
        ));
    }
}
}  // namespace

Greedy::Greedy(GreedyOptions options)
    : options_(std::move(options)),
      logger_(get_logger()) {}

GreedyResult Greedy::run(FitnessFunctionPtr objectives, std::size_t n_sensors) {
    if (objectives == nullptr) {
        throw InvalidParameterError("Greedy optimisation requires objectives");
    }
    require_single_objective(*objectives);
    if (n_sensors == 0 || n_sensors > objectives->n_candidates()) {
        throw InvalidSensorCountError(fmt::format(
            "Cannot place {} sensors among {} candidates",
            n_sensors,
            objectives->n_candidates()
        ));
    }

    logger_->info("Greedy placement of {} sensors among {} candidates for {}",
                  n_sensors,
                  objectives->n_candidates(),
                  objectives->labels().front());

    GreedyResult result(std::move(objectives), n_sensors);
    for (std::size_t placed = 0; placed < n_sensors; ++placed) {
        result = update(result);
    }

    logger_->info("Greedy placement finished: coverage {:.4f}", result.coverage_history().back());
    return result;
}

GreedyResult Greedy::update(const GreedyResult& result) {
    const FitnessFunction& objectives = result.objectives();
    require_single_objective(objectives);

    const Placement& placement = result.placement();
    const std::size_t placed = result.n_placed();
    if (placed >= placement.size()) {
        throw InvalidSensorCountError(fmt::format(
            "All {} candidates already hold a sensor",
            placement.size()
        ));
    }

    // Scan in index order and only replace the incumbent on strict improvement,
    // so the lowest index wins ties.
    Placement candidate = placement;
    SiteIndex best_site = placement.size();
    double best_coverage = -std::numeric_limits<double>::infinity();
    for (SiteIndex site = 0; site < placement.size(); ++site) {
        if (placement[site] != 0) {
            continue;
        }
        candidate[site] = 1;
        const double coverage = objectives.fitness(candidate).front();
        candidate[site] = 0;
        if (coverage > best_coverage) {
            best_coverage = coverage;
            best_site = site;
        }
    }

    Placement updated = placement;
    updated[best_site] = 1;
    std::vector<SiteIndex> placement_history = result.placement_history();
    placement_history.push_back(best_site);
    std::vector<double> coverage_history = result.coverage_history();
    coverage_history.push_back(best_coverage);

    const std::size_t target = std::max(result.n_sensors(), placed + 1);
    logger_->debug("Placed sensor {} of {} at {} (index {}): coverage {:.4f}",
                   placed + 1,
                   target,
                   objectives.coverage().sensor_identifiers()[best_site],
                   best_site,
                   best_coverage);

    GreedyResult extended(
        result.objectives_ptr(),
        target,
        std::move(updated),
        best_coverage,
        std::move(placement_history),
        std::move(coverage_history)
    );
    report_progress(placed + 1, target);
    return extended;
}

void Greedy::report_progress(std::size_t placed, std::size_t target) const {
    if (!options_.progress) {
        return;
    }
    Progress progress{};
    progress.optimiser = k_optimiser_name;
    progress.completed = placed;
    progress.total = target;
    progress.fraction = static_cast<double>(placed) / static_cast<double>(target);
    options_.progress(progress);
}

}  // namespace sensor_placement
