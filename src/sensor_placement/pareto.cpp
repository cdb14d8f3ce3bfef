#include "sensor_placement/pareto.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

#include "sensor_placement/errors.hpp"

namespace sensor_placement {

namespace {

double hypervolume_2d(FitnessMatrix points, const std::vector<double>& reference) {
    std::sort(points.begin(), points.end(), [](const auto& lhs, const auto& rhs) { return lhs[0] > rhs[0]; });
    double volume = 0.0;
    double max_height = reference[1];
    for (std::size_t index = 0; index < points.size(); ++index) {
        max_height = std::max(max_height, points[index][1]);
        const double next_x = index + 1 < points.size() ? points[index + 1][0] : reference[0];
        volume += (points[index][0] - next_x) * (max_height - reference[1]);
    }
    return volume;
}

double hypervolume_recursive(FitnessMatrix points, const std::vector<double>& reference) {
    const std::size_t dimensions = reference.size();
    if (points.empty()) {
        return 0.0;
    }
    if (dimensions == 1) {
        double best = reference[0];
        for (const auto& point : points) {
            best = std::max(best, point[0]);
        }
        return best - reference[0];
    }
    if (dimensions == 2) {
        return hypervolume_2d(std::move(points), reference);
    }

    const std::size_t last = dimensions - 1;
    std::sort(points.begin(), points.end(), [last](const auto& lhs, const auto& rhs) { return lhs[last] > rhs[last]; });
    const std::vector<double> reduced_reference(reference.begin(), reference.end() - 1);

    double volume = 0.0;
    FitnessMatrix projected;
    projected.reserve(points.size());
    for (std::size_t index = 0; index < points.size(); ++index) {
        projected.emplace_back(points[index].begin(), points[index].end() - 1);
        const double next_level = index + 1 < points.size() ? points[index + 1][last] : reference[last];
        const double depth = points[index][last] - next_level;
        if (depth > 0.0) {
            volume += depth * hypervolume_recursive(projected, reduced_reference);
        }
    }
    return volume;
}

}  // namespace

bool dominates(const std::vector<double>& lhs, const std::vector<double>& rhs) {
    bool strictly_better = false;
    for (std::size_t index = 0; index < lhs.size(); ++index) {
        if (lhs[index] > rhs[index]) {
            return false;
        }
        if (lhs[index] < rhs[index]) {
            strictly_better = true;
        }
    }
    return strictly_better;
}

NonDominatedSorting fast_non_dominated_sort(const FitnessMatrix& fitness) {
    const std::size_t count = fitness.size();
    NonDominatedSorting sorting{};
    sorting.ranks.assign(count, 0);
    if (count == 0) {
        return sorting;
    }

    std::vector<std::vector<std::size_t>> dominated_by(count);
    std::vector<std::size_t> domination_count(count, 0);
    std::vector<std::size_t> current_front;
    for (std::size_t p = 0; p < count; ++p) {
        for (std::size_t q = 0; q < count; ++q) {
            if (p == q) {
                continue;
            }
            if (dominates(fitness[p], fitness[q])) {
                dominated_by[p].push_back(q);
            } else if (dominates(fitness[q], fitness[p])) {
                ++domination_count[p];
            }
        }
        if (domination_count[p] == 0) {
            current_front.push_back(p);
        }
    }

    std::size_t rank = 0;
    while (!current_front.empty()) {
        std::vector<std::size_t> next_front;
        for (const std::size_t p : current_front) {
            sorting.ranks[p] = rank;
            for (const std::size_t q : dominated_by[p]) {
                if (--domination_count[q] == 0) {
                    next_front.push_back(q);
                }
            }
        }
        std::sort(next_front.begin(), next_front.end());
        sorting.fronts.push_back(std::move(current_front));
        current_front = std::move(next_front);
        ++rank;
    }
    return sorting;
}

std::vector<double> crowding_distance(const FitnessMatrix& fitness, const std::vector<std::size_t>& front) {
    std::vector<double> distances(front.size(), 0.0);
    if (front.size() <= 2) {
        std::fill(distances.begin(), distances.end(), std::numeric_limits<double>::infinity());
        return distances;
    }

    const std::size_t n_obj = fitness[front.front()].size();
    std::vector<std::size_t> order(front.size());
    for (std::size_t objective = 0; objective < n_obj; ++objective) {
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
            return fitness[front[lhs]][objective] < fitness[front[rhs]][objective];
        });
        const double min_value = fitness[front[order.front()]][objective];
        const double max_value = fitness[front[order.back()]][objective];
        distances[order.front()] = std::numeric_limits<double>::infinity();
        distances[order.back()] = std::numeric_limits<double>::infinity();
        const double span = max_value - min_value;
        if (span <= 0.0) {
            continue;
        }
        for (std::size_t position = 1; position + 1 < order.size(); ++position) {
            const double previous = fitness[front[order[position - 1]]][objective];
            const double next = fitness[front[order[position + 1]]][objective];
            distances[order[position]] += (next - previous) / span;
        }
    }
    return distances;
}

std::vector<std::size_t> non_dominated_front(const FitnessMatrix& fitness) {
    NonDominatedSorting sorting = fast_non_dominated_sort(fitness);
    if (sorting.fronts.empty()) {
        return {};
    }
    std::vector<std::size_t> front = std::move(sorting.fronts.front());
    std::sort(front.begin(), front.end());
    return front;
}

double hypervolume(const FitnessMatrix& points, const std::vector<double>& reference) {
    if (reference.empty()) {
        throw InvalidParameterError("Hypervolume reference point must have at least one dimension");
    }
    FitnessMatrix clipped;
    clipped.reserve(points.size());
    for (const auto& point : points) {
        if (point.size() != reference.size()) {
            throw InvalidParameterError("Hypervolume points must match the reference dimension");
        }
        std::vector<double> bounded(point.size());
        for (std::size_t index = 0; index < point.size(); ++index) {
            bounded[index] = std::max(point[index], reference[index]);
        }
        clipped.push_back(std::move(bounded));
    }
    return hypervolume_recursive(std::move(clipped), reference);
}

}  // namespace sensor_placement
