#include "sensor_placement/nsga2.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include <fmt/format.h>

#include "sensor_placement/errors.hpp"
#include "sensor_placement/pareto.hpp"

namespace sensor_placement {

namespace {

constexpr double k_min_gene_gap{1e-14};

void validate_options(const Nsga2Options& options) {
    if (options.generations == 0) {
        throw InvalidParameterError("NSGA-II needs at least one generation per evolve");
    }
    if (!(options.crossover_probability >= 0.0 && options.crossover_probability <= 1.0)) {
        throw InvalidParameterError(fmt::format("Crossover probability {} outside [0, 1]", options.crossover_probability));
    }
    if (!(options.mutation_probability >= 0.0 && options.mutation_probability <= 1.0)) {
        throw InvalidParameterError(fmt::format("Mutation probability {} outside [0, 1]", options.mutation_probability));
    }
    if (!(options.eta_c >= 1.0 && options.eta_c <= 100.0)) {
        throw InvalidParameterError(fmt::format("SBX distribution index {} outside [1, 100]", options.eta_c));
    }
    if (!(options.eta_m >= 1.0 && options.eta_m <= 100.0)) {
        throw InvalidParameterError(fmt::format("Mutation distribution index {} outside [1, 100]", options.eta_m));
    }
}

std::vector<double> to_genes(const IndexVector& decision) {
    return {decision.begin(), decision.end()};
}

IndexVector to_decision(const std::vector<double>& genes, std::int64_t lower, std::int64_t upper) {
    IndexVector decision;
    decision.reserve(genes.size());
    for (const double gene : genes) {
        const auto rounded = static_cast<std::int64_t>(std::llround(gene));
        decision.push_back(std::clamp(rounded, lower, upper));
    }
    return decision;
}

double sbx_spread(double beta, double eta_c, double random) {
    const double alpha = 2.0 - std::pow(beta, -(eta_c + 1.0));
    if (random <= 1.0 / alpha) {
        return std::pow(random * alpha, 1.0 / (eta_c + 1.0));
    }
    return std::pow(1.0 / (2.0 - random * alpha), 1.0 / (eta_c + 1.0));
}

/** @brief Ranks and crowding distances of every individual. */
void rank_population(const FitnessMatrix& fitness, std::vector<std::size_t>& ranks, std::vector<double>& crowding) {
    const NonDominatedSorting sorting = fast_non_dominated_sort(fitness);
    ranks = sorting.ranks;
    crowding.assign(fitness.size(), 0.0);
    for (const auto& front : sorting.fronts) {
        const std::vector<double> distances = crowding_distance(fitness, front);
        for (std::size_t position = 0; position < front.size(); ++position) {
            crowding[front[position]] = distances[position];
        }
    }
}

std::vector<double> ideal_point(const FitnessMatrix& fitness) {
    std::vector<double> ideal(fitness.front().size(), std::numeric_limits<double>::infinity());
    for (const auto& row : fitness) {
        for (std::size_t objective = 0; objective < row.size(); ++objective) {
            ideal[objective] = std::min(ideal[objective], row[objective]);
        }
    }
    return ideal;
}

}  // namespace

Nsga2::Nsga2(Nsga2Options options)
    : options_(options),
      rng_(options.seed),
      logger_(get_logger()) {
    validate_options(options_);
}

Population Nsga2::evolve(const CoverageProblem& problem, Population population) {
    const std::size_t population_size = population.size();
    if (population_size < 2) {
        throw InvalidParameterError(fmt::format("NSGA-II needs at least 2 individuals, got {}", population_size));
    }
    if (population.fitness.size() != population_size) {
        throw InvalidParameterError("Population fitness is not aligned with its decision vectors");
    }

    const std::int64_t lower = problem.lower_bound();
    const std::int64_t upper = problem.upper_bound();
    const auto lower_gene = static_cast<double>(lower);
    const auto upper_gene = static_cast<double>(upper);

    std::vector<std::size_t> ranks;
    std::vector<double> crowding;
    for (std::size_t generation = 0; generation < options_.generations; ++generation) {
        rank_population(population.fitness, ranks, crowding);

        Population offspring{};
        offspring.decision_vectors.reserve(population_size);
        offspring.fitness.reserve(population_size);
        while (offspring.size() < population_size) {
            const std::size_t parent1 = tournament(ranks, crowding);
            const std::size_t parent2 = tournament(ranks, crowding);
            Genes child1 = to_genes(population.decision_vectors[parent1]);
            Genes child2 = to_genes(population.decision_vectors[parent2]);
            crossover(child1, child2, lower_gene, upper_gene);
            mutate(child1, lower_gene, upper_gene);
            mutate(child2, lower_gene, upper_gene);

            for (Genes* child : {&child1, &child2}) {
                if (offspring.size() == population_size) {
                    break;
                }
                IndexVector decision = to_decision(*child, lower, upper);
                offspring.fitness.push_back(problem.fitness(decision));
                offspring.decision_vectors.push_back(std::move(decision));
                ++feval_count_;
            }
        }

        // (μ+λ) survivor selection over parents followed by offspring.
        Population merged = std::move(population);
        for (std::size_t child = 0; child < offspring.size(); ++child) {
            merged.decision_vectors.push_back(std::move(offspring.decision_vectors[child]));
            merged.fitness.push_back(std::move(offspring.fitness[child]));
        }

        const NonDominatedSorting sorting = fast_non_dominated_sort(merged.fitness);
        std::vector<std::size_t> survivors;
        survivors.reserve(population_size);
        for (const auto& front : sorting.fronts) {
            if (survivors.size() + front.size() <= population_size) {
                survivors.insert(survivors.end(), front.begin(), front.end());
                if (survivors.size() == population_size) {
                    break;
                }
                continue;
            }
            const std::vector<double> distances = crowding_distance(merged.fitness, front);
            std::vector<std::size_t> order(front.size());
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(), [&distances](std::size_t lhs, std::size_t rhs) {
                return distances[lhs] > distances[rhs];
            });
            const std::size_t needed = population_size - survivors.size();
            for (std::size_t position = 0; position < needed; ++position) {
                survivors.push_back(front[order[position]]);
            }
            break;
        }

        population = Population{};
        population.decision_vectors.reserve(population_size);
        population.fitness.reserve(population_size);
        for (const std::size_t survivor : survivors) {
            population.decision_vectors.push_back(std::move(merged.decision_vectors[survivor]));
            population.fitness.push_back(std::move(merged.fitness[survivor]));
        }

        ++generation_count_;
        EvolutionLogEntry entry{};
        entry.generation = generation_count_;
        entry.fevals = feval_count_;
        entry.ideal_point = ideal_point(population.fitness);
        entry.first_front_size = non_dominated_front(population.fitness).size();
        logger_->debug("NSGA-II generation {}: fevals={} first_front={}",
                       entry.generation,
                       entry.fevals,
                       entry.first_front_size);
        list_log_.push_back(std::move(entry));
    }
    return population;
}

const EvolutionLog& Nsga2::get_log() const noexcept {
    return list_log_;
}

std::unique_ptr<EvolutionaryAlgorithm> Nsga2::clone() const {
    return std::make_unique<Nsga2>(*this);
}

std::string Nsga2::name() const {
    return "nsga2";
}

std::size_t Nsga2::generations_per_evolve() const noexcept {
    return options_.generations;
}

const Nsga2Options& Nsga2::options() const noexcept {
    return options_;
}

std::size_t Nsga2::tournament(const std::vector<std::size_t>& ranks, const std::vector<double>& crowding) {
    std::uniform_int_distribution<std::size_t> pick(0, ranks.size() - 1);
    const std::size_t first = pick(rng_);
    const std::size_t second = pick(rng_);
    if (ranks[first] != ranks[second]) {
        return ranks[first] < ranks[second] ? first : second;
    }
    if (crowding[first] != crowding[second]) {
        return crowding[first] > crowding[second] ? first : second;
    }
    return uniform() < 0.5 ? first : second;
}

void Nsga2::crossover(Genes& child1, Genes& child2, double lower, double upper) {
    if (uniform() >= options_.crossover_probability) {
        return;
    }
    const double eta_c = options_.eta_c;
    for (std::size_t gene = 0; gene < child1.size(); ++gene) {
        if (uniform() > 0.5 || std::fabs(child1[gene] - child2[gene]) <= k_min_gene_gap) {
            continue;
        }
        const double y1 = std::min(child1[gene], child2[gene]);
        const double y2 = std::max(child1[gene], child2[gene]);
        const double random = uniform();

        const double beta_low = 1.0 + 2.0 * (y1 - lower) / (y2 - y1);
        double c1 = 0.5 * ((y1 + y2) - sbx_spread(beta_low, eta_c, random) * (y2 - y1));
        const double beta_high = 1.0 + 2.0 * (upper - y2) / (y2 - y1);
        double c2 = 0.5 * ((y1 + y2) + sbx_spread(beta_high, eta_c, random) * (y2 - y1));

        c1 = std::clamp(c1, lower, upper);
        c2 = std::clamp(c2, lower, upper);
        if (uniform() <= 0.5) {
            child1[gene] = c2;
            child2[gene] = c1;
        } else {
            child1[gene] = c1;
            child2[gene] = c2;
        }
    }
}

void Nsga2::mutate(Genes& child, double lower, double upper) {
    const double range = upper - lower;
    if (range <= 0.0) {
        return;
    }
    const double mutation_power = 1.0 / (options_.eta_m + 1.0);
    for (double& gene : child) {
        if (uniform() >= options_.mutation_probability) {
            continue;
        }
        const double delta1 = (gene - lower) / range;
        const double delta2 = (upper - gene) / range;
        const double random = uniform();
        double delta_q = 0.0;
        if (random < 0.5) {
            const double value = 2.0 * random + (1.0 - 2.0 * random) * std::pow(1.0 - delta1, options_.eta_m + 1.0);
            delta_q = std::pow(value, mutation_power) - 1.0;
        } else {
            const double value = 2.0 * (1.0 - random) + 2.0 * (random - 0.5) * std::pow(1.0 - delta2, options_.eta_m + 1.0);
            delta_q = 1.0 - std::pow(value, mutation_power);
        }
        gene = std::clamp(gene + delta_q * range, lower, upper);
    }
}

double Nsga2::uniform() {
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
}

}  // namespace sensor_placement
