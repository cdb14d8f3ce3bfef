// === NSGA-II =================================================================
//
// Elitist non-dominated sorting genetic algorithm over index-encoded networks:
// binary tournament on (rank, crowding distance), simulated binary crossover
// and polynomial mutation applied to the integer genes, and (μ+λ) survivor
// selection by front then crowding distance.

#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <string>

#include "sensor_placement/evolutionary_algorithm.hpp"
#include "sensor_placement/logging.hpp"

namespace sensor_placement {

/** @brief Tunable NSGA-II parameters. */
struct Nsga2Options final {
    std::size_t generations{1};          /**< Generations run by each evolve() call. */
    double crossover_probability{0.95};  /**< Probability a parent pair is recombined. */
    double eta_c{10.0};                  /**< SBX distribution index. */
    double mutation_probability{0.01};   /**< Per-gene mutation probability. */
    double eta_m{50.0};                  /**< Polynomial mutation distribution index. */
    std::uint64_t seed{0};               /**< Seed of the algorithm's random engine. */
};

class Nsga2 final : public EvolutionaryAlgorithm {
  public:
    explicit Nsga2(Nsga2Options options = {});

    [[nodiscard]] Population evolve(const CoverageProblem& problem, Population population) override;
    [[nodiscard]] const EvolutionLog& get_log() const noexcept override;
    [[nodiscard]] std::unique_ptr<EvolutionaryAlgorithm> clone() const override;
    [[nodiscard]] std::string name() const override;
    [[nodiscard]] std::size_t generations_per_evolve() const noexcept override;

    [[nodiscard]] const Nsga2Options& options() const noexcept;

  private:
    using Genes = std::vector<double>;

    [[nodiscard]] std::size_t tournament(const std::vector<std::size_t>& ranks, const std::vector<double>& crowding);
    void crossover(Genes& child1, Genes& child2, double lower, double upper);
    void mutate(Genes& child, double lower, double upper);
    [[nodiscard]] double uniform();

    Nsga2Options options_;
    std::mt19937_64 rng_;
    EvolutionLog list_log_;
    std::size_t generation_count_{0};
    std::size_t feval_count_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace sensor_placement
