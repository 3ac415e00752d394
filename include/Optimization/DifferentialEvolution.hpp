#ifndef DIFFERENTIAL_EVOLUTION_HPP
#define DIFFERENTIAL_EVOLUTION_HPP

#include <sundials/sundials_types.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <random>

#include "EigenDataTypes.hpp"
#include "Optimization/Minimization.hpp"

struct DifferentialEvolutionSettings {
    int population_size = 15;           // Multiplier, the population holds population_size * n_dim members
    int max_iterations = 1000;          // Generations
    realtype tolerance = 0.01;          // Relative convergence tolerance on the population scores
    realtype absolute_tolerance = 0.0;  // Absolute convergence tolerance on the population scores
    realtype mutation_min = 0.5;        // Dither interval [mutation_min, mutation_max) redrawn every generation
    realtype mutation_max = 1.0;
    realtype recombination = 0.7;        // Crossover probability
    std::optional<std::uint32_t> seed;  // Random seed, nondeterministic if unset
};

/**
 * @brief State handed to the progress callback after every generation
 */
struct DifferentialEvolutionProgress {
    int iteration = 0;
    long int evaluations = 0;
    realtype best_score = 0.0;
    realtype convergence = 0.0;  // tolerance * |mean(E)| / std(E), converged at >= 1
    const Vector* best = nullptr;
};

/**
 * @brief Differential evolution with the best1bin strategy
 *
 * The population lives in the unit hypercube and is mapped onto the bounds before every
 * evaluation. Initialization is a Latin hypercube. Trial vectors are
 *   b' = best + F (x_r0 - x_r1)
 * with binomial crossover and F dithered per generation; components leaving [0, 1] are
 * resampled uniformly. Replacements are applied immediately, so the best member is updated
 * within a generation. Converged once std(E) <= absolute_tolerance + tolerance |mean(E)|.
 *
 * The progress callback is called after every generation and may stop the search by
 * returning true.
 */
class DifferentialEvolution {
   public:
    using ProgressCallback = std::function<bool(const DifferentialEvolutionProgress&)>;

    DifferentialEvolution(const Bounds& bounds, const DifferentialEvolutionSettings& settings = {});

    MinimizationResult minimize(const ObjectiveFunction& objective, const ProgressCallback& progress = nullptr);

    Eigen::Index populationCount() const { return population_count; }

   private:
    Vector scaleToBounds(const Vector& unit) const;
    void initLatinHypercube();
    Vector mutateAndCross(Eigen::Index candidate, Eigen::Index best, realtype F);
    realtype convergence() const;
    bool converged() const;

    const Bounds bounds;
    const DifferentialEvolutionSettings settings;
    const Eigen::Index n_dim;
    const Eigen::Index population_count;

    std::mt19937 rng;
    std::uniform_real_distribution<realtype> uniform{0.0, 1.0};

    Matrix population;  // unit hypercube, one member per row
    ColVector energies;
};

#endif  // DIFFERENTIAL_EVOLUTION_HPP
