#include "Optimization/DifferentialEvolution.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

DifferentialEvolution::DifferentialEvolution(const Bounds& bounds, const DifferentialEvolutionSettings& settings)
    : bounds(bounds),
      settings(settings),
      n_dim(static_cast<Eigen::Index>(bounds.size())),
      population_count(std::max<Eigen::Index>(5, settings.population_size * static_cast<Eigen::Index>(bounds.size()))) {
    checkBounds(bounds);
    if (settings.population_size < 1) {
        throw std::invalid_argument("population_size must be >= 1");
    }
    if (settings.max_iterations < 0) {
        throw std::invalid_argument("max_iterations must be >= 0");
    }
    if (!(settings.mutation_min >= 0.0) || !(settings.mutation_min <= settings.mutation_max) ||
        !(settings.mutation_max <= 2.0)) {
        throw std::invalid_argument("mutation dither interval must satisfy 0 <= min <= max <= 2");
    }
    if (!(settings.recombination >= 0.0 && settings.recombination <= 1.0)) {
        throw std::invalid_argument("recombination must be in [0, 1]");
    }
    if (!(settings.tolerance >= 0.0) || !(settings.absolute_tolerance >= 0.0)) {
        throw std::invalid_argument("convergence tolerances must be non-negative");
    }

    if (settings.seed) {
        rng.seed(*settings.seed);
    } else {
        std::random_device device;
        rng.seed(device());
    }
}

Vector DifferentialEvolution::scaleToBounds(const Vector& unit) const {
    Vector x(n_dim);
    for (Eigen::Index j = 0; j < n_dim; ++j) {
        const auto& [lower, upper] = bounds[static_cast<std::size_t>(j)];
        x(j) = lower + unit(j) * (upper - lower);
    }
    return x;
}

void DifferentialEvolution::initLatinHypercube() {
    const realtype segment = 1.0 / static_cast<realtype>(population_count);
    population.resize(population_count, n_dim);

    std::vector<Eigen::Index> order(static_cast<std::size_t>(population_count));
    for (Eigen::Index j = 0; j < n_dim; ++j) {
        std::iota(order.begin(), order.end(), 0);
        std::shuffle(order.begin(), order.end(), rng);
        // One sample in each of the population_count strata, strata shuffled per dimension
        for (Eigen::Index i = 0; i < population_count; ++i) {
            const realtype stratum = static_cast<realtype>(order[static_cast<std::size_t>(i)]);
            population(i, j) = (stratum + uniform(rng)) * segment;
        }
    }
}

Vector DifferentialEvolution::mutateAndCross(Eigen::Index candidate, Eigen::Index best, realtype F) {
    std::uniform_int_distribution<Eigen::Index> pick(0, population_count - 1);
    Eigen::Index r0, r1;
    do {
        r0 = pick(rng);
    } while (r0 == candidate);
    do {
        r1 = pick(rng);
    } while (r1 == candidate || r1 == r0);

    const Vector bprime = (population.row(best) + F * (population.row(r0) - population.row(r1))).transpose();
    Vector trial = population.row(candidate).transpose();

    std::uniform_int_distribution<Eigen::Index> pick_dim(0, n_dim - 1);
    const Eigen::Index fill_point = pick_dim(rng);
    for (Eigen::Index j = 0; j < n_dim; ++j) {
        if (j == fill_point || uniform(rng) < settings.recombination) {
            trial(j) = bprime(j);
        }
    }

    // Resample components that left the unit hypercube
    for (Eigen::Index j = 0; j < n_dim; ++j) {
        if (trial(j) < 0.0 || trial(j) > 1.0) trial(j) = uniform(rng);
    }
    return trial;
}

realtype DifferentialEvolution::convergence() const {
    if (!energies.allFinite()) return 0.0;
    const realtype mean = energies.mean();
    const realtype stddev = std::sqrt((energies - mean).square().mean());
    if (stddev == 0.0) return std::numeric_limits<realtype>::infinity();
    return settings.tolerance * std::abs(mean) / stddev;
}

bool DifferentialEvolution::converged() const {
    if (!energies.allFinite()) return false;
    const realtype mean = energies.mean();
    const realtype stddev = std::sqrt((energies - mean).square().mean());
    return stddev <= settings.absolute_tolerance + settings.tolerance * std::abs(mean);
}

MinimizationResult DifferentialEvolution::minimize(const ObjectiveFunction& objective,
                                                   const ProgressCallback& progress) {
    MinimizationResult result;

    auto evaluate = [&](const Vector& unit) {
        ++result.evaluations;
        const realtype e = objective(scaleToBounds(unit));
        return std::isfinite(e) ? e : std::numeric_limits<realtype>::infinity();
    };

    initLatinHypercube();
    energies.resize(population_count);
    for (Eigen::Index i = 0; i < population_count; ++i) {
        energies(i) = evaluate(population.row(i).transpose());
    }
    Eigen::Index best = 0;
    energies.minCoeff(&best);

    result.message = "Maximum number of iterations has been exceeded.";
    for (int iteration = 1; iteration <= settings.max_iterations; ++iteration) {
        const realtype F = settings.mutation_min + uniform(rng) * (settings.mutation_max - settings.mutation_min);

        for (Eigen::Index candidate = 0; candidate < population_count; ++candidate) {
            const Vector trial = mutateAndCross(candidate, best, F);
            const realtype e = evaluate(trial);
            if (e <= energies(candidate)) {
                population.row(candidate) = trial.transpose();
                energies(candidate) = e;
                if (e < energies(best)) best = candidate;
            }
        }
        result.iterations = iteration;

        if (progress) {
            const Vector best_x = scaleToBounds(population.row(best).transpose());
            DifferentialEvolutionProgress state;
            state.iteration = iteration;
            state.evaluations = result.evaluations;
            state.best_score = energies(best);
            state.convergence = convergence();
            state.best = &best_x;
            if (progress(state)) {
                result.message = "Callback requested stop early.";
                result.success = false;
                break;
            }
        }

        if (converged()) {
            result.message = "Optimization terminated successfully.";
            result.success = true;
            break;
        }
    }

    result.x = scaleToBounds(population.row(best).transpose());
    result.fun = energies(best);
    return result;
}
