#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "Optimization/DifferentialEvolution.hpp"
#include "Optimization/Minimization.hpp"
#include "Optimization/NelderMead.hpp"

namespace {

realtype rosenbrock(const Vector& x) {
    return 100.0 * std::pow(x(1) - x(0) * x(0), 2) + std::pow(1.0 - x(0), 2);
}

realtype sphere(const Vector& x) { return x.squaredNorm(); }

Bounds symmetricBounds(int n, realtype half_width) { return Bounds(static_cast<std::size_t>(n), {-half_width, half_width}); }

}  // namespace

TEST_CASE("Bounds must be finite and ordered", "[Optimizer]") {
    CHECK_NOTHROW(checkBounds({{0.0, 1.0}, {-2.0, 5.0}}));
    CHECK_THROWS_AS(checkBounds({}), std::invalid_argument);
    CHECK_THROWS_AS(checkBounds({{1.0, 1.0}}), std::invalid_argument);
    CHECK_THROWS_AS(checkBounds({{2.0, 1.0}}), std::invalid_argument);
    CHECK_THROWS_AS(checkBounds({{0.0, std::numeric_limits<realtype>::infinity()}}), std::invalid_argument);
    CHECK_THROWS_AS(checkBounds({{std::numeric_limits<realtype>::quiet_NaN(), 1.0}}), std::invalid_argument);
}

TEST_CASE("Nelder-Mead minimizes the Rosenbrock function", "[Optimizer][NelderMead]") {
    NelderMeadSettings settings;
    settings.max_iterations = 2000;
    settings.max_evaluations = 4000;
    settings.xatol = 1e-8;
    settings.fatol = 1e-8;

    Vector x0(2);
    x0 << -1.2, 1.0;
    const MinimizationResult result = NelderMead(settings).minimize(rosenbrock, x0);

    CHECK(result.success);
    CHECK(result.x(0) == Approx(1.0).margin(1e-3));
    CHECK(result.x(1) == Approx(1.0).margin(1e-3));
    CHECK(result.fun < 1e-6);
    CHECK(result.evaluations <= 4000);
}

TEST_CASE("Nelder-Mead respects the evaluation cap", "[Optimizer][NelderMead]") {
    NelderMeadSettings settings;
    settings.max_evaluations = 20;

    Vector x0(2);
    x0 << -1.2, 1.0;
    const MinimizationResult result = NelderMead(settings).minimize(rosenbrock, x0);

    CHECK_FALSE(result.success);
    // The cap is checked between iterations, one iteration needs at most n + 2 evaluations
    CHECK(result.evaluations <= 20 + 2 + 2);
    CHECK(result.message == "Maximum number of function evaluations has been exceeded.");
}

TEST_CASE("Nelder-Mead keeps vertices inside the bounds", "[Optimizer][NelderMead]") {
    const Bounds bounds = {{0.0, 2.0}};
    Vector x0(1);
    x0 << 0.5;

    long int n_outside = 0;
    auto objective = [&](const Vector& x) {
        if (x(0) < 0.0 || x(0) > 2.0) ++n_outside;
        return std::pow(x(0) - 3.0, 2);
    };
    const MinimizationResult result = NelderMead().minimize(objective, x0, bounds);

    CHECK(n_outside == 0);
    CHECK(result.success);
    CHECK(result.x(0) == Approx(2.0).margin(1e-3));
    CHECK(result.fun == Approx(1.0).margin(1e-2));
}

TEST_CASE("Nelder-Mead stops when requested", "[Optimizer][NelderMead]") {
    Vector x0(3);
    x0 << 1.0, 0.0, -2.0;
    const MinimizationResult result = NelderMead().minimize(sphere, x0, std::nullopt, []() { return true; });

    CHECK_FALSE(result.success);
    CHECK(result.iterations == 1);
    CHECK(result.evaluations == 4);
    CHECK(result.message == "Stopped by request.");
}

TEST_CASE("Nelder-Mead rejects invalid input", "[Optimizer][NelderMead]") {
    CHECK_THROWS_AS(NelderMead().minimize(sphere, Vector()), std::invalid_argument);

    Vector x0 = Vector::Zero(2);
    CHECK_THROWS_AS(NelderMead().minimize(sphere, x0, Bounds{{0.0, 1.0}}), std::invalid_argument);

    NelderMeadSettings settings;
    settings.xatol = -1.0;
    CHECK_THROWS_AS(NelderMead(settings), std::invalid_argument);
}

TEST_CASE("Differential evolution population size", "[Optimizer][DifferentialEvolution]") {
    DifferentialEvolutionSettings settings;
    CHECK(DifferentialEvolution(symmetricBounds(3, 5.0), settings).populationCount() == 45);

    settings.population_size = 1;
    CHECK(DifferentialEvolution(symmetricBounds(2, 5.0), settings).populationCount() == 5);
}

TEST_CASE("Differential evolution minimizes a sphere", "[Optimizer][DifferentialEvolution]") {
    DifferentialEvolutionSettings settings;
    settings.seed = 42;
    settings.tolerance = 0.0;
    settings.absolute_tolerance = 1e-10;
    settings.max_iterations = 1000;

    DifferentialEvolution de(symmetricBounds(3, 5.0), settings);
    const MinimizationResult result = de.minimize(sphere);

    CHECK(result.fun < 1e-3);
    CHECK(result.x.cwiseAbs().maxCoeff() < 0.05);
    CHECK(result.evaluations == de.populationCount() * (1 + result.iterations));
    for (Eigen::Index j = 0; j < result.x.size(); ++j) {
        CHECK(std::abs(result.x(j)) <= 5.0);
    }
}

TEST_CASE("Differential evolution is reproducible with a seed", "[Optimizer][DifferentialEvolution]") {
    DifferentialEvolutionSettings settings;
    settings.seed = 7;
    settings.max_iterations = 20;

    const MinimizationResult first = DifferentialEvolution(symmetricBounds(2, 2.0), settings).minimize(rosenbrock);
    const MinimizationResult second = DifferentialEvolution(symmetricBounds(2, 2.0), settings).minimize(rosenbrock);

    CHECK(first.fun == second.fun);
    CHECK(first.iterations == second.iterations);
    CHECK(first.evaluations == second.evaluations);
    CHECK(first.x(0) == second.x(0));
    CHECK(first.x(1) == second.x(1));
}

TEST_CASE("Differential evolution callback can stop the search", "[Optimizer][DifferentialEvolution]") {
    DifferentialEvolutionSettings settings;
    settings.seed = 1;

    int n_calls = 0;
    realtype reported_best = std::numeric_limits<realtype>::quiet_NaN();
    auto progress = [&](const DifferentialEvolutionProgress& state) {
        ++n_calls;
        CHECK(state.iteration == 1);
        REQUIRE(state.best != nullptr);
        CHECK(state.best_score == Approx(sphere(*state.best)));
        reported_best = state.best_score;
        return true;
    };

    const MinimizationResult result = DifferentialEvolution(symmetricBounds(3, 5.0), settings).minimize(sphere, progress);

    CHECK(n_calls == 1);
    CHECK(result.iterations == 1);
    CHECK_FALSE(result.success);
    CHECK(result.message == "Callback requested stop early.");
    CHECK(result.fun == reported_best);
}

TEST_CASE("Differential evolution reports exhausted iterations", "[Optimizer][DifferentialEvolution]") {
    DifferentialEvolutionSettings settings;
    settings.seed = 3;
    settings.tolerance = 0.0;
    settings.max_iterations = 2;

    const MinimizationResult result = DifferentialEvolution(symmetricBounds(2, 2.0), settings).minimize(rosenbrock);
    CHECK_FALSE(result.success);
    CHECK(result.iterations == 2);
    CHECK(result.message == "Maximum number of iterations has been exceeded.");
}

TEST_CASE("Differential evolution rejects invalid settings", "[Optimizer][DifferentialEvolution]") {
    CHECK_THROWS_AS(DifferentialEvolution(Bounds{{1.0, 0.0}}), std::invalid_argument);

    DifferentialEvolutionSettings settings;
    settings.recombination = 1.5;
    CHECK_THROWS_AS(DifferentialEvolution(symmetricBounds(2, 1.0), settings), std::invalid_argument);

    settings = DifferentialEvolutionSettings();
    settings.mutation_min = 1.2;
    settings.mutation_max = 0.8;
    CHECK_THROWS_AS(DifferentialEvolution(symmetricBounds(2, 1.0), settings), std::invalid_argument);

    settings = DifferentialEvolutionSettings();
    settings.population_size = 0;
    CHECK_THROWS_AS(DifferentialEvolution(symmetricBounds(2, 1.0), settings), std::invalid_argument);
}
