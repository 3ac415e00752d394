#include "Optimization/OptimizationDriver.hpp"

#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "ConfigurationError.hpp"
#include "Logger.hpp"
#include "Reactions/KineticRates.hpp"

void OptimizationSettings::validate() const {
    if (std::isnan(time_budget_seconds) || time_budget_seconds < 0.0) {
        throw ConfigurationError("optimization.time_budget_seconds must be non-negative");
    }
    if (global.population_size < 1) {
        throw ConfigurationError("optimization.population_size must be >= 1");
    }
    if (global.max_iterations < 0) {
        throw ConfigurationError("optimization.max_iterations must be >= 0");
    }
    if (!(global.tolerance >= 0.0) || !(global.absolute_tolerance >= 0.0)) {
        throw ConfigurationError("optimization.tolerance and absolute_tolerance must be non-negative");
    }
    if (!(global.mutation_min >= 0.0) || !(global.mutation_min <= global.mutation_max) ||
        !(global.mutation_max <= 2.0)) {
        throw ConfigurationError("optimization.mutation must satisfy 0 <= min <= max <= 2");
    }
    if (!(global.recombination >= 0.0 && global.recombination <= 1.0)) {
        throw ConfigurationError("optimization.recombination must be in [0, 1]");
    }
    if (progress_every_iterations < 1) {
        throw ConfigurationError("optimization.progress_every_iterations must be >= 1");
    }
    if (!(progress_every_seconds > 0.0)) {
        throw ConfigurationError("optimization.progress_every_seconds must be positive");
    }
    if (!(magnitude_limit > 0.0) || !(magnitude_penalty_factor >= 0.0)) {
        throw ConfigurationError("optimization.magnitude_penalty_factor must be non-negative");
    }
    if (local_refinement.nelder_mead.max_iterations < 0 || local_refinement.nelder_mead.max_evaluations < 0) {
        throw ConfigurationError("optimization.local_refinement caps must be non-negative");
    }
    if (!(local_refinement.nelder_mead.xatol >= 0.0) || !(local_refinement.nelder_mead.fatol >= 0.0)) {
        throw ConfigurationError("optimization.local_refinement tolerances must be non-negative");
    }
    if (!bounds.empty()) {
        if (static_cast<Eigen::Index>(bounds.size()) != kinetic_parameters::count) {
            throw ConfigurationError("optimization.bounds must hold " + std::to_string(kinetic_parameters::count) +
                                     " pairs, got " + std::to_string(bounds.size()));
        }
        try {
            checkBounds(bounds);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(std::string("optimization.bounds: ") + e.what());
        }
    }
}

OptimizationDriver::OptimizationDriver(const ReactorModelBase& reactor,
                                       const ExperimentalDataset& data,
                                       const std::string& combination_id,
                                       const OptimizationSettings& settings,
                                       const Deadline& deadline)
    : combination_id_(combination_id),
      settings_(settings),
      deadline_(deadline),
      bounds_(settings.bounds.empty() ? defaultParameterBounds() : settings.bounds),
      evaluator_(reactor, data, settings.objective, &deadline) {
    settings_.validate();
}

realtype OptimizationDriver::penalizedObjective(const Vector& parameters) {
    if (!parameters.allFinite()) {
        ++statistics_.n_non_finite_parameters;
        return non_finite_penalty;
    }

    const realtype excess = (parameters.array().abs() - settings_.magnitude_limit).cwiseMax(0.0).sum();
    return evaluator_.evaluate(parameters, &statistics_) + settings_.magnitude_penalty_factor * excess;
}

bool OptimizationDriver::reportProgress(const DifferentialEvolutionProgress& progress) {
    const realtype now = deadline_.elapsedSeconds();

    if (progress.iteration % settings_.progress_every_iterations == 0 ||
        now - last_report_seconds >= settings_.progress_every_seconds) {
        last_report_seconds = now;

        const realtype elapsed = now - run_start_seconds;
        const realtype rate = elapsed > 0.0 ? progress.iteration / elapsed : 0.0;
        const realtype projected = rate * deadline_.remainingSeconds();

        std::ostringstream oss;
        oss << std::scientific << std::setprecision(6);
        oss << "[" << combination_id_ << "] iteration=" << progress.iteration << "\t\tbest=" << progress.best_score
            << "\t\tconvergence=" << progress.convergence << "\t\tevaluations=" << progress.evaluations
            << "\t\tit/s=" << rate << "\t\tprojected_iterations=" << projected << "\n";
        std::cout << oss.str() << std::flush;
        LOG("optimizer_progress.log", oss.str());
    }

    if (deadline_.expired()) {
        deadline_exceeded = true;
        LOG("driver.log", "[" << combination_id_ << "] deadline reached after " << progress.iteration
                              << " iterations, stopping global phase\n");
        return true;
    }
    return false;
}

OptimizationResult OptimizationDriver::run() {
    OptimizationResult result;
    result.combination_id = combination_id_;

    run_start_seconds = deadline_.elapsedSeconds();
    last_report_seconds = run_start_seconds;
    deadline_exceeded = false;

    try {
        auto objective = [this](const Vector& p) { return penalizedObjective(p); };

        // Phase 1: global search
        DifferentialEvolution de(bounds_, settings_.global);
        realtype t_global = 0.0;
        MinimizationResult global;
        auto progress = [this](const DifferentialEvolutionProgress& p) { return reportProgress(p); };
        BENCHMARK(t_global, { global = de.minimize(objective, progress); });
        LOG_BENCHMARK("optimizer.log", "[" << combination_id_ << "] global phase: " << t_global << " s, "
                                           << global.iterations << " iterations\n");

        result.parameters = global.x;
        result.score = global.fun;
        result.iterations = global.iterations;
        result.evaluations = global.evaluations;
        result.success = global.success;
        result.message = global.message;

        LOG("driver.log", "[" << combination_id_ << "] global phase finished: " << global.message
                              << " score=" << global.fun << " iterations=" << global.iterations << "\n");

        // Phase 2: local refinement
        if (settings_.local_refinement.enabled && global.success && !deadline_exceeded && !deadline_.expired()) {
            NelderMead nm(settings_.local_refinement.nelder_mead);
            const MinimizationResult local =
                nm.minimize(objective, global.x, bounds_, [this]() { return deadline_.expired(); });
            result.evaluations += local.evaluations;

            LOG("driver.log", "[" << combination_id_ << "] local refinement: " << local.message
                                  << " score=" << local.fun << " iterations=" << local.iterations << "\n");

            if (local.fun < global.fun) {
                result.parameters = local.x;
                result.score = local.fun;
                result.refined = true;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: optimization of combination " << combination_id_ << " failed: " << e.what()
                  << std::endl;
        LOG("driver.log", "[" << combination_id_ << "] optimization failed: " << e.what() << "\n");
        result.score = std::numeric_limits<realtype>::infinity();
        result.success = false;
        result.message = e.what();
    }

    result.deadline_exceeded = deadline_exceeded || deadline_.expired();
    result.elapsed_minutes = (deadline_.elapsedSeconds() - run_start_seconds) / 60.0;

    LOG("driver.log", "[" << combination_id_ << "] finished: score=" << result.score
                          << " elapsed_minutes=" << result.elapsed_minutes
                          << " deadline_exceeded=" << result.deadline_exceeded << " reactor_failures="
                          << statistics_.n_reactor_failures << " non_finite_candidates="
                          << statistics_.n_non_finite_parameters << "\n");
    return result;
}
