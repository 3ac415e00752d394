#include "Objective/ObjectiveEvaluator.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>

#include "ConfigurationError.hpp"
#include "Optimization/Deadline.hpp"
#include "PhysicalConstants.hpp"
#include "Reactions/Species.hpp"

namespace {

realtype relativeSquaredError(realtype model, realtype measured, realtype floor) {
    const realtype e = (model - measured) / std::max(std::abs(measured), floor);
    return e * e;
}

}  // namespace

ObjectiveStrategy parseObjectiveStrategy(const std::string& name) {
    if (name == "partial_pressures") return ObjectiveStrategy::PartialPressures;
    if (name == "formation_rates") return ObjectiveStrategy::FormationRates;
    if (name == "products") return ObjectiveStrategy::Products;
    throw ConfigurationError("Unknown objective '" + name +
                             "' (expected partial_pressures, formation_rates or products)");
}

std::string toString(ObjectiveStrategy strategy) {
    switch (strategy) {
        case ObjectiveStrategy::PartialPressures:
            return "partial_pressures";
        case ObjectiveStrategy::FormationRates:
            return "formation_rates";
        case ObjectiveStrategy::Products:
            return "products";
    }
    return "unknown";
}

ObjectiveEvaluator::ObjectiveEvaluator(const ReactorModelBase& reactor,
                                       const ExperimentalDataset& data,
                                       ObjectiveStrategy strategy,
                                       const Deadline* deadline)
    : reactor_(reactor), data_(data), strategy_(strategy), deadline_(deadline) {
    data_.validate();
}

SpeciesVector ObjectiveEvaluator::inletConcentrations(Eigen::Index run) const {
    return data_.p_in.row(run).transpose() / (constants::gas_constant * data_.T(run));
}

Eigen::Array<realtype, 2, 1> ObjectiveEvaluator::formationRates(Eigen::Index run, const ReactorExit& exit) const {
    const ReactorParameters& rp = reactor_.reactorParameters();
    const realtype A = rp.cross_section_area;

    // Molar flows F = C u A [mol/s]
    const SpeciesVector F_in = inletConcentrations(run) * data_.u_s(run) * A;
    const SpeciesVector F_out = exit.c * exit.u_exit * A;
    const SpeciesVector r = (F_out - F_in) / rp.catalystMass();

    Eigen::Array<realtype, 2, 1> rates;
    rates << r(species::MeOH), r(species::H2O);
    return rates;
}

realtype ObjectiveEvaluator::runError(Eigen::Index run, const ReactorExit& exit) const {
    auto p_meas = data_.p_out.row(run);
    switch (strategy_) {
        case ObjectiveStrategy::PartialPressures:
            return 1.0 * relativeSquaredError(exit.p(species::CO2), p_meas(species::CO2), pressure_denominator_floor) +
                   2.0 * relativeSquaredError(exit.p(species::CO), p_meas(species::CO), pressure_denominator_floor) +
                   3.0 * relativeSquaredError(exit.p(species::H2O), p_meas(species::H2O), pressure_denominator_floor);
        case ObjectiveStrategy::FormationRates: {
            const auto r_model = formationRates(run, exit);
            return 2.0 * relativeSquaredError(r_model(0), data_.r_MeOH(run), rate_denominator_floor) +
                   1.0 * relativeSquaredError(r_model(1), data_.r_H2O(run), rate_denominator_floor);
        }
        case ObjectiveStrategy::Products:
            return 1.0 * relativeSquaredError(exit.p(species::MeOH), p_meas(species::MeOH), pressure_denominator_floor) +
                   2.0 * relativeSquaredError(exit.p(species::H2O), p_meas(species::H2O), pressure_denominator_floor);
    }
    return failure_penalty;
}

realtype ObjectiveEvaluator::evaluate(const Vector& parameters, EvaluationStatistics* statistics) const {
#if LOG_ENABLED
    ++call_count;
#endif
    if (statistics) ++statistics->n_evaluations;

    realtype total = 0.0;
    long int n_failed_runs = 0;
    try {
        for (Eigen::Index run = 0; run < data_.size(); ++run) {
            if (deadline_ && deadline_->expired()) {
                if (statistics) {
                    statistics->deadline_hit = true;
                    ++statistics->n_penalized;
                }
                return failure_penalty;
            }

            if (statistics) ++statistics->n_reactor_runs;
            const auto exit = reactor_.solve(parameters, data_.T(run), data_.u_s(run), inletConcentrations(run));
            if (!exit) {
                if (statistics) ++statistics->n_reactor_failures;
                ++n_failed_runs;
                total += failure_penalty;
                continue;
            }

            const realtype error = runError(run, *exit);
            if (!std::isfinite(error)) {
                ++n_failed_runs;
                total += failure_penalty;
                continue;
            }
            total += error;
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: objective evaluation failed: " << e.what() << std::endl;
        LOG("objective.log", "Evaluation failed with exception: " << e.what() << "\n");
        if (statistics) ++statistics->n_penalized;
        return failure_penalty;
    }

#if LOG_ENABLED
    if (call_count < LOG_FIRST_N_CALLS || call_count % LOG_EVERY_N_CALLS == 0) {
        LOG("objective.log", std::scientific << std::setprecision(6) << "call=" << call_count << "\t\tstrategy="
                                             << toString(strategy_) << "\t\tscore=" << total
                                             << "\t\tfailed_runs=" << n_failed_runs << "/" << data_.size() << "\n");
    }
#endif
    return total;
}

Array ObjectiveEvaluator::exitConditions(const Vector& parameters) const {
    Array p_exit(data_.size(), n_species);
    for (Eigen::Index run = 0; run < data_.size(); ++run) {
        const auto p = reactor_.exitPressures(parameters, data_.T(run), data_.u_s(run), inletConcentrations(run));
        if (p) {
            p_exit.row(run) = p->transpose();
        } else {
            p_exit.row(run).setConstant(std::numeric_limits<realtype>::quiet_NaN());
        }
    }
    return p_exit;
}
