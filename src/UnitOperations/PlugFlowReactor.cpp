#include "UnitOperations/PlugFlowReactor.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "Logger.hpp"
#include "PhysicalConstants.hpp"
#include "Reactions/Species.hpp"

namespace {

// Stoichiometric coefficients, one row per reaction, columns ordered as in species::
// MeOH synthesis:  CO2 + 3 H2 -> MeOH + H2O   (-2 mol gas)
// RWGS:            CO2 +   H2 -> CO + H2O     (mole neutral)
// MeOH from CO:    CO  + 2 H2 -> MeOH         (-2 mol gas)
const Eigen::Matrix<realtype, n_reactions, n_species, Eigen::RowMajor> stoichiometry =
    (Eigen::Matrix<realtype, n_reactions, n_species, Eigen::RowMajor>() <<  //
         -1.0, 0.0, -3.0, 1.0, 1.0,                                         //
     -1.0, 1.0, -1.0, 0.0, 1.0,                                             //
     0.0, -1.0, -2.0, 1.0, 0.0)
        .finished();

}  // namespace

PlugFlowBed::PlugFlowBed(const KineticRateEvaluator& rateEvaluator,
                         const ReactorParameters& reactorParameters,
                         const Vector& parameters,
                         realtype T,
                         realtype u_inlet,
                         const SpeciesVector& c_inlet)
    : rateEvaluator(rateEvaluator),
      reactorParameters(reactorParameters),
      parameters(parameters),
      T(T),
      u_inlet(u_inlet) {
    const SpeciesVector c_floored = c_inlet.cwiseMax(reactorParameters.concentration_floor);
    c_total_inlet = c_floored.sum();
    y = c_floored;
}

SpeciesVector PlugFlowBed::speciesRates(const ReactionRates& r) {
    return (stoichiometry.transpose() * r.matrix()).array();
}

realtype PlugFlowBed::contractionFactor(const SpeciesVector& c) const {
    const realtype c_total = std::max(c.sum(), reactorParameters.concentration_floor);
    return std::clamp(c_total_inlet / c_total, reactorParameters.contraction_min, reactorParameters.contraction_max);
}

ReactorExit PlugFlowBed::exitState(const SpeciesVector& c) const {
    ReactorExit exit;
    exit.c = c.cwiseMax(reactorParameters.concentration_floor);
    exit.p = exit.c * (constants::gas_constant * T);
    exit.contraction_factor = contractionFactor(exit.c);
    exit.u_exit = u_inlet * exit.contraction_factor;
    return exit;
}

void PlugFlowBed::rhs(realtype z, const realtype* y, realtype* dy_dz) const {
    ConstSpeciesVectorMap c_raw(y);
    SpeciesVectorMap dc_dz(dy_dz);

    const SpeciesVector c = c_raw.cwiseMax(reactorParameters.concentration_floor);

    // Partial pressures in bar for the rate expressions
    const SpeciesVector p_bar =
        (c * (constants::gas_constant * T)).cwiseMax(reactorParameters.pressure_floor) / constants::pascal_per_bar;

    const ReactionRates r = rateEvaluator(parameters, T, p_bar);

    const realtype u = u_inlet * contractionFactor(c);

    dc_dz = (reactorParameters.catalyst_bulk_density * speciesRates(r) / u)
                .cwiseMax(-reactorParameters.derivative_clip)
                .cwiseMin(reactorParameters.derivative_clip);
}

PlugFlowReactor::PlugFlowReactor(const RateLawCombination& combination,
                                 const ReactorParameters& reactorParameters,
                                 const SolverSettings& solverSettings,
                                 realtype max_step_divisor)
    : rateEvaluator_(combination, reactorParameters.rate_clip),
      reactorParameters_(reactorParameters),
      solverSettings_(solverSettings) {
    reactorParameters_.validate();
    if (!(max_step_divisor > 0.0)) {
        throw std::invalid_argument("max_step_divisor must be positive, got " + std::to_string(max_step_divisor));
    }
    if (reactorParameters_.length > 0.0) {
        solverSettings_.max_step = reactorParameters_.length / max_step_divisor;
    }
}

std::optional<ReactorExit> PlugFlowReactor::solve(const Vector& parameters,
                                                  realtype T,
                                                  realtype u_inlet,
                                                  const SpeciesVector& c_inlet) const {
#if LOG_ENABLED
    ++call_count;
#endif
    try {
        if (!(T > 0.0) || !(u_inlet > 0.0)) {
            throw std::invalid_argument("Temperature and inlet velocity must be positive (T = " + std::to_string(T) +
                                        ", u = " + std::to_string(u_inlet) + ")");
        }

        PlugFlowBed bed(rateEvaluator_, reactorParameters_, parameters, T, u_inlet, c_inlet);

        // No residence time: nothing reacts
        if (reactorParameters_.length <= 0.0) {
            return bed.exitState(bed.y);
        }

        Solver solver(bed, solverSettings_);
        realtype t_solve = 0.0;
        BENCHMARK(t_solve, { solver.solve(reactorParameters_.length, solverSettings_.max_solve_seconds); });

        const std::vector<realtype> y_exit = solver.getY();
        ReactorExit exit = bed.exitState(ConstSpeciesVectorMap(y_exit.data()));
        if (!exit.p.allFinite()) {
            throw std::runtime_error("Exit state is not finite");
        }

#if BENCHMARK_ENABLED
        if (call_count < LOG_FIRST_N_CALLS || call_count % LOG_EVERY_N_CALLS == 0) {
            LOG_BENCHMARK("reactor_solve.log", std::scientific << std::setprecision(6) << "call=" << call_count
                                                               << "\t\tn_steps=" << solver.getNumSteps()
                                                               << "\t\tt_solve=" << t_solve << "\n");
        }
#endif
        return exit;
    } catch (const std::exception& e) {
#if LOG_ENABLED
        ++failure_count;
        if (failure_count < LOG_FIRST_N_CALLS || failure_count % LOG_EVERY_N_CALLS == 0) {
            std::ostringstream oss;
            oss.precision(6);
            oss << std::scientific;
            oss << "Reactor failure No. " << failure_count << " (call " << call_count << ", combination "
                << rateEvaluator_.combination().id() << ") at T = " << T << " K, u = " << u_inlet
                << " m/s, c_in = [" << c_inlet.transpose() << "]: " << e.what() << "\n";
            oss << "  parameters = [" << parameters.transpose() << "]\n";
            LOG("reactor_failures.log", oss.str());
        }
#endif
        return std::nullopt;
    }
}
