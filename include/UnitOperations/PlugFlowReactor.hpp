#ifndef PLUG_FLOW_REACTOR_HPP
#define PLUG_FLOW_REACTOR_HPP

#include <sundials/sundials_types.h>

#include <optional>

#include "EigenDataTypes.hpp"
#include "Reactions/KineticRates.hpp"
#include "Solver.hpp"
#include "UnitOperations/ReactorModel.hpp"
#include "UnitOperations/UnitOperationBase.hpp"

/**
 * @brief Isothermal steady-state packed bed discretized by the integrator along z
 *
 * State is the concentration vector [CO2, CO, H2, MeOH, H2O] in mol/m^3. At every z the
 * concentrations are floored, converted to bar, passed to the rate evaluator and turned into
 *   dC/dz = rho_b * (nu^T r) / u(z)
 * with u(z) = u_inlet * clip(C_tot,inlet / C_tot(z), contraction_min, contraction_max).
 */
class PlugFlowBed : public UnitOperationBase {
   public:
    PlugFlowBed(const KineticRateEvaluator& rateEvaluator,
                const ReactorParameters& reactorParameters,
                const Vector& parameters,
                realtype T,
                realtype u_inlet,
                const SpeciesVector& c_inlet);

    UnitOperationType getType() const override { return UnitOperationType::PlugFlowBed; }
    sunindextype y_size() const override { return n_species; }

    void rhs(realtype z, const realtype* y, realtype* dy_dz) const override;

    // Velocity correction factor for a (floored) concentration state
    realtype contractionFactor(const SpeciesVector& c) const;

    // Floored concentrations, partial pressures and velocity at the given state
    ReactorExit exitState(const SpeciesVector& c) const;

    // Net formation rates of all species [mol/(s·kg_cat)] from the three reaction rates
    static SpeciesVector speciesRates(const ReactionRates& r);

   private:
    const KineticRateEvaluator& rateEvaluator;
    const ReactorParameters& reactorParameters;
    const Vector& parameters;
    const realtype T;
    const realtype u_inlet;
    realtype c_total_inlet;
};

/**
 * @brief Reactor integrator of one rate law combination
 *
 * Solves the plug flow IVP over [0, length] with CVODE BDF (rtol 1e-6, atol 1e-8 by default)
 * and a maximum step of length / max_step_divisor. Failures are logged and reported as
 * std::nullopt. A non-positive length returns the inlet state unchanged.
 */
class PlugFlowReactor : public ReactorModelBase {
   public:
    static constexpr realtype default_max_step_divisor = 15.0;

    PlugFlowReactor(const RateLawCombination& combination,
                    const ReactorParameters& reactorParameters,
                    const SolverSettings& solverSettings = SolverSettings(),
                    realtype max_step_divisor = default_max_step_divisor);

    std::optional<ReactorExit> solve(const Vector& parameters,
                                     realtype T,
                                     realtype u_inlet,
                                     const SpeciesVector& c_inlet) const override;

    const ReactorParameters& reactorParameters() const override { return reactorParameters_; }
    const KineticRateEvaluator& rateEvaluator() const { return rateEvaluator_; }
    const SolverSettings& solverSettings() const { return solverSettings_; }

   private:
    const KineticRateEvaluator rateEvaluator_;
    const ReactorParameters reactorParameters_;
    SolverSettings solverSettings_;

#if LOG_ENABLED
    mutable long int call_count = 0;
    mutable long int failure_count = 0;
#endif
};

#endif  // PLUG_FLOW_REACTOR_HPP
