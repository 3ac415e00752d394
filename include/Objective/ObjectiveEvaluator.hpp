#ifndef OBJECTIVE_EVALUATOR_HPP
#define OBJECTIVE_EVALUATOR_HPP

#include <sundials/sundials_types.h>

#include <string>

#include "EigenDataTypes.hpp"
#include "IO/ExperimentalData.hpp"
#include "Logger.hpp"
#include "UnitOperations/ReactorModel.hpp"

class Deadline;

/// @brief Residual definitions comparing the reactor model with the measurements
enum class ObjectiveStrategy {
    PartialPressures,  // exit CO2, CO, H2O pressures, weights 1, 2, 3
    FormationRates,    // MeOH and H2O formation rates from the flow balance, weights 2, 1
    Products,          // exit MeOH and H2O pressures, weights 1, 2
};

// Accepts "partial_pressures", "formation_rates" and "products"; throws ConfigurationError otherwise
ObjectiveStrategy parseObjectiveStrategy(const std::string& name);
std::string toString(ObjectiveStrategy strategy);

/**
 * @brief Counters of one optimization run, owned by the caller and updated by the evaluator
 */
struct EvaluationStatistics {
    long int n_non_finite_parameters = 0;  // Candidates rejected before evaluation
    long int n_evaluations = 0;       // Full objective evaluations started
    long int n_reactor_runs = 0;      // Reactor integrations requested
    long int n_reactor_failures = 0;  // Integrations that produced no exit condition
    long int n_penalized = 0;         // Evaluations answered with the failure penalty as a whole
    bool deadline_hit = false;        // An evaluation was cut short by the deadline
};

/**
 * @brief Scalar loss of a parameter vector over all experimental runs
 *
 * For every run the inlet pressures are converted to concentrations, the reactor is solved
 * and the relative squared error of the selected strategy is added. A run without exit
 * condition contributes failure_penalty. The deadline (if any) is polled before every run;
 * once it has expired the evaluation is abandoned and failure_penalty is returned. Any other
 * exception escaping a run is absorbed into failure_penalty for the whole evaluation.
 */
class ObjectiveEvaluator {
   public:
    static constexpr realtype failure_penalty = 1e10;
    static constexpr realtype pressure_denominator_floor = 1.0;  // [Pa]
    static constexpr realtype rate_denominator_floor = 1e-10;    // [mol/(s·kg_cat)]

    ObjectiveEvaluator(const ReactorModelBase& reactor,
                       const ExperimentalDataset& data,
                       ObjectiveStrategy strategy,
                       const Deadline* deadline = nullptr);

    realtype evaluate(const Vector& parameters, EvaluationStatistics* statistics = nullptr) const;
    realtype operator()(const Vector& parameters, EvaluationStatistics* statistics = nullptr) const {
        return evaluate(parameters, statistics);
    }

    // Weighted relative squared error of a single run given the model exit
    realtype runError(Eigen::Index run, const ReactorExit& exit) const;

    // Model formation rates [r_MeOH, r_H2O] of a single run from the inlet/exit flow balance
    Eigen::Array<realtype, 2, 1> formationRates(Eigen::Index run, const ReactorExit& exit) const;

    // Model exit partial pressures [Pa] of every run (n_runs x 5), NaN rows where the reactor failed
    Array exitConditions(const Vector& parameters) const;

    // Inlet concentrations [mol/m^3] of a run
    SpeciesVector inletConcentrations(Eigen::Index run) const;

    ObjectiveStrategy strategy() const { return strategy_; }
    const ExperimentalDataset& data() const { return data_; }
    const ReactorModelBase& reactor() const { return reactor_; }

   private:
    const ReactorModelBase& reactor_;
    const ExperimentalDataset& data_;
    const ObjectiveStrategy strategy_;
    const Deadline* deadline_;

#if LOG_ENABLED
    mutable long int call_count = 0;
#endif
};

#endif  // OBJECTIVE_EVALUATOR_HPP
