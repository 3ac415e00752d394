#ifndef OPTIMIZATION_DRIVER_HPP
#define OPTIMIZATION_DRIVER_HPP

#include <sundials/sundials_types.h>

#include <limits>
#include <string>

#include "EigenDataTypes.hpp"
#include "IO/ExperimentalData.hpp"
#include "Objective/ObjectiveEvaluator.hpp"
#include "Optimization/Deadline.hpp"
#include "Optimization/DifferentialEvolution.hpp"
#include "Optimization/NelderMead.hpp"
#include "Optimization/OptimizationResult.hpp"
#include "UnitOperations/ReactorModel.hpp"

struct LocalRefinementSettings {
    bool enabled = true;
    NelderMeadSettings nelder_mead;
};

struct OptimizationSettings {
    ObjectiveStrategy objective = ObjectiveStrategy::PartialPressures;
    realtype time_budget_seconds = std::numeric_limits<realtype>::infinity();

    DifferentialEvolutionSettings global;
    LocalRefinementSettings local_refinement;

    Bounds bounds;  // Empty: defaultParameterBounds()

    int progress_every_iterations = 10;
    realtype progress_every_seconds = 600.0;

    realtype magnitude_limit = 1e12;          // |p| above which the magnitude penalty applies
    realtype magnitude_penalty_factor = 1.0;  // Penalty per unit of |p| above magnitude_limit

    // Throws ConfigurationError naming the offending field
    void validate() const;
};

/**
 * @brief Global-then-local parameter search for one rate law combination
 *
 * Phase 1 runs differential evolution over the parameter bounds. After every generation the
 * shared deadline is checked, and every progress_every_iterations generations (or after
 * progress_every_seconds) a progress line is reported. Phase 2 refines the best member with
 * Nelder-Mead if phase 1 converged and the deadline has not passed; the refined point is kept
 * only if strictly better.
 *
 * run() never throws. Unexpected errors produce a result with infinite score.
 */
class OptimizationDriver {
   public:
    static constexpr realtype non_finite_penalty = ObjectiveEvaluator::failure_penalty;

    OptimizationDriver(const ReactorModelBase& reactor,
                       const ExperimentalDataset& data,
                       const std::string& combination_id,
                       const OptimizationSettings& settings,
                       const Deadline& deadline);

    OptimizationResult run();

    // Guarded objective seen by both phases
    realtype penalizedObjective(const Vector& parameters);

    const EvaluationStatistics& statistics() const { return statistics_; }
    const ObjectiveEvaluator& objective() const { return evaluator_; }
    const Bounds& bounds() const { return bounds_; }

   private:
    bool reportProgress(const DifferentialEvolutionProgress& progress);

    const std::string combination_id_;
    const OptimizationSettings settings_;
    const Deadline& deadline_;
    const Bounds bounds_;
    ObjectiveEvaluator evaluator_;

    EvaluationStatistics statistics_;
    realtype run_start_seconds = 0.0;
    realtype last_report_seconds = 0.0;
    bool deadline_exceeded = false;
};

#endif  // OPTIMIZATION_DRIVER_HPP
