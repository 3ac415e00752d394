#ifndef OPTIMIZATION_RESULT_HPP
#define OPTIMIZATION_RESULT_HPP

#include <sundials/sundials_types.h>

#include <limits>
#include <string>

#include "EigenDataTypes.hpp"

/**
 * @brief Final outcome of the optimization of one rate law combination
 */
struct OptimizationResult {
    std::string combination_id;
    Vector parameters;
    realtype score = std::numeric_limits<realtype>::infinity();
    realtype elapsed_minutes = 0.0;
    bool deadline_exceeded = false;

    int iterations = 0;         // Generations of the global phase
    long int evaluations = 0;   // Objective calls of both phases
    bool refined = false;       // The local phase improved the global result
    bool success = false;       // The global phase converged
    std::string message;
};

#endif  // OPTIMIZATION_RESULT_HPP
