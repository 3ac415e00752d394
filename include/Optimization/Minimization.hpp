#ifndef MINIMIZATION_HPP
#define MINIMIZATION_HPP

#include <sundials/sundials_types.h>

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "EigenDataTypes.hpp"

/// Box bounds [lower, upper], one pair per dimension
using Bounds = std::vector<std::pair<realtype, realtype>>;

/// Scalar function minimized by the optimizers
using ObjectiveFunction = std::function<realtype(const Vector&)>;

// Throws std::invalid_argument unless every pair is finite with lower < upper
void checkBounds(const Bounds& bounds);

/**
 * @brief Outcome of a single minimizer call
 */
struct MinimizationResult {
    Vector x;
    realtype fun = 0.0;
    int iterations = 0;
    long int evaluations = 0;
    bool success = false;
    std::string message;
};

#endif  // MINIMIZATION_HPP
