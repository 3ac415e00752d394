#ifndef RESULT_EXCHANGE_HPP
#define RESULT_EXCHANGE_HPP

#include <cstddef>
#include <vector>

#include "Optimization/OptimizationResult.hpp"
#include "Reactions/KineticRates.hpp"

/**
 * @brief Fixed-size double records of OptimizationResult for the collective gather
 *
 * Layout: [combination index, score, elapsed_minutes, deadline_exceeded, success, refined,
 *          iterations, evaluations, 14 parameters]. The message is not transported. A result
 * without parameters is packed with NaN parameters.
 */
namespace result_exchange {

constexpr std::size_t header_size = 8;
constexpr std::size_t record_size = header_size + static_cast<std::size_t>(kinetic_parameters::count);

std::vector<double> pack(const OptimizationResult& result);

// Throws std::invalid_argument if the record has the wrong size or an invalid combination index
OptimizationResult unpack(const double* record, std::size_t size);

// Splits a gathered buffer of n * record_size values into n results
std::vector<OptimizationResult> unpackAll(const std::vector<double>& buffer);

}  // namespace result_exchange

// Orders results by ascending score, non-finite scores last, ties by combination id
std::vector<OptimizationResult> rankResults(std::vector<OptimizationResult> results);

#endif  // RESULT_EXCHANGE_HPP
