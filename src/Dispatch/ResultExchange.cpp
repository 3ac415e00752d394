#include "Dispatch/ResultExchange.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "Reactions/RateLaws.hpp"

namespace result_exchange {

std::vector<double> pack(const OptimizationResult& result) {
    std::vector<double> record(record_size, std::numeric_limits<double>::quiet_NaN());
    record[0] = static_cast<double>(RateLawCombination::fromId(result.combination_id).index());
    record[1] = result.score;
    record[2] = result.elapsed_minutes;
    record[3] = result.deadline_exceeded ? 1.0 : 0.0;
    record[4] = result.success ? 1.0 : 0.0;
    record[5] = result.refined ? 1.0 : 0.0;
    record[6] = static_cast<double>(result.iterations);
    record[7] = static_cast<double>(result.evaluations);
    if (result.parameters.size() == kinetic_parameters::count) {
        std::copy(result.parameters.data(), result.parameters.data() + kinetic_parameters::count,
                  record.begin() + header_size);
    }
    return record;
}

OptimizationResult unpack(const double* record, std::size_t size) {
    if (size != record_size) {
        throw std::invalid_argument("Result record has " + std::to_string(size) + " values, expected " +
                                    std::to_string(record_size));
    }
    const double index = record[0];
    if (!(index >= 0.0) || index >= static_cast<double>(RateLawCombination::count) || index != std::floor(index)) {
        throw std::invalid_argument("Result record has invalid combination index " + std::to_string(index));
    }

    OptimizationResult result;
    result.combination_id = RateLawCombination::fromIndex(static_cast<std::size_t>(index)).id();
    result.score = record[1];
    result.elapsed_minutes = record[2];
    result.deadline_exceeded = record[3] != 0.0;
    result.success = record[4] != 0.0;
    result.refined = record[5] != 0.0;
    result.iterations = static_cast<int>(record[6]);
    result.evaluations = static_cast<long int>(record[7]);
    result.parameters = Eigen::Map<const Vector>(record + header_size, kinetic_parameters::count);
    return result;
}

std::vector<OptimizationResult> unpackAll(const std::vector<double>& buffer) {
    if (buffer.size() % record_size != 0) {
        throw std::invalid_argument("Gathered buffer size " + std::to_string(buffer.size()) +
                                    " is not a multiple of the record size");
    }
    std::vector<OptimizationResult> results;
    results.reserve(buffer.size() / record_size);
    for (std::size_t offset = 0; offset < buffer.size(); offset += record_size) {
        results.push_back(unpack(buffer.data() + offset, record_size));
    }
    return results;
}

}  // namespace result_exchange

std::vector<OptimizationResult> rankResults(std::vector<OptimizationResult> results) {
    std::stable_sort(results.begin(), results.end(), [](const OptimizationResult& a, const OptimizationResult& b) {
        const bool a_finite = std::isfinite(a.score);
        const bool b_finite = std::isfinite(b.score);
        if (a_finite != b_finite) return a_finite;
        if (a_finite && a.score != b.score) return a.score < b.score;
        return a.combination_id < b.combination_id;
    });
    return results;
}
