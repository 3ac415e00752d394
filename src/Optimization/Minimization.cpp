#include "Optimization/Minimization.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

void checkBounds(const Bounds& bounds) {
    if (bounds.empty()) {
        throw std::invalid_argument("Bounds must not be empty");
    }
    for (std::size_t i = 0; i < bounds.size(); ++i) {
        const auto& [lower, upper] = bounds[i];
        if (!std::isfinite(lower) || !std::isfinite(upper) || !(lower < upper)) {
            throw std::invalid_argument("Invalid bounds for dimension " + std::to_string(i) + ": [" +
                                        std::to_string(lower) + ", " + std::to_string(upper) + "]");
        }
    }
}
