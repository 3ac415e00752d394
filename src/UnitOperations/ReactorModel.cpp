#include "UnitOperations/ReactorModel.hpp"

#include <cmath>
#include <string>

#include "ConfigurationError.hpp"

void ReactorParameters::validate() const {
    auto requirePositive = [](realtype value, const std::string& name) {
        if (!(value > 0.0) || !std::isfinite(value)) {
            throw ConfigurationError("Reactor parameter '" + name + "' must be positive and finite, got " +
                                     std::to_string(value));
        }
    };
    if (!(length >= 0.0) || !std::isfinite(length)) {
        throw ConfigurationError("Reactor parameter 'length' must be non-negative, got " + std::to_string(length));
    }
    requirePositive(catalyst_bulk_density, "catalyst_bulk_density");
    requirePositive(catalyst_volume, "catalyst_volume");
    requirePositive(cross_section_area, "cross_section_area");
    requirePositive(contraction_min, "contraction_bounds[0]");
    requirePositive(contraction_max, "contraction_bounds[1]");
    requirePositive(rate_clip, "rate_clip");
    requirePositive(derivative_clip, "derivative_clip");
    requirePositive(concentration_floor, "concentration_floor");
    requirePositive(pressure_floor, "pressure_floor");
    if (contraction_min > contraction_max) {
        throw ConfigurationError("Reactor parameter 'contraction_bounds' must be ordered [min, max]");
    }
}
