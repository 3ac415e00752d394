#ifndef PHYSICAL_CONSTANTS_HPP
#define PHYSICAL_CONSTANTS_HPP

#include <sundials/sundials_types.h>

namespace constants {

// Fundamental constants (SI units)
constexpr realtype gas_constant = 8.314462618;  // J/(mol·K)

// Unit conversions
constexpr realtype pascal_per_bar = 1e5;  // Pa/bar

}  // namespace constants

#endif  // PHYSICAL_CONSTANTS_HPP
