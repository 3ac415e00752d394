#ifndef EQUILIBRIUM_HPP
#define EQUILIBRIUM_HPP

#include <sundials/sundials_types.h>

/**
 * @brief Temperature dependent equilibrium constants (pressures in bar)
 *
 * Each constant has the form K(T) = exp(c1 / T + c2). T must be positive; this is not checked.
 */

/// CO + 2 H2 <-> CH3OH, K in bar^-2
realtype equilibriumMeOHfromCO(realtype T);

/// CO2 + H2 <-> CO + H2O, dimensionless
realtype equilibriumRWGS(realtype T);

/// CO2 + 3 H2 <-> CH3OH + H2O, K in bar^-2. Defined as the product of the two constants above.
realtype equilibriumMeOHDirect(realtype T);

#endif  // EQUILIBRIUM_HPP
