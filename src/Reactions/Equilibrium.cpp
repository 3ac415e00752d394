#include "Reactions/Equilibrium.hpp"

#include <cmath>

namespace {

// ln(10) * (5139, -12.621) and ln(10) * (-2073, 2.029) from the log10 correlations of Graaf et al.
constexpr realtype c1_MeOHfromCO = 11833.0;
constexpr realtype c2_MeOHfromCO = -29.061;
constexpr realtype c1_RWGS = -4773.3;
constexpr realtype c2_RWGS = 4.672;

}  // namespace

realtype equilibriumMeOHfromCO(realtype T) { return std::exp(c1_MeOHfromCO / T + c2_MeOHfromCO); }

realtype equilibriumRWGS(realtype T) { return std::exp(c1_RWGS / T + c2_RWGS); }

realtype equilibriumMeOHDirect(realtype T) { return equilibriumMeOHfromCO(T) * equilibriumRWGS(T); }
