#ifndef KINETIC_RATES_HPP
#define KINETIC_RATES_HPP

#include <sundials/sundials_types.h>

#include <array>
#include <string>
#include <utility>
#include <vector>

#include "EigenDataTypes.hpp"
#include "Reactions/RateLaws.hpp"

/// @brief Positions in the 14-element kinetic parameter vector
namespace kinetic_parameters {
enum : Eigen::Index {
    // Arrhenius pre-exponential factors [mol/(s·kg_cat·bar^n)]
    A_MeOHSynthesis = 0,
    A_RWGS = 1,
    A_MeOHfromCO = 2,
    // Activation energies [J/mol]
    Ea_MeOHSynthesis = 3,
    Ea_RWGS = 4,
    Ea_MeOHfromCO = 5,
    // Van't Hoff adsorption pre-exponential factors [1/bar] (H2O: [1/bar^0.5] relative to H2)
    A_K_CO = 6,
    A_K_CO2 = 7,
    A_K_H2O = 8,
    A_K_H2 = 9,
    // Adsorption enthalpies [J/mol], negative for exothermic adsorption
    dH_CO = 10,
    dH_CO2 = 11,
    dH_H2O = 12,
    dH_H2 = 13,
};
constexpr Eigen::Index count = 14;

inline const std::array<std::string, count> names = {
    "A_MeOH", "A_RWGS", "A_MeOH_CO", "Ea_MeOH", "Ea_RWGS", "Ea_MeOH_CO", "A_K_CO",
    "A_K_CO2", "A_K_H2O", "A_K_H2", "dH_CO", "dH_CO2", "dH_H2O", "dH_H2"};
}  // namespace kinetic_parameters

/// Literature values (Graaf et al.) used as starting guess and reference point
Vector literatureParameters();

/// Box bounds [lower, upper] of every parameter as searched by the global optimizer
std::vector<std::pair<realtype, realtype>> defaultParameterBounds();

/**
 * @brief Evaluates the three net reaction rates of one rate law combination
 *
 * Rate constants follow Arrhenius (k = A exp(-Ea/RT)), adsorption constants van't Hoff
 * (K = A exp(-dH/RT)). All three rates share the adsorption-inhibition denominator
 *   (1 + K_CO P_CO + K_CO2 P_CO2) (sqrt(P_H2) + K_H2O P_H2O)
 * Partial pressures are expected in bar, rates are returned in mol/(s·kg_cat) and clipped
 * to ±rate_clip.
 *
 * Throws std::invalid_argument for parameter vectors of wrong size or with non-finite entries
 * and std::domain_error if a rate is not finite. Callers that search the parameter space are
 * responsible for turning these into penalty values.
 */
class KineticRateEvaluator {
   public:
    static constexpr realtype default_rate_clip = 1e6;
    static constexpr realtype equilibrium_floor = 1e-10;
    static constexpr realtype denominator_floor = 1e-10;
    static constexpr realtype hydrogen_floor = 1e-10;

    explicit KineticRateEvaluator(const RateLawCombination& combination, realtype rate_clip = default_rate_clip);

    ReactionRates operator()(const Vector& parameters, realtype T, const SpeciesVector& p_bar) const;

    // Vectorized over experimental points: T has one entry per row of p_bar (n_points x 5),
    // the result is n_points x 3
    Array operator()(const Vector& parameters, const ColVector& T, const Array& p_bar) const;

    static void checkParameters(const Vector& parameters);

    const RateLawCombination& combination() const { return combination_; }
    realtype rateClip() const { return rate_clip; }

   private:
    const RateLawCombination combination_;
    const realtype rate_clip;
};

#endif  // KINETIC_RATES_HPP
