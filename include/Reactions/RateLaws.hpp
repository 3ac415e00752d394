#ifndef RATE_LAWS_HPP
#define RATE_LAWS_HPP

#include <sundials/sundials_types.h>

#include <cstddef>
#include <string>
#include <vector>

#include "EigenDataTypes.hpp"

/// @brief Numerator forms of CO2 + 3 H2 <-> CH3OH + H2O, named by the exponent on the H2 pressure
enum class MeOHSynthesisForm { H2_1_0 = 1, H2_1_5 = 2, H2_2_0 = 3, H2_2_5 = 4 };

/// @brief Numerator forms of CO2 + H2 <-> CO + H2O
enum class RWGSForm { H2_0_5 = 1, H2_1_0 = 2 };

/// @brief Numerator forms of CO + 2 H2 <-> CH3OH
enum class MeOHfromCOForm { H2_0_5 = 1, H2_1_0 = 2, H2_1_5 = 3 };

realtype hydrogenExponent(MeOHSynthesisForm form);
realtype hydrogenExponent(RWGSForm form);
realtype hydrogenExponent(MeOHfromCOForm form);

// Driving forces. p holds partial pressures in bar ordered as in species::, K is the equilibrium
// constant of the respective reaction. The H2 exponent multiplies both legs, so every form
// vanishes at chemical equilibrium.

/** \brief P_CO2 P_H2^a - P_MeOH P_H2O / (P_H2^(3-a) K) */
realtype drivingForceMeOHSynthesis(MeOHSynthesisForm form, const SpeciesVector& p, realtype K);

/** \brief P_CO2 P_H2^b - P_CO P_H2O / (P_H2^(1-b) K) */
realtype drivingForceRWGS(RWGSForm form, const SpeciesVector& p, realtype K);

/** \brief P_CO P_H2^c - P_MeOH / (P_H2^(2-c) K) */
realtype drivingForceMeOHfromCO(MeOHfromCOForm form, const SpeciesVector& p, realtype K);

/**
 * @brief One choice of numerator form for each of the three reactions
 *
 * Immutable value identified by "i_j_k" (i in 1..4, j in 1..2, k in 1..3) or by a flat
 * index in [0, 24). All 24 combinations are enumerated by all(); ids and indices outside
 * the enumeration are rejected with a ConfigurationError.
 */
class RateLawCombination {
   public:
    static constexpr std::size_t count = 24;

    RateLawCombination(MeOHSynthesisForm meohSynthesis, RWGSForm rwgs, MeOHfromCOForm meohFromCO);

    static RateLawCombination fromId(const std::string& id);
    static RateLawCombination fromIndex(std::size_t index);
    static const std::vector<RateLawCombination>& all();

    const std::string& id() const { return id_; }
    std::size_t index() const;

    MeOHSynthesisForm meohSynthesisForm() const { return meohSynthesis_; }
    RWGSForm rwgsForm() const { return rwgs_; }
    MeOHfromCOForm meohFromCOForm() const { return meohFromCO_; }

    // Returns [DF_MeOHSynthesis, DF_RWGS, DF_MeOHfromCO]
    ReactionRates drivingForces(const SpeciesVector& p,
                                realtype K_MeOHSynthesis,
                                realtype K_RWGS,
                                realtype K_MeOHfromCO) const;

    bool operator==(const RateLawCombination& other) const { return id_ == other.id_; }

   private:
    MeOHSynthesisForm meohSynthesis_;
    RWGSForm rwgs_;
    MeOHfromCOForm meohFromCO_;
    std::string id_;
};

#endif  // RATE_LAWS_HPP
