#ifndef SPECIES_HPP
#define SPECIES_HPP

#include <array>
#include <string>

#include "EigenDataTypes.hpp"

/// @brief Column/row positions of the gas phase species in every SpeciesVector
namespace species {
enum : Eigen::Index { CO2 = 0, CO = 1, H2 = 2, MeOH = 3, H2O = 4 };

inline const std::array<std::string, n_species> names = {"CO2", "CO", "H2", "MeOH", "H2O"};
}  // namespace species

/// @brief Row positions of the three modelled reactions in every ReactionRates vector
namespace reactions {
enum : Eigen::Index { MeOHSynthesis = 0, RWGS = 1, MeOHfromCO = 2 };

inline const std::array<std::string, n_reactions> names = {"MeOH synthesis", "RWGS", "MeOH from CO"};
}  // namespace reactions

#endif  // SPECIES_HPP
