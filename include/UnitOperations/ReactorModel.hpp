#ifndef REACTOR_MODEL_HPP
#define REACTOR_MODEL_HPP

#include <sundials/sundials_types.h>

#include <optional>

#include "EigenDataTypes.hpp"

/**
 * @brief Geometry, catalyst and stabilization constants of the packed-bed reactor
 *
 * The clip and contraction bounds are empirical stabilization choices and are kept
 * configurable rather than derived.
 */
struct ReactorParameters {
    realtype length = 0.06;                   // Catalyst bed length [m]
    realtype catalyst_bulk_density = 1100.0;  // [kg/m^3]
    realtype catalyst_volume = 3.0e-6;        // [m^3]
    realtype cross_section_area = 5.0e-5;     // [m^2]

    realtype contraction_min = 0.1;   // Lower bound of the velocity correction factor
    realtype contraction_max = 10.0;  // Upper bound of the velocity correction factor
    realtype rate_clip = 1e6;         // |r| bound [mol/(s·kg_cat)]
    realtype derivative_clip = 1e7;   // |dC/dz| bound [mol/m^4]

    realtype concentration_floor = 1e-20;  // [mol/m^3]
    realtype pressure_floor = 1e-20;       // [Pa]

    realtype catalystMass() const { return catalyst_bulk_density * catalyst_volume; }

    // Throws ConfigurationError if a value is not physically meaningful
    void validate() const;
};

/**
 * @brief Reactor outlet of one operating point
 */
struct ReactorExit {
    SpeciesVector c;                    // Exit concentrations [mol/m^3], floored
    SpeciesVector p;                    // Exit partial pressures [Pa]
    realtype contraction_factor = 1.0;  // u_exit / u_inlet
    realtype u_exit = 0.0;              // Corrected exit superficial velocity [m/s]
};

/**
 * @brief Abstract reactor seen by the objective evaluator
 *
 * solve() returns std::nullopt if no exit condition is available (integration failure).
 * It never returns a degraded state.
 */
class ReactorModelBase {
   public:
    virtual ~ReactorModelBase() = default;

    // Extended variant: exit state including contraction factor and exit velocity
    virtual std::optional<ReactorExit> solve(const Vector& parameters,
                                             realtype T,
                                             realtype u_inlet,
                                             const SpeciesVector& c_inlet) const = 0;

    // Basic variant: exit partial pressures [Pa] only
    std::optional<SpeciesVector> exitPressures(const Vector& parameters,
                                               realtype T,
                                               realtype u_inlet,
                                               const SpeciesVector& c_inlet) const {
        auto exit = solve(parameters, T, u_inlet, c_inlet);
        if (!exit) return std::nullopt;
        return exit->p;
    }

    virtual const ReactorParameters& reactorParameters() const = 0;
};

#endif  // REACTOR_MODEL_HPP
