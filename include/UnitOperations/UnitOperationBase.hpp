#ifndef UNIT_OPERATION_BASE_HPP
#define UNIT_OPERATION_BASE_HPP

#include <sundials/sundials_types.h>

#include "EigenDataTypes.hpp"

/// @brief Unit operation types that can be integrated by the Solver
enum class UnitOperationType { Unknown, PlugFlowBed };

/**
 * @brief Abstract base for all ODE systems integrated by the Solver
 *
 * A unit operation owns its initial state y (set before the Solver is constructed) and
 * evaluates dy/dx for the independent variable x of the integration (time, or axial position
 * for steady-state flow reactors). rhs() may throw; the Solver converts exceptions into an
 * unrecoverable failure of the integration.
 */
class UnitOperationBase {
   public:
    UnitOperationBase() = default;
    virtual ~UnitOperationBase() = default;

    virtual UnitOperationType getType() const = 0;
    virtual sunindextype y_size() const = 0;

    virtual void rhs(realtype x, const realtype* y, realtype* dy_dx) const = 0;

    ColVector y;  // Initial state, must have y_size() entries when the Solver is constructed
};

#endif  // UNIT_OPERATION_BASE_HPP
