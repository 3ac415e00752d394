#include <nvector/nvector_serial.h>
#include <sundials/sundials_nvector.h>
#include <sundials/sundials_types.h>

#include <cmath>
#include <exception>

#include "Logger.hpp"
#include "Solver.hpp"
#include "UnitOperations/UnitOperationBase.hpp"

int Solver::rhs(realtype x, N_Vector y_sundials, N_Vector dy_dx_sundials, void* user_data) {
    // CAREFUL: This function is static, so it cannot access non-static members directly.
    // Exceptions must not cross the C boundary of CVODE; they are stored and reported after CVode returns.

    Solver* solver = static_cast<Solver*>(user_data);
    const realtype* y = N_VGetArrayPointer(y_sundials);
    realtype* dy_dx = N_VGetArrayPointer(dy_dx_sundials);

    try {
        solver->unitOperation.rhs(x, y, dy_dx);
    } catch (const std::exception& e) {
        solver->rhs_error = e.what();
        return -1;  // unrecoverable
    }

    // NaN or Inf: ask CVODE to retry with a smaller step
    for (sunindextype i = 0; i < solver->ySize; ++i) {
        if (!std::isfinite(dy_dx[i])) {
            solver->rhs_error = "dy_dx contains NaN or Inf at x = " + std::to_string(x);
            return 1;  // recoverable
        }
    }

    return 0;
}
