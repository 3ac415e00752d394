#include <cvode/cvode.h>
#include <nvector/nvector_serial.h>
#include <sundials/sundials_nvector.h>
#include <sundials/sundials_types.h>
#include <sunlinsol/sunlinsol_dense.h>
#include <sunmatrix/sunmatrix_dense.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>

#include "EigenDataTypes.hpp"
#include "Logger.hpp"
#include "Solver.hpp"
#include "UnitOperations/UnitOperationBase.hpp"

namespace {

// Frees all Sundials objects that were created so far; safe to call with partially constructed state
void freeSundialsObjects(void*& solver_memory,
                         N_Vector& y,
                         N_Vector& constraints,
                         SUNMatrix& J,
                         SUNLinearSolver& lin_sol,
                         SUNNonlinearSolver& nls,
                         SUNContext& sunctx) {
    if (solver_memory) CVodeFree(&solver_memory);
    if (y) N_VDestroy(y);
    if (constraints) N_VDestroy(constraints);
    if (J) SUNMatDestroy(J);
    if (lin_sol) SUNLinSolFree(lin_sol);
    if (nls) SUNNonlinSolFree(nls);
    if (sunctx) SUNContext_Free(&sunctx);
    solver_memory = nullptr;
    y = nullptr;
    constraints = nullptr;
    J = nullptr;
    lin_sol = nullptr;
    nls = nullptr;
    sunctx = nullptr;
}

}  // namespace

Solver::Solver(const UnitOperationBase& unitOperation, const SolverSettings& settings)
    : unitOperation(unitOperation), settings(settings), x(0.0), ySize(unitOperation.y_size()) {
    if (ySize <= 0) {
        throw std::invalid_argument("Unit operation has no state to integrate.");
    }
    if (unitOperation.y.size() != ySize) {
        throw std::runtime_error("Unit operation y vector size (" + std::to_string(unitOperation.y.size()) +
                                 ") does not match expected size (" + std::to_string(ySize) + ").");
    }

    try {
        // Create Sundials context (must be first)
        int flag = SUNContext_Create(nullptr, &sunctx);
        CHECK_SUNDIALS_FLAG(flag, "SUNContext_Create");

        // Allocate solution vector and copy the initial state
        y = N_VNew_Serial(ySize, sunctx);
        if (!y) {
            throw std::runtime_error("Failed to allocate N_Vector y");
        }
        realtype* y_data = N_VGetArrayPointer(y);
        std::copy(unitOperation.y.data(), unitOperation.y.data() + ySize, y_data);

        if (settings.type == SolverType::BDF) {
            solver_memory = CVodeCreate(CV_BDF, sunctx);
            if (!solver_memory) {
                throw std::runtime_error("Failed to create CVODE BDF solver");
            }
        } else if (settings.type == SolverType::ADAMS) {
            solver_memory = CVodeCreate(CV_ADAMS, sunctx);
            if (!solver_memory) {
                throw std::runtime_error("Failed to create CVODE ADAMS solver");
            }
        } else {
            throw std::invalid_argument("Unsupported SolverType");
        }

        // Initialize CVODE memory with RHS function and initial conditions
        flag = CVodeInit(solver_memory, rhs, x, y);
        CHECK_SUNDIALS_FLAG(flag, "CVodeInit");

        // Specify scalar tolerances
        flag = CVodeSStolerances(solver_memory, settings.reltol, settings.abstol);
        CHECK_SUNDIALS_FLAG(flag, "CVodeSStolerances");

        if (settings.use_sundials_non_negative_constraint) {
            constraints = N_VNew_Serial(ySize, sunctx);
            if (!constraints) {
                throw std::runtime_error("Failed to allocate N_Vector constraints");
            }
            // 1.0 => enforce y[i] >= 0.0
            N_VConst(1.0, constraints);
            flag = CVodeSetConstraints(solver_memory, constraints);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetConstraints");
        }

        if (settings.type == SolverType::BDF) {
            // BDF: Newton iteration with a dense direct linear solver, Jacobian by finite differences
            J = SUNDenseMatrix(ySize, ySize, sunctx);
            if (!J) {
                throw std::runtime_error("Failed to create SUNDenseMatrix J");
            }
            lin_sol = SUNLinSol_Dense(y, J, sunctx);
            if (!lin_sol) {
                throw std::runtime_error("Failed to create SUNLinSol_Dense linear solver");
            }
            flag = CVodeSetLinearSolver(solver_memory, lin_sol, J);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetLinearSolver");

            flag = CVodeSetMaxOrd(solver_memory, settings.max_order_bdf);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetMaxOrd");

            flag = CVodeSetMaxNonlinIters(solver_memory, settings.max_nonlin_solver_iters);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetMaxNonlinIters");
        } else {
            // ADAMS: functional (fixed-point) iteration, no linear solver/Jacobian needed
            nls = SUNNonlinSol_FixedPoint(y, 0, sunctx);
            if (!nls) {
                throw std::runtime_error("Failed to create SUNNonlinSol_FixedPoint");
            }
            flag = CVodeSetNonlinearSolver(solver_memory, nls);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetNonlinearSolver");

            flag = CVodeSetMaxOrd(solver_memory, settings.max_order_adams);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetMaxOrd");
        }

        // Set user data pointer to this instance (for callbacks)
        flag = CVodeSetUserData(solver_memory, this);
        CHECK_SUNDIALS_FLAG(flag, "CVodeSetUserData");

        flag = CVodeSetMaxNumSteps(solver_memory, settings.max_steps);
        CHECK_SUNDIALS_FLAG(flag, "CVodeSetMaxNumSteps");

        if (settings.init_step > 0.0) {
            flag = CVodeSetInitStep(solver_memory, settings.init_step);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetInitStep");
        }

        if (settings.max_step > 0.0) {
            flag = CVodeSetMaxStep(solver_memory, settings.max_step);
            CHECK_SUNDIALS_FLAG(flag, "CVodeSetMaxStep");
        }

        flag = CVodeSetMinStep(solver_memory, settings.min_step);
        CHECK_SUNDIALS_FLAG(flag, "CVodeSetMinStep");

        flag = CVodeSetMaxErrTestFails(solver_memory, settings.max_err_test_fails);
        CHECK_SUNDIALS_FLAG(flag, "CVodeSetMaxErrTestFails");
    } catch (const std::exception&) {
        freeSundialsObjects(solver_memory, y, constraints, J, lin_sol, nls, sunctx);
        throw;
    }
}

// Destructor cleans up all allocated Sundials objects
Solver::~Solver() { freeSundialsObjects(solver_memory, y, constraints, J, lin_sol, nls, sunctx); }

std::vector<realtype> Solver::getY() const {
    std::vector<realtype> y_vec;
    if (y != nullptr && ySize > 0) {
        y_vec.reserve(ySize);
        const realtype* y_data = N_VGetArrayPointer(y);
        y_vec.assign(y_data, y_data + ySize);
    }
    return y_vec;
}
