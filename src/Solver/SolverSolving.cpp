#include <cvode/cvode.h>
#include <nvector/nvector_serial.h>
#include <sundials/sundials_types.h>

#include <cmath>
#include <iomanip>
#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Logger.hpp"
#include "Solver.hpp"
#include "UnitOperations/UnitOperationBase.hpp"

bool Solver::checkTimeout() const {
    auto elapsed = std::chrono::steady_clock::now() - t_solve_start;
    elapsed_seconds = std::chrono::duration<realtype>(elapsed).count();
    return elapsed_seconds >= timeout_seconds;
}

int Solver::run_solver(realtype x_stop) {
    int flag = CVodeSetStopTime(solver_memory, x_stop);
    CHECK_SUNDIALS_FLAG(flag, "CVodeSetStopTime");

    while (x < x_stop) {
        flag = CVode(solver_memory, x_stop, y, &x, CV_ONE_STEP);
        n_steps++;

        if (flag < 0) {
            logStatistics();
            std::string message = "CVode failed with flag = " + std::to_string(flag) + " at x = " + std::to_string(x);
            if (!rhs_error.empty()) {
                message += " (rhs: " + rhs_error + ")";
            }
            throw std::runtime_error(message);
        }
        if (n_steps >= settings.max_steps) {
            logStatistics();
            throw std::runtime_error("Maximum number of steps (" + std::to_string(settings.max_steps) + ") exceeded.");
        }
        steps_since_timeout_check++;
        if (steps_since_timeout_check >= timeout_check_interval) {
            if (checkTimeout()) {
                logStatistics();
                throw std::runtime_error("Solver timed out after " + std::to_string(elapsed_seconds) + " seconds.");
            }
            steps_since_timeout_check = 0;
        }
    }
    return flag;
}

// Integrate from the current x to x_stop
void Solver::solve(realtype x_stop, realtype maxSolveTime) {
    this->timeout_seconds = maxSolveTime;
    this->t_solve_start = std::chrono::steady_clock::now();
    // First check after the first step
    this->steps_since_timeout_check = timeout_check_interval - 1;
    rhs_error.clear();

    if (x_stop > x) {
        run_solver(x_stop);
    }

    checkTimeout();
}

void Solver::logStatistics(const std::string& logFileName) const {
#if LOG_ENABLED
    std::ostringstream oss;
    oss << std::setprecision(6);

    // Basic CVODE counters
    long int nsteps = 0, nfevals = 0, netfails = 0, nlinsetups = 0;
    if (CVodeGetNumSteps(solver_memory, &nsteps) == CV_SUCCESS) {
        oss << "nsteps=" << nsteps << "  ";
    }
    if (CVodeGetNumRhsEvals(solver_memory, &nfevals) == CV_SUCCESS) {
        oss << "nfevals=" << nfevals << "  ";
    }
    if (CVodeGetNumErrTestFails(solver_memory, &netfails) == CV_SUCCESS) {
        oss << "errtestfails=" << netfails << "  ";
    }
    if (CVodeGetNumLinSolvSetups(solver_memory, &nlinsetups) == CV_SUCCESS) {
        oss << "linSetups=" << nlinsetups << "  ";
    }

    // Nonlinear solver statistics
    long int nniters = 0, nnconvfails = 0;
    if (CVodeGetNumNonlinSolvIters(solver_memory, &nniters) == CV_SUCCESS) {
        oss << "nonlinIters=" << nniters << "  ";
    }
    if (CVodeGetNumNonlinSolvConvFails(solver_memory, &nnconvfails) == CV_SUCCESS) {
        oss << "nonlinConvFails=" << nnconvfails << "  ";
    }

    // Jacobian counts only when a linear solver is present
    if (settings.type == SolverType::BDF) {
        long int njacevals = 0;
        if (CVodeGetNumJacEvals(solver_memory, &njacevals) == CV_SUCCESS) {
            oss << "JacEvals=" << njacevals << "  ";
        }
    }

    // Step / order / x diagnostics
    realtype last_h = 0.0, cur_h = 0.0, xcur = 0.0;
    int qcur = 0, qlast = 0;
    if (CVodeGetLastStep(solver_memory, &last_h) == CV_SUCCESS) oss << "last_h=" << std::scientific << last_h << "  ";
    if (CVodeGetCurrentStep(solver_memory, &cur_h) == CV_SUCCESS) oss << "cur_h=" << std::scientific << cur_h << "  ";
    if (CVodeGetCurrentTime(solver_memory, &xcur) == CV_SUCCESS) oss << "xcur=" << xcur << "  ";
    if (CVodeGetCurrentOrder(solver_memory, &qcur) == CV_SUCCESS) oss << "order=" << qcur << "  ";
    if (CVodeGetLastOrder(solver_memory, &qlast) == CV_SUCCESS) oss << "last_order=" << qlast << "  ";

    oss << "\n";

    LOG(logFileName, oss.str());
#endif
}
