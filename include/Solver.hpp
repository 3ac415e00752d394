#ifndef SOLVER_HPP
#define SOLVER_HPP

#include <cvode/cvode.h>
#include <nvector/nvector_serial.h>
#include <sundials/sundials_nvector.h>
#include <sundials/sundials_types.h>
// Nonlinear solvers
#include <sunnonlinsol/sunnonlinsol_fixedpoint.h>

#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "EigenDataTypes.hpp"
#include "Logger.hpp"

// Forward declarations
class UnitOperationBase;

/// @brief Available solver types for ODE integration
enum class SolverType { BDF, ADAMS };

/**
 * @brief Integrator settings, SUNDIALS defaults noted where they differ
 */
struct SolverSettings {
    SolverType type = SolverType::BDF;

    realtype reltol = 1e-6;
    realtype abstol = 1e-8;

    // h_max: maximum allowed step size. SUNDIALS default: 0.0 (no upper bound)
    realtype max_step = 0.0;
    // h_min: minimum allowed step size. SUNDIALS default: 0.0 (no lower bound)
    realtype min_step = 0.0;
    // Initial step size hint. SUNDIALS default: 0.0 (internally estimated)
    realtype init_step = 0.0;
    // SUNDIALS default: 500 per call to CVode
    long int max_steps = 50000;
    // Error test failures allowed per step. SUNDIALS default: 7
    int max_err_test_fails = 20;
    // Max nonlinear iterations per step. SUNDIALS default: 3
    int max_nonlin_solver_iters = 10;
    // Max method order. SUNDIALS defaults: BDF=5, Adams=12
    int max_order_bdf = 5;
    int max_order_adams = 12;
    // Tells SUNDIALS y >= 0 for all x
    bool use_sundials_non_negative_constraint = false;
    // Wall-clock limit of one solve() in seconds
    realtype max_solve_seconds = std::numeric_limits<realtype>::infinity();
};

/**
 * @brief SUNDIALS CVODE wrapper integrating one unit operation
 *
 * Copies the initial state of the unit operation, configures tolerances and limits, and
 * integrates up to x_stop in single internal steps. Any failure of the integration (error
 * flags, exceeded step budget, timeout, exceptions inside the RHS) is reported by throwing
 * std::runtime_error. Solver statistics are logged when an integration fails.
 */
class Solver {
   public:
    Solver(const UnitOperationBase& unitOperation, const SolverSettings& settings = SolverSettings());
    ~Solver();

    Solver(const Solver&) = delete;
    Solver& operator=(const Solver&) = delete;

    void solve(realtype x_stop, realtype timeout_seconds = std::numeric_limits<realtype>::infinity());

    sunindextype getYSize() const { return ySize; }
    std::vector<realtype> getY() const;
    realtype getX() const { return x; }
    long int getNumSteps() const { return n_steps; }

    void logStatistics(const std::string& logFileName = "solver_statistics.log") const;

    // Get the elapsed wall-clock time of the last solve() call in seconds
    realtype getSolveTime() const { return elapsed_seconds; }

   protected:
    // RHS function f(x,y) = y'
    static int rhs(realtype x, N_Vector y, N_Vector dy_dx, void* user_data);

    int run_solver(realtype x_stop);
    bool checkTimeout() const;

    const UnitOperationBase& unitOperation;
    const SolverSettings settings;

    // Sundials objects
    SUNContext sunctx = nullptr;
    void* solver_memory = nullptr;
    SUNLinearSolver lin_sol = nullptr;
    SUNNonlinearSolver nls = nullptr;
    SUNMatrix J = nullptr;
    N_Vector constraints = nullptr;

    // State variables
    N_Vector y = nullptr;
    realtype x = 0.0;
    sunindextype ySize = 0;

    long int n_steps = 0;

    // Message of the last exception thrown inside rhs(), reported when CVODE gives up
    std::string rhs_error;

    // Timeout functionality
    realtype timeout_seconds = std::numeric_limits<realtype>::infinity();  // No timeout by default
    std::chrono::steady_clock::time_point t_solve_start;
    int timeout_check_interval = 100;  // Check timeout every N steps to avoid overhead
    int steps_since_timeout_check = 0;
    mutable realtype elapsed_seconds = 0.0;  // Time elapsed since start of solve() in seconds
};

// Helper macro for error checking
#define CHECK_SUNDIALS_FLAG(flag, funcname)                                                              \
    if ((flag) != CV_SUCCESS) {                                                                          \
        throw std::runtime_error(std::string(funcname) + " failed with flag = " + std::to_string(flag)); \
    }

#endif  // SOLVER_HPP
