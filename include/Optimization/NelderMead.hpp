#ifndef NELDER_MEAD_HPP
#define NELDER_MEAD_HPP

#include <sundials/sundials_types.h>

#include <functional>
#include <optional>

#include "EigenDataTypes.hpp"
#include "Optimization/Minimization.hpp"

struct NelderMeadSettings {
    int max_iterations = 0;       // 0: 200 * n_dim
    long int max_evaluations = 0;  // 0: 200 * n_dim
    realtype xatol = 1e-4;        // Absolute spread of the simplex vertices at convergence
    realtype fatol = 1e-4;        // Absolute spread of the simplex scores at convergence
};

/**
 * @brief Downhill simplex minimization
 *
 * Standard coefficients (reflection 1, expansion 2, contraction 1/2, shrink 1/2). The initial
 * simplex perturbs each coordinate of x0 by 5 % (0.00025 for zero entries). If bounds are
 * given, every vertex is clipped onto them. Converged when both the vertex spread and the
 * score spread fall below xatol and fatol. The optional stop predicate is polled once per
 * iteration.
 */
class NelderMead {
   public:
    using StopPredicate = std::function<bool()>;

    explicit NelderMead(const NelderMeadSettings& settings = {});

    MinimizationResult minimize(const ObjectiveFunction& objective,
                                const Vector& x0,
                                const std::optional<Bounds>& bounds = std::nullopt,
                                const StopPredicate& stop = nullptr) const;

   private:
    const NelderMeadSettings settings;
};

#endif  // NELDER_MEAD_HPP
