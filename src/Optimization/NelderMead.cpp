#include "Optimization/NelderMead.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace {

constexpr realtype rho = 1.0;
constexpr realtype chi = 2.0;
constexpr realtype psi = 0.5;
constexpr realtype sigma = 0.5;

constexpr realtype nonzero_delta = 0.05;
constexpr realtype zero_delta = 0.00025;

}  // namespace

NelderMead::NelderMead(const NelderMeadSettings& settings) : settings(settings) {
    if (settings.max_iterations < 0 || settings.max_evaluations < 0) {
        throw std::invalid_argument("Nelder-Mead iteration and evaluation caps must be non-negative");
    }
    if (!(settings.xatol >= 0.0) || !(settings.fatol >= 0.0)) {
        throw std::invalid_argument("Nelder-Mead tolerances must be non-negative");
    }
}

MinimizationResult NelderMead::minimize(const ObjectiveFunction& objective,
                                        const Vector& x0,
                                        const std::optional<Bounds>& bounds,
                                        const StopPredicate& stop) const {
    const Eigen::Index n = x0.size();
    if (n == 0) {
        throw std::invalid_argument("Nelder-Mead needs at least one dimension");
    }
    if (bounds) {
        checkBounds(*bounds);
        if (static_cast<Eigen::Index>(bounds->size()) != n) {
            throw std::invalid_argument("Nelder-Mead bounds do not match the dimension of x0");
        }
    }

    const int max_iterations = settings.max_iterations > 0 ? settings.max_iterations : static_cast<int>(200 * n);
    const long int max_evaluations = settings.max_evaluations > 0 ? settings.max_evaluations : 200 * n;

    MinimizationResult result;

    auto clip = [&](Vector& x) {
        if (!bounds) return;
        for (Eigen::Index j = 0; j < n; ++j) {
            const auto& [lower, upper] = (*bounds)[static_cast<std::size_t>(j)];
            x(j) = std::clamp(x(j), lower, upper);
        }
    };
    auto f = [&](const Vector& x) {
        ++result.evaluations;
        const realtype value = objective(x);
        return std::isnan(value) ? std::numeric_limits<realtype>::infinity() : value;
    };

    // Simplex vertices as rows, kept sorted by score
    Matrix sim(n + 1, n);
    ColVector fsim(n + 1);

    Vector start = x0;
    clip(start);
    sim.row(0) = start.transpose();
    for (Eigen::Index k = 0; k < n; ++k) {
        Vector y = start;
        y(k) = (y(k) != 0.0) ? (1.0 + nonzero_delta) * y(k) : zero_delta;
        clip(y);
        sim.row(k + 1) = y.transpose();
    }
    for (Eigen::Index i = 0; i <= n; ++i) {
        fsim(i) = f(sim.row(i).transpose());
    }

    std::vector<Eigen::Index> order(static_cast<std::size_t>(n + 1));
    auto sortSimplex = [&]() {
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](Eigen::Index a, Eigen::Index b) { return fsim(a) < fsim(b); });
        Matrix sorted_sim(n + 1, n);
        ColVector sorted_f(n + 1);
        for (Eigen::Index i = 0; i <= n; ++i) {
            sorted_sim.row(i) = sim.row(order[static_cast<std::size_t>(i)]);
            sorted_f(i) = fsim(order[static_cast<std::size_t>(i)]);
        }
        sim = sorted_sim;
        fsim = sorted_f;
    };
    sortSimplex();

    int iterations = 1;
    bool converged = false;
    bool stopped = false;
    while (result.evaluations < max_evaluations && iterations < max_iterations) {
        const realtype x_spread = (sim.bottomRows(n).rowwise() - sim.row(0)).cwiseAbs().maxCoeff();
        const realtype f_spread = (fsim.tail(n) - fsim(0)).abs().maxCoeff();
        if (x_spread <= settings.xatol && f_spread <= settings.fatol) {
            converged = true;
            break;
        }
        if (stop && stop()) {
            stopped = true;
            break;
        }

        const Vector xbar = sim.topRows(n).colwise().mean().transpose();
        const Vector worst = sim.row(n).transpose();

        Vector xr = (1.0 + rho) * xbar - rho * worst;
        clip(xr);
        const realtype fxr = f(xr);
        bool shrink = false;

        if (fxr < fsim(0)) {
            Vector xe = (1.0 + rho * chi) * xbar - rho * chi * worst;
            clip(xe);
            const realtype fxe = f(xe);
            if (fxe < fxr) {
                sim.row(n) = xe.transpose();
                fsim(n) = fxe;
            } else {
                sim.row(n) = xr.transpose();
                fsim(n) = fxr;
            }
        } else if (fxr < fsim(n - 1)) {
            sim.row(n) = xr.transpose();
            fsim(n) = fxr;
        } else if (fxr < fsim(n)) {
            // Outside contraction
            Vector xc = (1.0 + psi * rho) * xbar - psi * rho * worst;
            clip(xc);
            const realtype fxc = f(xc);
            if (fxc <= fxr) {
                sim.row(n) = xc.transpose();
                fsim(n) = fxc;
            } else {
                shrink = true;
            }
        } else {
            // Inside contraction
            Vector xcc = (1.0 - psi) * xbar + psi * worst;
            clip(xcc);
            const realtype fxcc = f(xcc);
            if (fxcc < fsim(n)) {
                sim.row(n) = xcc.transpose();
                fsim(n) = fxcc;
            } else {
                shrink = true;
            }
        }

        if (shrink) {
            for (Eigen::Index j = 1; j <= n; ++j) {
                Vector v = (sim.row(0) + sigma * (sim.row(j) - sim.row(0))).transpose();
                clip(v);
                sim.row(j) = v.transpose();
                fsim(j) = f(v);
            }
        }

        ++iterations;
        sortSimplex();
    }

    result.x = sim.row(0).transpose();
    result.fun = fsim(0);
    result.iterations = iterations;
    if (converged) {
        result.success = true;
        result.message = "Optimization terminated successfully.";
    } else if (stopped) {
        result.message = "Stopped by request.";
    } else if (result.evaluations >= max_evaluations) {
        result.message = "Maximum number of function evaluations has been exceeded.";
    } else {
        result.message = "Maximum number of iterations has been exceeded.";
    }
    return result;
}
