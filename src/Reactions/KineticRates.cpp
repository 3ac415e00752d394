#include "Reactions/KineticRates.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

#include "PhysicalConstants.hpp"
#include "Reactions/Equilibrium.hpp"
#include "Reactions/Species.hpp"

Vector literatureParameters() {
    namespace kp = kinetic_parameters;
    Vector p(kp::count);
    p(kp::A_MeOHSynthesis) = 1.09e5;
    p(kp::A_RWGS) = 9.64e11;
    p(kp::A_MeOHfromCO) = 4.89e7;
    p(kp::Ea_MeOHSynthesis) = 87500.0;
    p(kp::Ea_RWGS) = 152900.0;
    p(kp::Ea_MeOHfromCO) = 113000.0;
    p(kp::A_K_CO) = 2.16e-5;
    p(kp::A_K_CO2) = 7.05e-7;
    p(kp::A_K_H2O) = 6.37e-9;
    p(kp::A_K_H2) = 1.0;
    p(kp::dH_CO) = -46800.0;
    p(kp::dH_CO2) = -61700.0;
    p(kp::dH_H2O) = -84000.0;
    p(kp::dH_H2) = 0.0;
    return p;
}

std::vector<std::pair<realtype, realtype>> defaultParameterBounds() {
    std::vector<std::pair<realtype, realtype>> bounds;
    bounds.reserve(kinetic_parameters::count);
    for (int i = 0; i < 3; ++i) bounds.emplace_back(1e-5, 1e15);    // rate pre-exponentials
    for (int i = 0; i < 3; ++i) bounds.emplace_back(1e3, 2e5);      // activation energies
    for (int i = 0; i < 4; ++i) bounds.emplace_back(1e-15, 1e5);    // adsorption pre-exponentials
    for (int i = 0; i < 4; ++i) bounds.emplace_back(-2e5, 1e5);     // adsorption enthalpies
    return bounds;
}

KineticRateEvaluator::KineticRateEvaluator(const RateLawCombination& combination, realtype rate_clip)
    : combination_(combination), rate_clip(rate_clip) {
    if (!(rate_clip > 0.0)) {
        throw std::invalid_argument("Rate clip must be positive, got " + std::to_string(rate_clip));
    }
}

void KineticRateEvaluator::checkParameters(const Vector& parameters) {
    if (parameters.size() != kinetic_parameters::count) {
        throw std::invalid_argument("Kinetic parameter vector must have " + std::to_string(kinetic_parameters::count) +
                                    " entries, got " + std::to_string(parameters.size()));
    }
    if (!parameters.allFinite()) {
        throw std::invalid_argument("Kinetic parameter vector contains NaN or Inf");
    }
}

ReactionRates KineticRateEvaluator::operator()(const Vector& parameters, realtype T, const SpeciesVector& p_bar) const {
    namespace kp = kinetic_parameters;
    checkParameters(parameters);

    const realtype RT = constants::gas_constant * T;

    // Arrhenius rate constants
    const realtype k_MeOHSynthesis = parameters(kp::A_MeOHSynthesis) * std::exp(-parameters(kp::Ea_MeOHSynthesis) / RT);
    const realtype k_RWGS = parameters(kp::A_RWGS) * std::exp(-parameters(kp::Ea_RWGS) / RT);
    const realtype k_MeOHfromCO = parameters(kp::A_MeOHfromCO) * std::exp(-parameters(kp::Ea_MeOHfromCO) / RT);

    // Van't Hoff adsorption constants
    const realtype K_CO = parameters(kp::A_K_CO) * std::exp(-parameters(kp::dH_CO) / RT);
    const realtype K_CO2 = parameters(kp::A_K_CO2) * std::exp(-parameters(kp::dH_CO2) / RT);
    const realtype K_H2O = parameters(kp::A_K_H2O) * std::exp(-parameters(kp::dH_H2O) / RT);
    // K_H2 (A_K_H2, dH_H2) is part of the fitted vector but does not enter the denominator

    const realtype K_eq_MeOHSynthesis = std::max(equilibriumMeOHDirect(T), equilibrium_floor);
    const realtype K_eq_RWGS = std::max(equilibriumRWGS(T), equilibrium_floor);
    const realtype K_eq_MeOHfromCO = std::max(equilibriumMeOHfromCO(T), equilibrium_floor);

    SpeciesVector p = p_bar;
    p(species::H2) = std::max(p(species::H2), hydrogen_floor);

    const realtype surface_term =
        std::max(1.0 + K_CO * p(species::CO) + K_CO2 * p(species::CO2), denominator_floor);
    const realtype hydrogen_term =
        std::max(std::sqrt(p(species::H2)) + K_H2O * p(species::H2O), denominator_floor);
    const realtype denominator = surface_term * hydrogen_term;

    const ReactionRates df = combination_.drivingForces(p, K_eq_MeOHSynthesis, K_eq_RWGS, K_eq_MeOHfromCO);

    ReactionRates r;
    r(reactions::MeOHSynthesis) = k_MeOHSynthesis * K_CO2 * df(reactions::MeOHSynthesis) / denominator;
    r(reactions::RWGS) = k_RWGS * K_CO2 * df(reactions::RWGS) / denominator;
    r(reactions::MeOHfromCO) = k_MeOHfromCO * K_CO * df(reactions::MeOHfromCO) / denominator;

    if (!r.allFinite()) {
        std::ostringstream oss;
        oss << "Non-finite reaction rate for combination " << combination_.id() << " at T = " << T
            << " K, p = [" << p_bar.transpose() << "] bar: r = [" << r.transpose() << "]";
        throw std::domain_error(oss.str());
    }

    return r.cwiseMax(-rate_clip).cwiseMin(rate_clip);
}

Array KineticRateEvaluator::operator()(const Vector& parameters, const ColVector& T, const Array& p_bar) const {
    if (p_bar.cols() != n_species || p_bar.rows() != T.rows()) {
        throw std::invalid_argument("Pressure array must be n_points x " + std::to_string(n_species) +
                                    " with one temperature per point");
    }
    Array rates(p_bar.rows(), n_reactions);
    for (Eigen::Index i = 0; i < p_bar.rows(); ++i) {
        const SpeciesVector p_i = p_bar.row(i).transpose();
        rates.row(i) = (*this)(parameters, T(i), p_i).transpose();
    }
    return rates;
}
