#include "Reactions/RateLaws.hpp"

#include <cmath>
#include <regex>
#include <stdexcept>
#include <string>

#include "ConfigurationError.hpp"
#include "Reactions/Species.hpp"

realtype hydrogenExponent(MeOHSynthesisForm form) {
    switch (form) {
        case MeOHSynthesisForm::H2_1_0:
            return 1.0;
        case MeOHSynthesisForm::H2_1_5:
            return 1.5;
        case MeOHSynthesisForm::H2_2_0:
            return 2.0;
        case MeOHSynthesisForm::H2_2_5:
            return 2.5;
    }
    throw std::invalid_argument("Unsupported MeOHSynthesisForm");
}

realtype hydrogenExponent(RWGSForm form) {
    switch (form) {
        case RWGSForm::H2_0_5:
            return 0.5;
        case RWGSForm::H2_1_0:
            return 1.0;
    }
    throw std::invalid_argument("Unsupported RWGSForm");
}

realtype hydrogenExponent(MeOHfromCOForm form) {
    switch (form) {
        case MeOHfromCOForm::H2_0_5:
            return 0.5;
        case MeOHfromCOForm::H2_1_0:
            return 1.0;
        case MeOHfromCOForm::H2_1_5:
            return 1.5;
    }
    throw std::invalid_argument("Unsupported MeOHfromCOForm");
}

realtype drivingForceMeOHSynthesis(MeOHSynthesisForm form, const SpeciesVector& p, realtype K) {
    const realtype a = hydrogenExponent(form);
    const realtype p_H2 = p(species::H2);
    return p(species::CO2) * std::pow(p_H2, a) - p(species::MeOH) * p(species::H2O) / (std::pow(p_H2, 3.0 - a) * K);
}

realtype drivingForceRWGS(RWGSForm form, const SpeciesVector& p, realtype K) {
    const realtype b = hydrogenExponent(form);
    const realtype p_H2 = p(species::H2);
    return p(species::CO2) * std::pow(p_H2, b) - p(species::CO) * p(species::H2O) / (std::pow(p_H2, 1.0 - b) * K);
}

realtype drivingForceMeOHfromCO(MeOHfromCOForm form, const SpeciesVector& p, realtype K) {
    const realtype c = hydrogenExponent(form);
    const realtype p_H2 = p(species::H2);
    return p(species::CO) * std::pow(p_H2, c) - p(species::MeOH) / (std::pow(p_H2, 2.0 - c) * K);
}

RateLawCombination::RateLawCombination(MeOHSynthesisForm meohSynthesis, RWGSForm rwgs, MeOHfromCOForm meohFromCO)
    : meohSynthesis_(meohSynthesis), rwgs_(rwgs), meohFromCO_(meohFromCO) {
    const int i = static_cast<int>(meohSynthesis);
    const int j = static_cast<int>(rwgs);
    const int k = static_cast<int>(meohFromCO);
    if (i < 1 || i > 4 || j < 1 || j > 2 || k < 1 || k > 3) {
        throw ConfigurationError("Rate law combination (" + std::to_string(i) + ", " + std::to_string(j) + ", " +
                                 std::to_string(k) + ") is outside the enumerated 4 x 2 x 3 forms.");
    }
    id_ = std::to_string(i) + "_" + std::to_string(j) + "_" + std::to_string(k);
}

RateLawCombination RateLawCombination::fromId(const std::string& id) {
    static const std::regex pattern(R"(^\s*([1-4])_([1-2])_([1-3])\s*$)");
    std::smatch match;
    if (!std::regex_match(id, match, pattern)) {
        throw ConfigurationError("Invalid rate law combination id '" + id +
                                 "'. Expected 'i_j_k' with i in 1..4, j in 1..2, k in 1..3.");
    }
    return RateLawCombination(static_cast<MeOHSynthesisForm>(std::stoi(match[1].str())),
                              static_cast<RWGSForm>(std::stoi(match[2].str())),
                              static_cast<MeOHfromCOForm>(std::stoi(match[3].str())));
}

RateLawCombination RateLawCombination::fromIndex(std::size_t index) {
    if (index >= count) {
        throw ConfigurationError("Rate law combination index " + std::to_string(index) + " is out of range [0, " +
                                 std::to_string(count) + ").");
    }
    return all()[index];
}

const std::vector<RateLawCombination>& RateLawCombination::all() {
    static const std::vector<RateLawCombination> combinations = [] {
        std::vector<RateLawCombination> list;
        list.reserve(count);
        for (int i = 1; i <= 4; ++i) {
            for (int j = 1; j <= 2; ++j) {
                for (int k = 1; k <= 3; ++k) {
                    list.emplace_back(static_cast<MeOHSynthesisForm>(i), static_cast<RWGSForm>(j),
                                      static_cast<MeOHfromCOForm>(k));
                }
            }
        }
        return list;
    }();
    return combinations;
}

std::size_t RateLawCombination::index() const {
    const auto i = static_cast<std::size_t>(meohSynthesis_) - 1;
    const auto j = static_cast<std::size_t>(rwgs_) - 1;
    const auto k = static_cast<std::size_t>(meohFromCO_) - 1;
    return i * 6 + j * 3 + k;
}

ReactionRates RateLawCombination::drivingForces(const SpeciesVector& p,
                                                realtype K_MeOHSynthesis,
                                                realtype K_RWGS,
                                                realtype K_MeOHfromCO) const {
    ReactionRates df;
    df(reactions::MeOHSynthesis) = drivingForceMeOHSynthesis(meohSynthesis_, p, K_MeOHSynthesis);
    df(reactions::RWGS) = drivingForceRWGS(rwgs_, p, K_RWGS);
    df(reactions::MeOHfromCO) = drivingForceMeOHfromCO(meohFromCO_, p, K_MeOHfromCO);
    return df;
}
