#include <catch2/catch.hpp>

#include <cmath>
#include <set>

#include "ConfigurationError.hpp"
#include "Reactions/Equilibrium.hpp"
#include "Reactions/RateLaws.hpp"
#include "Reactions/Species.hpp"

namespace {

// Partial pressures [bar] at chemical equilibrium of all three reactions at temperature T
SpeciesVector equilibriumPressures(realtype T) {
    SpeciesVector p;
    p(species::CO2) = 2.0;
    p(species::H2) = 8.0;
    p(species::H2O) = 0.5;
    p(species::CO) = equilibriumRWGS(T) * p(species::CO2) * p(species::H2) / p(species::H2O);
    p(species::MeOH) =
        equilibriumMeOHDirect(T) * p(species::CO2) * std::pow(p(species::H2), 3.0) / p(species::H2O);
    return p;
}

}  // namespace

TEST_CASE("All 24 combinations are enumerated with unique ids and indices", "[RateLaw]") {
    const auto& all = RateLawCombination::all();
    REQUIRE(all.size() == RateLawCombination::count);

    std::set<std::string> ids;
    for (std::size_t i = 0; i < all.size(); ++i) {
        CHECK(all[i].index() == i);
        ids.insert(all[i].id());
    }
    CHECK(ids.size() == 24);
    CHECK(all.front().id() == "1_1_1");
    CHECK(all.back().id() == "4_2_3");
}

TEST_CASE("Combination ids parse into forms and back", "[RateLaw]") {
    const RateLawCombination c = RateLawCombination::fromId("3_2_1");
    CHECK(c.meohSynthesisForm() == MeOHSynthesisForm::H2_2_0);
    CHECK(c.rwgsForm() == RWGSForm::H2_1_0);
    CHECK(c.meohFromCOForm() == MeOHfromCOForm::H2_0_5);
    CHECK(c.id() == "3_2_1");
    CHECK(c.index() == 2 * 6 + 1 * 3 + 0);
    CHECK(RateLawCombination::fromIndex(c.index()) == c);
    CHECK(RateLawCombination::fromId(" 1_1_1 ") == RateLawCombination::fromIndex(0));
}

TEST_CASE("Combination ids outside the enumeration are configuration errors", "[RateLaw]") {
    CHECK_THROWS_AS(RateLawCombination::fromId("5_1_1"), ConfigurationError);
    CHECK_THROWS_AS(RateLawCombination::fromId("1_3_1"), ConfigurationError);
    CHECK_THROWS_AS(RateLawCombination::fromId("1_1_4"), ConfigurationError);
    CHECK_THROWS_AS(RateLawCombination::fromId("0_1_1"), ConfigurationError);
    CHECK_THROWS_AS(RateLawCombination::fromId("1-1-1"), ConfigurationError);
    CHECK_THROWS_AS(RateLawCombination::fromId(""), ConfigurationError);
    CHECK_THROWS_AS(RateLawCombination::fromIndex(24), ConfigurationError);
    CHECK_THROWS_AS(RateLawCombination(static_cast<MeOHSynthesisForm>(5), RWGSForm::H2_0_5, MeOHfromCOForm::H2_0_5),
                    ConfigurationError);
}

TEST_CASE("Hydrogen exponents match the form names", "[RateLaw]") {
    CHECK(hydrogenExponent(MeOHSynthesisForm::H2_1_0) == 1.0);
    CHECK(hydrogenExponent(MeOHSynthesisForm::H2_2_5) == 2.5);
    CHECK(hydrogenExponent(RWGSForm::H2_0_5) == 0.5);
    CHECK(hydrogenExponent(MeOHfromCOForm::H2_1_5) == 1.5);
}

TEST_CASE("Every driving force vanishes at equilibrium", "[RateLaw]") {
    const realtype T = 493.0;
    const SpeciesVector p = equilibriumPressures(T);
    const realtype K1 = equilibriumMeOHDirect(T);
    const realtype K2 = equilibriumRWGS(T);
    const realtype K3 = equilibriumMeOHfromCO(T);

    for (const auto& c : RateLawCombination::all()) {
        INFO("combination " << c.id());
        const ReactionRates df = c.drivingForces(p, K1, K2, K3);

        // Relative to the forward leg of each reaction
        const realtype leg1 = p(species::CO2) * std::pow(p(species::H2), hydrogenExponent(c.meohSynthesisForm()));
        const realtype leg2 = p(species::CO2) * std::pow(p(species::H2), hydrogenExponent(c.rwgsForm()));
        const realtype leg3 = p(species::CO) * std::pow(p(species::H2), hydrogenExponent(c.meohFromCOForm()));
        CHECK(std::abs(df(reactions::MeOHSynthesis)) <= 1e-12 * leg1);
        CHECK(std::abs(df(reactions::RWGS)) <= 1e-12 * leg2);
        CHECK(std::abs(df(reactions::MeOHfromCO)) <= 1e-12 * leg3);
    }
}

TEST_CASE("Driving forces are positive without products", "[RateLaw]") {
    SpeciesVector p;
    p << 1.0, 0.5, 10.0, 0.0, 0.0;
    for (const auto& c : RateLawCombination::all()) {
        INFO("combination " << c.id());
        const ReactionRates df = c.drivingForces(p, 1e-4, 1e-2, 1e-2);
        CHECK(df(reactions::MeOHSynthesis) > 0.0);
        CHECK(df(reactions::RWGS) > 0.0);
        CHECK(df(reactions::MeOHfromCO) > 0.0);
    }
}
