#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

#include "ConfigurationError.hpp"
#include "PhysicalConstants.hpp"
#include "Reactions/KineticRates.hpp"
#include "Reactions/Species.hpp"
#include "TestHelpers.hpp"
#include "UnitOperations/PlugFlowReactor.hpp"

using kinfit_test::reference_temperature;
using kinfit_test::reference_velocity;

namespace {

SpeciesVector referenceInletConcentrations() {
    return kinfit_test::referenceInletPressures() / (constants::gas_constant * reference_temperature);
}

}  // namespace

TEST_CASE("Species rates follow the stoichiometry", "[PlugFlowReactor]") {
    ReactionRates r;
    r << 1.0, 0.0, 0.0;
    SpeciesVector expected;
    expected << -1.0, 0.0, -3.0, 1.0, 1.0;
    CHECK((PlugFlowBed::speciesRates(r) - expected).abs().maxCoeff() == 0.0);

    r << 0.0, 1.0, 0.0;
    expected << -1.0, 1.0, -1.0, 0.0, 1.0;
    CHECK((PlugFlowBed::speciesRates(r) - expected).abs().maxCoeff() == 0.0);

    r << 0.0, 0.0, 1.0;
    expected << 0.0, -1.0, -2.0, 1.0, 0.0;
    CHECK((PlugFlowBed::speciesRates(r) - expected).abs().maxCoeff() == 0.0);
}

TEST_CASE("Zero bed length returns the inlet state", "[PlugFlowReactor]") {
    ReactorParameters parameters;
    parameters.length = 0.0;
    const PlugFlowReactor reactor(RateLawCombination::fromId("1_1_1"), parameters);

    const SpeciesVector c_in = referenceInletConcentrations();
    const auto exit = reactor.solve(literatureParameters(), reference_temperature, reference_velocity, c_in);
    REQUIRE(exit.has_value());

    const SpeciesVector c_expected = c_in.cwiseMax(parameters.concentration_floor);
    for (Eigen::Index i = 0; i < n_species; ++i) {
        INFO("species " << species::names[i]);
        CHECK(exit->c(i) == Approx(c_expected(i)));
        CHECK(exit->p(i) == Approx(c_expected(i) * constants::gas_constant * reference_temperature));
    }
    CHECK(exit->contraction_factor == Approx(1.0));
    CHECK(exit->u_exit == Approx(reference_velocity));
}

TEST_CASE("Reactor construction validates its inputs", "[PlugFlowReactor]") {
    const RateLawCombination combination = RateLawCombination::fromId("1_1_1");

    SECTION("negative length") {
        ReactorParameters parameters;
        parameters.length = -0.01;
        CHECK_THROWS_AS(PlugFlowReactor(combination, parameters), ConfigurationError);
    }
    SECTION("non-positive catalyst density") {
        ReactorParameters parameters;
        parameters.catalyst_bulk_density = 0.0;
        CHECK_THROWS_AS(PlugFlowReactor(combination, parameters), ConfigurationError);
    }
    SECTION("inverted contraction bounds") {
        ReactorParameters parameters;
        parameters.contraction_min = 2.0;
        parameters.contraction_max = 1.0;
        CHECK_THROWS_AS(PlugFlowReactor(combination, parameters), ConfigurationError);
    }
    SECTION("non-positive step divisor") {
        CHECK_THROWS_AS(PlugFlowReactor(combination, ReactorParameters(), SolverSettings(), 0.0),
                        std::invalid_argument);
    }
    SECTION("maximum step is a fraction of the bed length") {
        ReactorParameters parameters;
        parameters.length = 0.06;
        const PlugFlowReactor reactor(combination, parameters);
        CHECK(reactor.solverSettings().max_step == Approx(0.06 / 15.0));
    }
}

TEST_CASE("Reactor produces methanol at the reference operating point", "[PlugFlowReactor]") {
    const ReactorParameters parameters;
    const SpeciesVector c_in = referenceInletConcentrations();
    const SpeciesVector p_in = kinfit_test::referenceInletPressures();

    for (const char* id : {"1_1_1", "2_2_2", "3_1_2"}) {
        INFO("combination " << id);
        const PlugFlowReactor reactor(RateLawCombination::fromId(id), parameters);
        const auto exit = reactor.solve(literatureParameters(), reference_temperature, reference_velocity, c_in);
        REQUIRE(exit.has_value());

        CHECK(exit->p.allFinite());
        CHECK(exit->c.allFinite());
        CHECK(exit->p(species::MeOH) > 1e-6);
        CHECK(exit->p(species::CO2) < p_in(species::CO2));
        CHECK(exit->p(species::H2) < p_in(species::H2));
        CHECK(exit->contraction_factor >= 1.0 - 1e-9);
        CHECK(exit->contraction_factor <= parameters.contraction_max);
        CHECK(exit->u_exit == Approx(reference_velocity * exit->contraction_factor));
    }
}

TEST_CASE("Reactor solutions are reproducible", "[PlugFlowReactor]") {
    const PlugFlowReactor reactor(RateLawCombination::fromId("2_1_3"), ReactorParameters());
    const SpeciesVector c_in = referenceInletConcentrations();
    const Vector parameters = literatureParameters();

    const auto first = reactor.solve(parameters, reference_temperature, reference_velocity, c_in);
    const auto second = reactor.solve(parameters, reference_temperature, reference_velocity, c_in);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    for (Eigen::Index i = 0; i < n_species; ++i) {
        CHECK(first->p(i) == second->p(i));
    }

    const auto pressures = reactor.exitPressures(parameters, reference_temperature, reference_velocity, c_in);
    REQUIRE(pressures.has_value());
    for (Eigen::Index i = 0; i < n_species; ++i) {
        CHECK((*pressures)(i) == first->p(i));
    }
}

TEST_CASE("Reactor reports failures as missing exit", "[PlugFlowReactor]") {
    const PlugFlowReactor reactor(RateLawCombination::fromId("1_1_1"), ReactorParameters());
    const SpeciesVector c_in = referenceInletConcentrations();

    SECTION("non-finite parameters") {
        Vector parameters = literatureParameters();
        parameters(kinetic_parameters::A_MeOHSynthesis) = std::numeric_limits<realtype>::quiet_NaN();
        CHECK_FALSE(reactor.solve(parameters, reference_temperature, reference_velocity, c_in).has_value());
        CHECK_FALSE(reactor.exitPressures(parameters, reference_temperature, reference_velocity, c_in).has_value());
    }
    SECTION("wrong parameter count") {
        CHECK_FALSE(reactor.solve(Vector::Ones(3), reference_temperature, reference_velocity, c_in).has_value());
    }
    SECTION("non-positive velocity") {
        CHECK_FALSE(reactor.solve(literatureParameters(), reference_temperature, 0.0, c_in).has_value());
    }
    SECTION("solve time limit exceeded") {
        SolverSettings settings;
        settings.max_solve_seconds = 0.0;
        const PlugFlowReactor limited(RateLawCombination::fromId("1_1_1"), ReactorParameters(), settings);
        CHECK_FALSE(limited.solve(literatureParameters(), reference_temperature, reference_velocity, c_in).has_value());
    }
}
