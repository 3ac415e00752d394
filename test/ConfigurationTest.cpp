#include <catch2/catch.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <filesystem>
#include <string>

#include "Config/RunConfiguration.hpp"
#include "ConfigurationError.hpp"
#include "Reactions/KineticRates.hpp"
#include "TestHelpers.hpp"

namespace {

const std::string reactor_section = R"(
reactor:
  length: 0.08
  catalyst_bulk_density: 1200.0
  catalyst_volume: 4.0e-6
  cross_section_area: 6.0e-5
)";

const std::string experiments_section = R"(
experiments:
  file: data/experiments.csv
  n_runs: 3
)";

const std::string optimization_section = R"(
optimization:
  objective: formation_rates
  time_budget_seconds: 3600
  max_iterations: 50
  population_size: 4
  tolerance: 0.001
  mutation: [0.4, 0.9]
  recombination: 0.8
  seed: 12
  progress_every_iterations: 5
  local_refinement:
    enabled: false
    max_iterations: 300
)";

RunConfiguration parseString(const std::string& yaml, const std::string& base_directory = "/work") {
    return RunConfigurationParser::parse(YAML::Load(yaml), base_directory);
}

std::string minimalDocument() { return reactor_section + experiments_section + optimization_section; }

}  // namespace

TEST_CASE("Complete configuration is parsed", "[Configuration]") {
    const std::string yaml = minimalDocument() + R"(
solver:
  type: Adams
  reltol: 1.0e-7
  abstol: 1.0e-9
  max_steps: 1000
  max_step_divisor: 20
  max_solve_seconds: 30
dispatch:
  combinations: [1_1_1, 4_2_3, 2_1_2]
output:
  directory: /scratch/fits
)";
    const RunConfiguration config = parseString(yaml);

    CHECK(config.reactor.length == Approx(0.08));
    CHECK(config.reactor.catalyst_bulk_density == Approx(1200.0));
    CHECK(config.reactor.catalystMass() == Approx(1200.0 * 4.0e-6));
    CHECK(config.reactor.contraction_min == Approx(0.1));
    CHECK(config.reactor.contraction_max == Approx(10.0));

    CHECK(config.solver.type == SolverType::ADAMS);
    CHECK(config.solver.reltol == Approx(1e-7));
    CHECK(config.solver.max_steps == 1000);
    CHECK(config.max_step_divisor == Approx(20.0));
    CHECK(config.solver.max_solve_seconds == Approx(30.0));

    CHECK(std::filesystem::path(config.experiments.file) == std::filesystem::path("/work/data/experiments.csv"));
    CHECK(config.experiments.n_runs == 3);

    CHECK(config.optimization.objective == ObjectiveStrategy::FormationRates);
    CHECK(config.optimization.time_budget_seconds == Approx(3600.0));
    CHECK(config.optimization.global.max_iterations == 50);
    CHECK(config.optimization.global.population_size == 4);
    CHECK(config.optimization.global.mutation_min == Approx(0.4));
    CHECK(config.optimization.global.mutation_max == Approx(0.9));
    CHECK(config.optimization.global.recombination == Approx(0.8));
    REQUIRE(config.optimization.global.seed.has_value());
    CHECK(*config.optimization.global.seed == 12u);
    CHECK(config.optimization.progress_every_iterations == 5);
    CHECK_FALSE(config.optimization.local_refinement.enabled);
    CHECK(config.optimization.local_refinement.nelder_mead.max_iterations == 300);
    CHECK(config.optimization.bounds.empty());

    REQUIRE(config.combinations.size() == 3);
    CHECK(config.combinations[1].id() == "4_2_3");
    CHECK(config.output.directory == "/scratch/fits");
}

TEST_CASE("Optional sections fall back to defaults", "[Configuration]") {
    const RunConfiguration config = parseString(minimalDocument());

    CHECK(config.solver.type == SolverType::BDF);
    CHECK(config.solver.reltol == Approx(1e-6));
    CHECK(config.solver.abstol == Approx(1e-8));
    CHECK(config.max_step_divisor == Approx(15.0));
    CHECK(std::isinf(config.solver.max_solve_seconds));
    CHECK(config.combinations.size() == 24);
    CHECK(config.output.directory.empty());
    CHECK(config.optimization.magnitude_penalty_factor == Approx(1.0));
}

TEST_CASE("Dispatch accepts all combinations by name", "[Configuration]") {
    const RunConfiguration config = parseString(minimalDocument() + "dispatch:\n  combinations: all\n");
    REQUIRE(config.combinations.size() == 24);
    CHECK(config.combinations.front().id() == "1_1_1");
    CHECK(config.combinations.back().id() == "4_2_3");
}

TEST_CASE("Scalar mutation fixes the dither interval", "[Configuration]") {
    const std::string yaml = reactor_section + experiments_section + R"(
optimization:
  objective: products
  mutation: 0.6
)";
    const RunConfiguration config = parseString(yaml);
    CHECK(config.optimization.objective == ObjectiveStrategy::Products);
    CHECK(config.optimization.global.mutation_min == Approx(0.6));
    CHECK(config.optimization.global.mutation_max == Approx(0.6));
}

TEST_CASE("Explicit bounds are read as pairs", "[Configuration]") {
    std::string yaml = minimalDocument() + "  bounds:\n";
    for (Eigen::Index i = 0; i < kinetic_parameters::count; ++i) {
        yaml += "    - [" + std::to_string(-1.0 - static_cast<double>(i)) + ", " +
                std::to_string(1.0 + static_cast<double>(i)) + "]\n";
    }
    const RunConfiguration config = parseString(yaml);
    REQUIRE(config.optimization.bounds.size() == static_cast<std::size_t>(kinetic_parameters::count));
    CHECK(config.optimization.bounds[0].first == Approx(-1.0));
    CHECK(config.optimization.bounds[13].second == Approx(14.0));
}

TEST_CASE("Invalid configurations are rejected", "[Configuration]") {
    SECTION("empty document") {
        CHECK_THROWS_AS(parseString(""), ConfigurationError);
    }
    SECTION("missing reactor section") {
        CHECK_THROWS_AS(parseString(experiments_section + optimization_section), ConfigurationError);
    }
    SECTION("missing reactor length") {
        const std::string yaml = R"(
reactor:
  catalyst_bulk_density: 1200.0
  catalyst_volume: 4.0e-6
  cross_section_area: 6.0e-5
)" + experiments_section + optimization_section;
        CHECK_THROWS_AS(parseString(yaml), ConfigurationError);
    }
    SECTION("non-numeric value") {
        const std::string yaml = R"(
reactor:
  length: long
  catalyst_bulk_density: 1200.0
  catalyst_volume: 4.0e-6
  cross_section_area: 6.0e-5
)" + experiments_section + optimization_section;
        CHECK_THROWS_AS(parseString(yaml), ConfigurationError);
    }
    SECTION("unknown objective") {
        const std::string yaml = reactor_section + experiments_section + "optimization:\n  objective: chi2\n";
        CHECK_THROWS_AS(parseString(yaml), ConfigurationError);
    }
    SECTION("unknown solver type") {
        CHECK_THROWS_AS(parseString(minimalDocument() + "solver:\n  type: rk4\n"), ConfigurationError);
    }
    SECTION("non-positive solve time limit") {
        CHECK_THROWS_AS(parseString(minimalDocument() + "solver:\n  max_solve_seconds: 0\n"), ConfigurationError);
    }
    SECTION("malformed combination id") {
        CHECK_THROWS_AS(parseString(minimalDocument() + "dispatch:\n  combinations: [1_1_1, 5_1_1]\n"),
                        ConfigurationError);
    }
    SECTION("duplicate combination") {
        CHECK_THROWS_AS(parseString(minimalDocument() + "dispatch:\n  combinations: [2_2_2, 2_2_2]\n"),
                        ConfigurationError);
    }
    SECTION("dispatch keyword") {
        CHECK_THROWS_AS(parseString(minimalDocument() + "dispatch:\n  combinations: some\n"), ConfigurationError);
    }
    SECTION("wrong number of bounds") {
        CHECK_THROWS_AS(parseString(minimalDocument() + "  bounds:\n    - [0, 1]\n    - [0, 2]\n"), ConfigurationError);
    }
    SECTION("negative run count") {
        const std::string yaml =
            reactor_section + "experiments:\n  file: data.csv\n  n_runs: -2\n" + optimization_section;
        CHECK_THROWS_AS(parseString(yaml), ConfigurationError);
    }
    SECTION("negative bed length") {
        const std::string yaml = R"(
reactor:
  length: -0.1
  catalyst_bulk_density: 1200.0
  catalyst_volume: 4.0e-6
  cross_section_area: 6.0e-5
)" + experiments_section + optimization_section;
        CHECK_THROWS_AS(parseString(yaml), ConfigurationError);
    }
}

TEST_CASE("Configuration files resolve experiment paths relative to themselves", "[Configuration]") {
    const auto dir = kinfit_test::makeTempDirectory("kinfit_config");
    const auto path = dir / "run.yaml";
    kinfit_test::writeFile(path, minimalDocument());

    const RunConfiguration config = RunConfigurationParser::load(path.string());
    CHECK(std::filesystem::path(config.experiments.file) == dir / "data" / "experiments.csv");

    CHECK_THROWS_AS(RunConfigurationParser::load((dir / "missing.yaml").string()), ConfigurationError);

    const auto broken = dir / "broken.yaml";
    kinfit_test::writeFile(broken, "reactor: [1, 2\n");
    CHECK_THROWS_AS(RunConfigurationParser::load(broken.string()), ConfigurationError);

    std::filesystem::remove_all(dir);
}
