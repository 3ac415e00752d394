#include "Config/RunConfiguration.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <utility>

#include "ConfigurationError.hpp"
#include "Objective/ObjectiveEvaluator.hpp"

void RunConfiguration::validate() const {
    reactor.validate();
    optimization.validate();
    if (!(solver.reltol > 0.0) || !(solver.abstol > 0.0)) {
        throw ConfigurationError("solver.reltol and solver.abstol must be positive");
    }
    if (solver.max_steps < 1) {
        throw ConfigurationError("solver.max_steps must be >= 1");
    }
    if (!(solver.max_solve_seconds > 0.0)) {
        throw ConfigurationError("solver.max_solve_seconds must be positive");
    }
    if (!(max_step_divisor > 0.0)) {
        throw ConfigurationError("solver.max_step_divisor must be positive");
    }
    if (experiments.file.empty()) {
        throw ConfigurationError("experiments.file is missing");
    }
    if (combinations.empty()) {
        throw ConfigurationError("dispatch.combinations must name at least one combination");
    }
    for (std::size_t i = 0; i < combinations.size(); ++i) {
        for (std::size_t j = i + 1; j < combinations.size(); ++j) {
            if (combinations[i] == combinations[j]) {
                throw ConfigurationError("dispatch.combinations lists '" + combinations[i].id() + "' twice");
            }
        }
    }
}

template <typename T>
T RunConfigurationParser::require(const YAML::Node& section, const std::string& section_name, const std::string& key) {
    if (!section || !section[key]) {
        throw ConfigurationError("Required field '" + section_name + "." + key + "' is missing");
    }
    try {
        return section[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse field '" + section_name + "." + key + "': " + e.what());
    }
}

template <typename T>
T RunConfigurationParser::valueOr(const YAML::Node& section,
                                   const std::string& section_name,
                                   const std::string& key,
                                   T fallback) {
    if (!section || !section[key]) return fallback;
    return require<T>(section, section_name, key);
}

YAML::Node RunConfigurationParser::section(const YAML::Node& root, const std::string& name, bool required) {
    const YAML::Node node = root[name];
    if (!node) {
        if (required) throw ConfigurationError("Missing required section '" + name + "'");
        return YAML::Node();
    }
    if (!node.IsMap()) {
        throw ConfigurationError("Section '" + name + "' must be a mapping");
    }
    return node;
}

RunConfiguration RunConfigurationParser::load(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigurationError("Failed to open configuration file '" + path + "'");
    } catch (const YAML::ParserException& e) {
        throw ConfigurationError("YAML parsing error in '" + path + "': " + e.what());
    }
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    return parse(root, parent.string());
}

RunConfiguration RunConfigurationParser::parse(const YAML::Node& root, const std::string& base_directory) {
    if (!root || root.IsNull() || !root.IsMap()) {
        throw ConfigurationError("Configuration document is empty or not a mapping");
    }

    RunConfiguration config;
    parseReactor(section(root, "reactor", true), config);
    parseSolver(section(root, "solver", false), config);
    parseExperiments(section(root, "experiments", true), base_directory, config);
    parseOptimization(section(root, "optimization", true), config);
    parseDispatch(section(root, "dispatch", false), config);
    parseOutput(section(root, "output", false), config);

    config.validate();
    return config;
}

void RunConfigurationParser::parseReactor(const YAML::Node& node, RunConfiguration& config) {
    ReactorParameters& r = config.reactor;
    r.length = require<realtype>(node, "reactor", "length");
    r.catalyst_bulk_density = require<realtype>(node, "reactor", "catalyst_bulk_density");
    r.catalyst_volume = require<realtype>(node, "reactor", "catalyst_volume");
    r.cross_section_area = require<realtype>(node, "reactor", "cross_section_area");

    if (node["contraction_bounds"]) {
        const auto bounds = require<std::vector<realtype>>(node, "reactor", "contraction_bounds");
        if (bounds.size() != 2) {
            throw ConfigurationError("Field 'reactor.contraction_bounds' must hold [min, max]");
        }
        r.contraction_min = bounds[0];
        r.contraction_max = bounds[1];
    }
    r.rate_clip = valueOr<realtype>(node, "reactor", "rate_clip", r.rate_clip);
    r.derivative_clip = valueOr<realtype>(node, "reactor", "derivative_clip", r.derivative_clip);
    r.concentration_floor = valueOr<realtype>(node, "reactor", "concentration_floor", r.concentration_floor);
    r.pressure_floor = valueOr<realtype>(node, "reactor", "pressure_floor", r.pressure_floor);
}

void RunConfigurationParser::parseSolver(const YAML::Node& node, RunConfiguration& config) {
    SolverSettings& s = config.solver;
    std::string type = valueOr<std::string>(node, "solver", "type", "bdf");
    std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c) { return std::tolower(c); });
    if (type == "bdf") {
        s.type = SolverType::BDF;
    } else if (type == "adams") {
        s.type = SolverType::ADAMS;
    } else {
        throw ConfigurationError("Invalid value '" + type + "' for 'solver.type' (expected bdf or adams)");
    }
    s.reltol = valueOr<realtype>(node, "solver", "reltol", s.reltol);
    s.abstol = valueOr<realtype>(node, "solver", "abstol", s.abstol);
    s.max_steps = valueOr<long int>(node, "solver", "max_steps", s.max_steps);
    s.max_solve_seconds = valueOr<realtype>(node, "solver", "max_solve_seconds", s.max_solve_seconds);
    config.max_step_divisor = valueOr<realtype>(node, "solver", "max_step_divisor", config.max_step_divisor);
}

void RunConfigurationParser::parseExperiments(const YAML::Node& node,
                                              const std::string& base_directory,
                                              RunConfiguration& config) {
    std::filesystem::path file = require<std::string>(node, "experiments", "file");
    if (file.is_relative() && !base_directory.empty()) {
        file = std::filesystem::path(base_directory) / file;
    }
    config.experiments.file = file.string();

    const long int n_runs = valueOr<long int>(node, "experiments", "n_runs", 0);
    if (n_runs < 0) {
        throw ConfigurationError("Field 'experiments.n_runs' must be non-negative");
    }
    config.experiments.n_runs = static_cast<std::size_t>(n_runs);
}

void RunConfigurationParser::parseOptimization(const YAML::Node& node, RunConfiguration& config) {
    OptimizationSettings& o = config.optimization;
    o.objective = parseObjectiveStrategy(require<std::string>(node, "optimization", "objective"));
    o.time_budget_seconds = valueOr<realtype>(node, "optimization", "time_budget_seconds", o.time_budget_seconds);

    DifferentialEvolutionSettings& de = o.global;
    de.max_iterations = valueOr<int>(node, "optimization", "max_iterations", de.max_iterations);
    de.population_size = valueOr<int>(node, "optimization", "population_size", de.population_size);
    de.tolerance = valueOr<realtype>(node, "optimization", "tolerance", de.tolerance);
    de.absolute_tolerance = valueOr<realtype>(node, "optimization", "absolute_tolerance", de.absolute_tolerance);
    de.recombination = valueOr<realtype>(node, "optimization", "recombination", de.recombination);
    if (node["mutation"]) {
        if (node["mutation"].IsSequence()) {
            const auto mutation = require<std::vector<realtype>>(node, "optimization", "mutation");
            if (mutation.size() != 2) {
                throw ConfigurationError("Field 'optimization.mutation' must be a scalar or [min, max]");
            }
            de.mutation_min = mutation[0];
            de.mutation_max = mutation[1];
        } else {
            de.mutation_min = de.mutation_max = require<realtype>(node, "optimization", "mutation");
        }
    }
    if (node["seed"]) {
        de.seed = require<std::uint32_t>(node, "optimization", "seed");
    }

    o.progress_every_iterations =
        valueOr<int>(node, "optimization", "progress_every_iterations", o.progress_every_iterations);
    o.progress_every_seconds =
        valueOr<realtype>(node, "optimization", "progress_every_seconds", o.progress_every_seconds);
    o.magnitude_penalty_factor =
        valueOr<realtype>(node, "optimization", "magnitude_penalty_factor", o.magnitude_penalty_factor);

    if (node["bounds"]) {
        const YAML::Node bounds = node["bounds"];
        if (!bounds.IsSequence()) {
            throw ConfigurationError("Field 'optimization.bounds' must be a list of [lower, upper] pairs");
        }
        o.bounds.clear();
        for (std::size_t i = 0; i < bounds.size(); ++i) {
            std::vector<realtype> pair;
            try {
                pair = bounds[i].as<std::vector<realtype>>();
            } catch (const YAML::Exception& e) {
                throw ConfigurationError("Failed to parse field 'optimization.bounds[" + std::to_string(i) +
                                         "]': " + e.what());
            }
            if (pair.size() != 2) {
                throw ConfigurationError("Field 'optimization.bounds[" + std::to_string(i) +
                                         "]' must hold [lower, upper]");
            }
            o.bounds.emplace_back(pair[0], pair[1]);
        }
    }

    const YAML::Node local = node["local_refinement"];
    if (local) {
        LocalRefinementSettings& l = o.local_refinement;
        const std::string name = "optimization.local_refinement";
        l.enabled = valueOr<bool>(local, name, "enabled", l.enabled);
        l.nelder_mead.max_iterations = valueOr<int>(local, name, "max_iterations", l.nelder_mead.max_iterations);
        l.nelder_mead.max_evaluations =
            valueOr<long int>(local, name, "max_evaluations", l.nelder_mead.max_evaluations);
        l.nelder_mead.xatol = valueOr<realtype>(local, name, "xatol", l.nelder_mead.xatol);
        l.nelder_mead.fatol = valueOr<realtype>(local, name, "fatol", l.nelder_mead.fatol);
    }
}

void RunConfigurationParser::parseDispatch(const YAML::Node& node, RunConfiguration& config) {
    config.combinations.clear();
    if (!node || !node["combinations"]) {
        config.combinations = RateLawCombination::all();
        return;
    }
    const YAML::Node combinations = node["combinations"];
    if (combinations.IsScalar()) {
        const std::string value = combinations.as<std::string>();
        if (value != "all") {
            throw ConfigurationError("Field 'dispatch.combinations' must be 'all' or a list of ids, got '" + value +
                                     "'");
        }
        config.combinations = RateLawCombination::all();
        return;
    }
    const auto ids = require<std::vector<std::string>>(node, "dispatch", "combinations");
    for (const auto& id : ids) {
        config.combinations.push_back(RateLawCombination::fromId(id));
    }
}

void RunConfigurationParser::parseOutput(const YAML::Node& node, RunConfiguration& config) {
    config.output.directory = valueOr<std::string>(node, "output", "directory", "");
}
