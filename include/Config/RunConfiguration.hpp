#ifndef RUN_CONFIGURATION_HPP
#define RUN_CONFIGURATION_HPP

#include <sundials/sundials_types.h>
#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <string>
#include <vector>

#include "Optimization/OptimizationDriver.hpp"
#include "Reactions/RateLaws.hpp"
#include "Solver.hpp"
#include "UnitOperations/PlugFlowReactor.hpp"
#include "UnitOperations/ReactorModel.hpp"

struct ExperimentsConfiguration {
    std::string file;      // CSV path, relative paths are resolved against the configuration file
    std::size_t n_runs = 0;  // 0: all rows
};

struct OutputConfiguration {
    std::string directory;  // Empty: OUTPUT_DIR or the current directory
};

/**
 * @brief Everything a worker needs to run, read from one YAML file
 *
 * Sections: reactor, solver, experiments, optimization, dispatch, output. Every rank parses
 * the same file, so all validation happens before any computation starts.
 */
struct RunConfiguration {
    ReactorParameters reactor;
    SolverSettings solver;
    realtype max_step_divisor = PlugFlowReactor::default_max_step_divisor;
    ExperimentsConfiguration experiments;
    OptimizationSettings optimization;
    std::vector<RateLawCombination> combinations;
    OutputConfiguration output;

    // Throws ConfigurationError
    void validate() const;
};

/**
 * @brief yaml-cpp based reader of RunConfiguration
 *
 * Missing required fields, values of the wrong type, unknown enum names and out-of-range
 * values throw ConfigurationError naming the field as section.key.
 */
class RunConfigurationParser {
   public:
    // Reads the file, throws ConfigurationError if it cannot be opened or parsed
    static RunConfiguration load(const std::string& path);

    // Parses an already loaded document, relative experiment paths are resolved against base_directory
    static RunConfiguration parse(const YAML::Node& root, const std::string& base_directory = "");

   private:
    template <typename T>
    static T require(const YAML::Node& section, const std::string& section_name, const std::string& key);

    template <typename T>
    static T valueOr(const YAML::Node& section, const std::string& section_name, const std::string& key, T fallback);

    static YAML::Node section(const YAML::Node& root, const std::string& name, bool required);

    static void parseReactor(const YAML::Node& node, RunConfiguration& config);
    static void parseSolver(const YAML::Node& node, RunConfiguration& config);
    static void parseExperiments(const YAML::Node& node, const std::string& base_directory, RunConfiguration& config);
    static void parseOptimization(const YAML::Node& node, RunConfiguration& config);
    static void parseDispatch(const YAML::Node& node, RunConfiguration& config);
    static void parseOutput(const YAML::Node& node, RunConfiguration& config);
};

#endif  // RUN_CONFIGURATION_HPP
