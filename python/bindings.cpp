/**
 * @file bindings.cpp
 * @brief Python bindings for the KinFit library using nanobind
 *
 * Exposes the pieces needed to explore a fit interactively:
 * - Rate laws: RateLawCombination, equilibrium constants, KineticRateEvaluator
 * - Reactor: ReactorParameters, SolverSettings, PlugFlowReactor
 * - Data and objective: ExperimentalDataset, ObjectiveEvaluator
 * - Optimization: OptimizationSettings, OptimizationDriver
 */

#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <limits>
#include <memory>

#include "Config/RunConfiguration.hpp"
#include "EigenDataTypes.hpp"
#include "IO/ExperimentalData.hpp"
#include "Objective/ObjectiveEvaluator.hpp"
#include "Optimization/Deadline.hpp"
#include "Optimization/OptimizationDriver.hpp"
#include "Reactions/Equilibrium.hpp"
#include "Reactions/KineticRates.hpp"
#include "Reactions/RateLaws.hpp"
#include "Solver.hpp"
#include "UnitOperations/PlugFlowReactor.hpp"

namespace nb = nanobind;
using namespace nb::literals;

namespace {

// Keeps the reactor and the dataset alive next to the evaluator, which only holds references
struct BoundObjective {
    std::shared_ptr<const PlugFlowReactor> reactor;
    std::shared_ptr<const ExperimentalDataset> data;
    std::unique_ptr<ObjectiveEvaluator> evaluator;
};

}  // namespace

NB_MODULE(kinfit, m) {
    m.doc() = "KinFit - kinetic parameter estimation for methanol synthesis in a packed-bed reactor";

    // ==================== Enums ====================

    nb::enum_<MeOHSynthesisForm>(m, "MeOHSynthesisForm")
        .value("H2_1_0", MeOHSynthesisForm::H2_1_0)
        .value("H2_1_5", MeOHSynthesisForm::H2_1_5)
        .value("H2_2_0", MeOHSynthesisForm::H2_2_0)
        .value("H2_2_5", MeOHSynthesisForm::H2_2_5);

    nb::enum_<RWGSForm>(m, "RWGSForm").value("H2_0_5", RWGSForm::H2_0_5).value("H2_1_0", RWGSForm::H2_1_0);

    nb::enum_<MeOHfromCOForm>(m, "MeOHfromCOForm")
        .value("H2_0_5", MeOHfromCOForm::H2_0_5)
        .value("H2_1_0", MeOHfromCOForm::H2_1_0)
        .value("H2_1_5", MeOHfromCOForm::H2_1_5);

    nb::enum_<ObjectiveStrategy>(m, "ObjectiveStrategy")
        .value("PartialPressures", ObjectiveStrategy::PartialPressures)
        .value("FormationRates", ObjectiveStrategy::FormationRates)
        .value("Products", ObjectiveStrategy::Products);

    nb::enum_<SolverType>(m, "SolverType").value("BDF", SolverType::BDF).value("ADAMS", SolverType::ADAMS);

    // ==================== Rate laws ====================

    m.def("equilibrium_meoh_from_co", &equilibriumMeOHfromCO, "T"_a);
    m.def("equilibrium_rwgs", &equilibriumRWGS, "T"_a);
    m.def("equilibrium_meoh_direct", &equilibriumMeOHDirect, "T"_a);
    m.def("literature_parameters", &literatureParameters);
    m.def("default_parameter_bounds", &defaultParameterBounds);

    nb::class_<RateLawCombination>(m, "RateLawCombination")
        .def(nb::init<MeOHSynthesisForm, RWGSForm, MeOHfromCOForm>(), "meoh_synthesis"_a, "rwgs"_a,
             "meoh_from_co"_a)
        .def_static("from_id", &RateLawCombination::fromId, "id"_a)
        .def_static("from_index", &RateLawCombination::fromIndex, "index"_a)
        .def_static("all", &RateLawCombination::all)
        .def_prop_ro("id", &RateLawCombination::id)
        .def_prop_ro("index", &RateLawCombination::index)
        .def("driving_forces", &RateLawCombination::drivingForces, "p_bar"_a, "K_meoh_synthesis"_a, "K_rwgs"_a,
             "K_meoh_from_co"_a)
        .def("__repr__", [](const RateLawCombination& c) { return "<RateLawCombination " + c.id() + ">"; });

    nb::class_<KineticRateEvaluator>(m, "KineticRateEvaluator")
        .def(nb::init<const RateLawCombination&, realtype>(), "combination"_a,
             "rate_clip"_a = KineticRateEvaluator::default_rate_clip)
        .def(
            "rates",
            [](const KineticRateEvaluator& e, const Vector& parameters, realtype T, const SpeciesVector& p_bar) {
                return ReactionRates(e(parameters, T, p_bar));
            },
            "parameters"_a, "T"_a, "p_bar"_a)
        .def(
            "rates_batch",
            [](const KineticRateEvaluator& e, const Vector& parameters, const ColVector& T, const Array& p_bar) {
                return Array(e(parameters, T, p_bar));
            },
            "parameters"_a, "T"_a, "p_bar"_a)
        .def_prop_ro("combination", &KineticRateEvaluator::combination);

    // ==================== Reactor ====================

    nb::class_<ReactorParameters>(m, "ReactorParameters")
        .def(nb::init<>())
        .def_rw("length", &ReactorParameters::length)
        .def_rw("catalyst_bulk_density", &ReactorParameters::catalyst_bulk_density)
        .def_rw("catalyst_volume", &ReactorParameters::catalyst_volume)
        .def_rw("cross_section_area", &ReactorParameters::cross_section_area)
        .def_rw("contraction_min", &ReactorParameters::contraction_min)
        .def_rw("contraction_max", &ReactorParameters::contraction_max)
        .def_rw("rate_clip", &ReactorParameters::rate_clip)
        .def_rw("derivative_clip", &ReactorParameters::derivative_clip)
        .def("catalyst_mass", &ReactorParameters::catalystMass);

    nb::class_<SolverSettings>(m, "SolverSettings")
        .def(nb::init<>())
        .def_rw("type", &SolverSettings::type)
        .def_rw("reltol", &SolverSettings::reltol)
        .def_rw("abstol", &SolverSettings::abstol)
        .def_rw("max_steps", &SolverSettings::max_steps);

    nb::class_<ReactorExit>(m, "ReactorExit")
        .def_ro("c", &ReactorExit::c)
        .def_ro("p", &ReactorExit::p)
        .def_ro("contraction_factor", &ReactorExit::contraction_factor)
        .def_ro("u_exit", &ReactorExit::u_exit);

    nb::class_<PlugFlowReactor>(m, "PlugFlowReactor")
        .def(nb::init<const RateLawCombination&, const ReactorParameters&, const SolverSettings&, realtype>(),
             "combination"_a, "reactor_parameters"_a, "solver_settings"_a = SolverSettings(),
             "max_step_divisor"_a = PlugFlowReactor::default_max_step_divisor)
        .def("solve", &PlugFlowReactor::solve, "parameters"_a, "T"_a, "u_inlet"_a, "c_inlet"_a)
        .def(
            "exit_pressures",
            [](const PlugFlowReactor& r, const Vector& parameters, realtype T, realtype u_inlet,
               const SpeciesVector& c_inlet) { return r.exitPressures(parameters, T, u_inlet, c_inlet); },
            "parameters"_a, "T"_a, "u_inlet"_a, "c_inlet"_a);

    // ==================== Data and objective ====================

    nb::class_<ExperimentalDataset>(m, "ExperimentalDataset")
        .def(nb::init<>())
        .def_rw("T", &ExperimentalDataset::T)
        .def_rw("u_s", &ExperimentalDataset::u_s)
        .def_rw("p_in", &ExperimentalDataset::p_in)
        .def_rw("p_out", &ExperimentalDataset::p_out)
        .def_rw("r_MeOH", &ExperimentalDataset::r_MeOH)
        .def_rw("r_H2O", &ExperimentalDataset::r_H2O)
        .def("__len__", &ExperimentalDataset::size);

    m.def("load_experimental_data", &loadExperimentalData, "path"_a, "n_runs"_a = 0);

    nb::class_<BoundObjective>(m, "ObjectiveEvaluator")
        .def(
            "__init__",
            [](BoundObjective* self, const PlugFlowReactor& reactor, const ExperimentalDataset& data,
               const std::string& strategy) {
                auto owned_reactor = std::make_shared<const PlugFlowReactor>(reactor);
                auto owned_data = std::make_shared<const ExperimentalDataset>(data);
                auto evaluator =
                    std::make_unique<ObjectiveEvaluator>(*owned_reactor, *owned_data, parseObjectiveStrategy(strategy));
                new (self) BoundObjective{owned_reactor, owned_data, std::move(evaluator)};
            },
            "reactor"_a, "data"_a, "strategy"_a = "partial_pressures")
        .def(
            "__call__", [](const BoundObjective& o, const Vector& parameters) { return o.evaluator->evaluate(parameters); },
            "parameters"_a)
        .def(
            "exit_conditions",
            [](const BoundObjective& o, const Vector& parameters) { return o.evaluator->exitConditions(parameters); },
            "parameters"_a);

    // ==================== Optimization ====================

    nb::class_<OptimizationResult>(m, "OptimizationResult")
        .def_ro("combination_id", &OptimizationResult::combination_id)
        .def_ro("parameters", &OptimizationResult::parameters)
        .def_ro("score", &OptimizationResult::score)
        .def_ro("elapsed_minutes", &OptimizationResult::elapsed_minutes)
        .def_ro("deadline_exceeded", &OptimizationResult::deadline_exceeded)
        .def_ro("iterations", &OptimizationResult::iterations)
        .def_ro("evaluations", &OptimizationResult::evaluations)
        .def_ro("refined", &OptimizationResult::refined)
        .def_ro("success", &OptimizationResult::success)
        .def_ro("message", &OptimizationResult::message)
        .def("__repr__", [](const OptimizationResult& r) {
            return "<OptimizationResult " + r.combination_id + " score=" + std::to_string(r.score) + ">";
        });

    // Runs one complete optimization as described by a YAML configuration
    m.def(
        "optimize",
        [](const std::string& config_path, const std::string& combination_id) {
            const RunConfiguration config = RunConfigurationParser::load(config_path);
            const ExperimentalDataset data = loadExperimentalData(config.experiments.file, config.experiments.n_runs);
            const RateLawCombination combination = RateLawCombination::fromId(combination_id);
            const PlugFlowReactor reactor(combination, config.reactor, config.solver, config.max_step_divisor);
            const Deadline deadline(config.optimization.time_budget_seconds);
            OptimizationDriver driver(reactor, data, combination.id(), config.optimization, deadline);
            nb::gil_scoped_release release;
            return driver.run();
        },
        "config_path"_a, "combination_id"_a);
}
