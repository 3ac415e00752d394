#include <mpi.h>

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "Config/RunConfiguration.hpp"
#include "ConfigurationError.hpp"
#include "Dispatch/ResultExchange.hpp"
#include "IO/ExperimentalData.hpp"
#include "IO/ResultWriter.hpp"
#include "Logger.hpp"
#include "Optimization/Deadline.hpp"
#include "Optimization/OptimizationDriver.hpp"
#include "UnitOperations/PlugFlowReactor.hpp"

// One MPI rank per rate law combination. Ranks only communicate to agree on the configuration
// and to gather the final results on rank 0.
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    // The wall-clock budget covers the whole process
    const Deadline startup;

    int rank = 0;
    int world_size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &world_size);

    if (argc != 2) {
        if (rank == 0) std::cerr << "Usage: " << argv[0] << " <config.yaml>" << std::endl;
        MPI_Finalize();
        return 2;
    }

    // Every rank reads and validates the same configuration; nobody starts unless all succeeded
    RunConfiguration config;
    ExperimentalDataset data;
    int local_error = 0;
    try {
        config = RunConfigurationParser::load(argv[1]);
        if (config.combinations.size() != static_cast<std::size_t>(world_size)) {
            throw ConfigurationError("dispatch.combinations names " + std::to_string(config.combinations.size()) +
                                     " combinations but " + std::to_string(world_size) +
                                     " ranks were started; start exactly one rank per combination");
        }
        data = loadExperimentalData(config.experiments.file, config.experiments.n_runs);
    } catch (const std::exception& e) {
        std::cerr << "[rank " << rank << "] Configuration error: " << e.what() << std::endl;
        local_error = 1;
    }
    int any_error = 0;
    MPI_Allreduce(&local_error, &any_error, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);
    if (any_error) {
        MPI_Finalize();
        return 1;
    }

    logger::configure(config.output.directory, "worker_" + std::to_string(rank));

    const RateLawCombination& combination = config.combinations[static_cast<std::size_t>(rank)];
    const Deadline deadline(config.optimization.time_budget_seconds - startup.elapsedSeconds());

    LOG("driver.log", "Rank " << rank << "/" << world_size << " optimizing combination " << combination.id()
                              << " with objective " << toString(config.optimization.objective) << " over "
                              << data.size() << " runs\n");

    OptimizationResult result;
    result.combination_id = combination.id();
    try {
        PlugFlowReactor reactor(combination, config.reactor, config.solver, config.max_step_divisor);
        OptimizationDriver driver(reactor, data, combination.id(), config.optimization, deadline);
        result = driver.run();

        ResultWriter writer(logger::results_dir());
        writer.writeSummary(result);
        if (result.parameters.size() == kinetic_parameters::count && result.parameters.allFinite()) {
            writer.writeExitConditions(combination.id(), data, driver.objective().exitConditions(result.parameters));
        }
    } catch (const std::exception& e) {
        std::cerr << "[rank " << rank << "] Error: " << e.what() << std::endl;
        LOG("driver.log", "Rank " << rank << " failed: " << e.what() << "\n");
    }

    // Collect all results on rank 0
    const std::vector<double> record = result_exchange::pack(result);
    std::vector<double> gathered;
    if (rank == 0) gathered.resize(result_exchange::record_size * static_cast<std::size_t>(world_size));
    MPI_Gather(record.data(), static_cast<int>(result_exchange::record_size), MPI_DOUBLE, gathered.data(),
               static_cast<int>(result_exchange::record_size), MPI_DOUBLE, 0, MPI_COMM_WORLD);

    int exit_code = 0;
    if (rank == 0) {
        try {
            const auto ranked = rankResults(result_exchange::unpackAll(gathered));
            ResultWriter writer(logger::results_dir());
            const std::string ranking_path = writer.writeRanking(ranked);

            std::cout << "Ranking of " << ranked.size() << " combinations written to " << ranking_path << "\n";
            for (std::size_t i = 0; i < ranked.size(); ++i) {
                std::cout << std::setw(3) << (i + 1) << "  " << ranked[i].combination_id << "  " << std::scientific
                          << std::setprecision(6) << ranked[i].score
                          << (ranked[i].deadline_exceeded ? "  (deadline exceeded)" : "") << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[rank 0] Failed to write ranking: " << e.what() << std::endl;
            exit_code = 1;
        }
    }

    logger::flush_all_logs();
    MPI_Barrier(MPI_COMM_WORLD);
    MPI_Finalize();
    return exit_code;
}
