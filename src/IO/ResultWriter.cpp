#include "IO/ResultWriter.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "Dispatch/ResultExchange.hpp"
#include "IO/NumpyIO.hpp"
#include "Logger.hpp"
#include "Reactions/KineticRates.hpp"
#include "Reactions/Species.hpp"

namespace {

std::string timestamp() {
    auto t = std::time(nullptr);
    auto tm = *std::localtime(&t);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

std::ofstream openCsv(const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open '" + path + "' for writing");
    }
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    return out;
}

void writeResultHeader(std::ofstream& out) {
    out << "combination_id,score,elapsed_minutes,deadline_exceeded,success,refined,iterations,evaluations";
    for (const auto& name : kinetic_parameters::names) out << "," << name;
}

void writeResultRow(std::ofstream& out, const OptimizationResult& result) {
    out << result.combination_id << "," << result.score << "," << result.elapsed_minutes << ","
        << result.deadline_exceeded << "," << result.success << "," << result.refined << "," << result.iterations
        << "," << result.evaluations;
    for (Eigen::Index i = 0; i < kinetic_parameters::count; ++i) {
        out << ",";
        if (i < result.parameters.size()) out << result.parameters(i);
    }
}

}  // namespace

ResultWriter::ResultWriter(const std::string& directory) : directory_(directory) {
    std::filesystem::create_directories(directory_);
}

std::string ResultWriter::path(const std::string& filename) const {
    return (std::filesystem::path(directory_) / filename).string();
}

std::string ResultWriter::writeSummary(const OptimizationResult& result) const {
    const std::string csv_path = path("summary_" + result.combination_id + ".csv");
    std::ofstream out = openCsv(csv_path);
    writeResultHeader(out);
    out << ",timestamp\n";
    writeResultRow(out, result);
    out << "," << timestamp() << "\n";

    if (result.parameters.size() == kinetic_parameters::count) {
        KinFit::npy_save<realtype>(path("best_parameters_" + result.combination_id + ".npy"),
                                   result.parameters.data(), {static_cast<size_t>(kinetic_parameters::count)});
    }

    LOG("results.log", "Saved summary of combination " << result.combination_id << " to " << csv_path << "\n");
    return csv_path;
}

std::string ResultWriter::writeExitConditions(const std::string& combination_id,
                                              const ExperimentalDataset& data,
                                              const Array& p_exit_model) const {
    if (p_exit_model.rows() != data.size() || p_exit_model.cols() != n_species) {
        throw std::invalid_argument("Model exit pressures must be n_runs x " + std::to_string(n_species));
    }

    const std::string csv_path = path("exit_conditions_" + combination_id + ".csv");
    std::ofstream out = openCsv(csv_path);
    out << "run,T,u_s";
    for (const auto& s : species::names) out << ",p_out_model_" << s;
    for (const auto& s : species::names) out << ",p_out_measured_" << s;
    out << "\n";
    for (Eigen::Index run = 0; run < data.size(); ++run) {
        out << run << "," << data.T(run) << "," << data.u_s(run);
        for (Eigen::Index s = 0; s < n_species; ++s) out << "," << p_exit_model(run, s);
        for (Eigen::Index s = 0; s < n_species; ++s) out << "," << data.p_out(run, s);
        out << "\n";
    }

    std::vector<int> failed(static_cast<std::size_t>(data.size()));
    for (Eigen::Index run = 0; run < data.size(); ++run) {
        failed[static_cast<std::size_t>(run)] = p_exit_model.row(run).allFinite() ? 0 : 1;
    }

    const std::string npz_path = path("exit_conditions_" + combination_id + ".npz");
    KinFit::npz_save(npz_path, "T", data.T, "w");
    KinFit::npz_save(npz_path, "u_s", data.u_s, "a");
    KinFit::npz_save(npz_path, "p_in", data.p_in, "a");
    KinFit::npz_save(npz_path, "p_out_measured", data.p_out, "a");
    KinFit::npz_save(npz_path, "p_out_model", p_exit_model, "a");
    KinFit::npz_save<int>(npz_path, "failed", failed.data(), {failed.size()}, "a");

    LOG("results.log", "Saved exit conditions of combination " << combination_id << " (" << data.size()
                                                               << " runs) to " << csv_path << " and " << npz_path
                                                               << "\n");
    return csv_path;
}

std::string ResultWriter::writeRanking(const std::vector<OptimizationResult>& results) const {
    const std::string csv_path = path("ranking.csv");
    std::ofstream out = openCsv(csv_path);
    out << "rank,";
    writeResultHeader(out);
    out << "\n";

    const auto ranked = rankResults(results);
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        out << (i + 1) << ",";
        writeResultRow(out, ranked[i]);
        out << "\n";
    }

    LOG("results.log", "Saved ranking of " << ranked.size() << " combinations to " << csv_path << "\n");
    return csv_path;
}
