#ifndef LOGGER_HPP
#define LOGGER_HPP

// Requires C++17 for <filesystem>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

// ––––––––––––––––––
// Configuration Flags
// ––––––––––––––––––
// Enable/disable logging (default: enabled)
#ifndef LOG_ENABLED
#define LOG_ENABLED 1
#endif

// Enable/disable benchmarking (default: enabled)
#ifndef BENCHMARK_ENABLED
#define BENCHMARK_ENABLED 1
#endif

// Optional: compile-time top-level output directory.
// Example: cmake -DKINFIT_OUTPUT_DIR=/scratch/kinfit ...
#ifdef OUTPUT_DIR
// nothing else required here; used in init_folders()
#endif

#ifndef LOG_FIRST_N_CALLS
#define LOG_FIRST_N_CALLS 100  // log first 100 calls of hot functions
#endif

#ifndef LOG_EVERY_N_CALLS
#define LOG_EVERY_N_CALLS 1000  // afterwards log every 1000th call
#endif

namespace logger {

// Forward declarations
inline void register_cleanup_handlers();

// Resolved folders: <top>/run_<timestamp>[_<tag>]/{logs,bench,results}
inline std::string log_folder;
inline std::string bench_folder;
inline std::string results_folder;
inline std::string run_folder;

// Optional suffix of the run folder, e.g. "worker_3" for MPI rank 3. Must be set before the first log call.
inline std::string run_tag;

// Optional top-level directory set at runtime (overrides OUTPUT_DIR and the current path)
inline std::string top_folder;

// protect one-time init & run_folder changes
inline std::mutex init_mutex;

// protect log_streams map and writes
inline std::mutex log_streams_mutex;
inline std::unordered_map<std::string, std::shared_ptr<std::ofstream>> log_streams;

// single write mutex used to make each LOG line atomic
inline std::mutex write_mutex;

// create timestamped folder name: run_YYYY-MM-DD_HH-MM-SS[_tag]
inline std::string make_timestamped_folder_name() {
    auto t = std::time(nullptr);
    auto tm = *std::localtime(&t);
    std::ostringstream name;
    name << "run_" << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S");
    if (!run_tag.empty()) name << "_" << run_tag;
    return name.str();
}

// Select the top-level output directory and the folder tag. Has no effect once folders exist.
inline void configure(const std::string& top_directory, const std::string& tag = "") {
    std::lock_guard<std::mutex> lock(init_mutex);
    if (!run_folder.empty()) return;
    top_folder = top_directory;
    run_tag = tag;
}

inline void init_folders() {
    std::lock_guard<std::mutex> lock(init_mutex);
    if (!log_folder.empty() && !bench_folder.empty() && !results_folder.empty() && !run_folder.empty())
        return;  // already inited

    std::filesystem::path top;
    if (!top_folder.empty()) {
        top = top_folder;
    } else {
#ifdef OUTPUT_DIR
        top = OUTPUT_DIR;
#else
        top = std::filesystem::current_path();
#endif
    }

    std::filesystem::path run = top / make_timestamped_folder_name();
    run_folder = run.string();

    std::filesystem::path path_logs = run / "logs";
    std::filesystem::create_directories(path_logs);
    log_folder = path_logs.string();

    std::filesystem::path path_bench = run / "bench";
    std::filesystem::create_directories(path_bench);
    bench_folder = path_bench.string();

    std::filesystem::path path_results = run / "results";
    std::filesystem::create_directories(path_results);
    results_folder = path_results.string();
}

// Return the directory for persisted results of this process (creates it if needed)
inline std::string results_dir() {
    init_folders();
    return results_folder;
}

// Ensure a stream (path relative to run_folder) is open and cached.
// relpath examples: "logs/driver.log", "bench/reactor.log"
inline std::shared_ptr<std::ofstream> ensure_log_stream(const std::string& relpath) {
    std::lock_guard<std::mutex> lock(log_streams_mutex);
    auto it = log_streams.find(relpath);
    if (it != log_streams.end()) return it->second;

    init_folders();
    register_cleanup_handlers();

    std::filesystem::path p = std::filesystem::path(run_folder) / relpath;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    auto ofs = std::make_shared<std::ofstream>(p.string(), std::ios::app | std::ios::binary);
    if (!ofs->is_open()) {
        std::filesystem::path fallback = std::filesystem::path(run_folder) / "unnamed.log";
        ofs->open(fallback.string(), std::ios::app | std::ios::binary);
    }

    log_streams.emplace(relpath, ofs);
    return ofs;
}

// convenience accessor returning reference (creates stream if missing)
inline std::ofstream& log_file(const std::string& relpath) { return *ensure_log_stream(relpath); }

inline void flush_all_logs() {
    std::lock_guard<std::mutex> lock(log_streams_mutex);
    for (auto& kv : log_streams) {
        if (kv.second && kv.second->is_open()) kv.second->flush();
    }
}

inline void close_all_logs() {
    std::lock_guard<std::mutex> lock(log_streams_mutex);
    for (auto& kv : log_streams) {
        if (kv.second && kv.second->is_open()) {
            kv.second->close();
        }
    }
    log_streams.clear();
}

// Flush/close logs on normal exit and on termination signals (long optimizations are often killed by the scheduler)
inline void register_cleanup_handlers() {
    static bool registered = false;
    if (!registered) {
        std::atexit([]() {
            flush_all_logs();
            close_all_logs();
        });

        auto signal_handler = [](int signal) {
            flush_all_logs();
            close_all_logs();
            std::signal(signal, SIG_DFL);
            std::raise(signal);
        };

        std::signal(SIGABRT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);
        std::signal(SIGSEGV, signal_handler);

        registered = true;
    }
}

}  // namespace logger

// ––––––––––––––––––
// Macros
// ––––––––––––––––––

// LOG(file, msg)
// file  : relative filename inside the logs folder (can include subdirs)
// msg   : <<-style stream expression (e.g. "combination=" << id)
#if LOG_ENABLED
#define LOG(file, msg)                                                 \
    do {                                                               \
        std::ostringstream _oss;                                       \
        _oss << msg;                                                   \
        std::lock_guard<std::mutex> _lg(logger::write_mutex);          \
        logger::log_file(std::string("logs/") + (file)) << _oss.str(); \
    } while (0)
#else
#define LOG(file, msg) \
    do {               \
    } while (0)
#endif

// LOG_BENCHMARK(file, msg)
// Identical to LOG except for activation macro and the "bench/" prefix
#if BENCHMARK_ENABLED
#define LOG_BENCHMARK(file, msg)                                        \
    do {                                                                \
        std::ostringstream _oss;                                        \
        _oss << msg;                                                    \
        std::lock_guard<std::mutex> _lg(logger::write_mutex);           \
        logger::log_file(std::string("bench/") + (file)) << _oss.str(); \
    } while (0)
#else
#define LOG_BENCHMARK(file, msg) \
    do {                         \
    } while (0)
#endif

// BENCHMARK(var, { code })
// - var must be a realtype declared by the caller
// - If BENCHMARK_ENABLED == 1: var is set to elapsed time in seconds
// - If BENCHMARK_ENABLED == 0: code executes but no timing machinery is used
// Usage:
//   realtype dt_s = 0.0;
//   BENCHMARK(dt_s, { reactor.solve(...); });
//   LOG_BENCHMARK("reactor.log", "solve time (s): " << dt_s);
#if BENCHMARK_ENABLED
#define BENCHMARK(var, code)                                                      \
    do {                                                                          \
        auto _bench_start = std::chrono::high_resolution_clock::now();            \
        code;                                                                     \
        auto _bench_end = std::chrono::high_resolution_clock::now();              \
        var = std::chrono::duration<realtype>(_bench_end - _bench_start).count(); \
    } while (0)
#else
#define BENCHMARK(var, code) \
    do {                     \
        code;                \
    } while (0)
#endif

#endif  // LOGGER_HPP
