/**
 * @file WorkerCommand.hpp
 * @brief Command line of storage-filler-worker
 */

#pragma once

#include "models/FillTypes.hpp"
#include "util/Result.hpp"

#include <filesystem>
#include <string>

namespace worker {

constexpr int EXIT_FINISHED = 0;       ///< Run ended with DONE or STOPPED
constexpr int EXIT_START_FAILED = 1;   ///< Working directory unusable
constexpr int EXIT_USAGE = 2;          ///< Invalid arguments

/**
 * @struct WorkerOptions
 * @brief Parsed worker command line
 */
struct WorkerOptions {
    WriteJobConfig config;
    std::string run_id;
    std::filesystem::path log_dir;   ///< Empty: $XDG_DATA_HOME/storage-filler/logs
    bool verbose = false;
    bool show_help = false;
};

/**
 * @brief Parse the worker command line
 *
 * Required: --dir, --target-bytes, --chunk-bytes. Optional: --run-id,
 * --log-dir, --verbose, --help.
 */
[[nodiscard]] auto parse_worker_args(int argc, char* argv[]) -> util::Result<WorkerOptions>;

void print_worker_usage();

/**
 * @brief Run one fill job to completion
 * @return Process exit code
 */
auto run_worker(const WorkerOptions& options) -> int;

}  // namespace worker
