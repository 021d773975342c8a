/**
 * @file CliApplication.hpp
 * @brief Command-line front end for storage-filler
 */

#pragma once

#include "models/FillTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class IWorkerLauncher;

namespace cli {

enum class Command {
    NONE,
    START,
    STOP,
    STATUS,
    LIST,
    CLEAR
};

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    Command command = Command::NONE;
    std::string parse_error;              ///< Non-empty when the command line is invalid

    std::filesystem::path work_dir;       ///< Empty: default_work_dir()
    double target_gb = 0.1;
    int64_t chunk_mb = 100;
    size_t list_limit = 10;
    bool json_output = false;
    bool force = false;
    bool in_process = false;
    std::filesystem::path log_dir;        ///< Empty: $XDG_DATA_HOME/storage-filler/logs

    /**
     * @brief Job configuration derived from the size and directory options
     */
    [[nodiscard]] auto to_job_config() const -> WriteJobConfig;
};

/**
 * @class CliApplication
 * @brief Drives fill jobs from the terminal
 *
 * Provides command-line interface for:
 * - Starting a job and following its progress until DONE or STOPPED
 * - Requesting cancellation of a running job
 * - Showing the status snapshot and listing chunk files
 * - Clearing the working directory
 */
class CliApplication {
public:
    CliApplication();
    ~CliApplication();

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @param argc Argument count
     * @param argv Argument values
     * @return Exit code (0 = success)
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed options
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    /**
     * @brief Print help message
     */
    static void print_help();

    /**
     * @brief Print version information
     */
    static void print_version();

    /**
     * @brief Default working directory, <tmp>/storage-filler
     */
    [[nodiscard]] static auto default_work_dir() -> std::filesystem::path;

private:
    /**
     * @brief Pick the worker launcher for a start command
     */
    [[nodiscard]] static auto make_launcher(const CliOptions& options)
        -> std::shared_ptr<IWorkerLauncher>;

    auto cmd_start(const CliOptions& options) -> int;
    auto cmd_stop(const CliOptions& options) -> int;
    auto cmd_status(const CliOptions& options) -> int;
    auto cmd_list(const CliOptions& options) -> int;
    auto cmd_clear(const CliOptions& options) -> int;

    void print_status_json(const std::filesystem::path& work_dir,
                           const std::optional<StatusSnapshot>& snapshot);
    void print_status_text(const std::filesystem::path& work_dir,
                           const std::optional<StatusSnapshot>& snapshot);

    /**
     * @brief Print chunk list as JSON
     */
    void print_chunks_json(const std::vector<ChunkFileInfo>& chunks);

    /**
     * @brief Print chunk list as table
     */
    void print_chunks_table(const std::vector<ChunkFileInfo>& chunks);
};

}  // namespace cli
