/**
 * @file ProcessWorkerLauncher.hpp
 * @brief Starts storage-filler-worker as a child process
 */

#pragma once

#include "services/IWorkerLauncher.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

/**
 * @class ProcessWorkerLauncher
 * @brief Spawns the worker executable through GLib and polls it with waitpid()
 */
class ProcessWorkerLauncher : public IWorkerLauncher {
public:
    /**
     * @param worker_binary Path of storage-filler-worker
     * @param log_dir Directory passed to the worker for its log file (empty: worker default)
     */
    ProcessWorkerLauncher(std::filesystem::path worker_binary, std::filesystem::path log_dir = {});

    auto launch(const WriteJobConfig& config, const std::string& run_id)
        -> util::Result<std::unique_ptr<IWorkerProcess>> override;

    /**
     * @brief Command line used to start a worker (argv[0] included)
     */
    [[nodiscard]] auto build_arguments(const WriteJobConfig& config, const std::string& run_id) const
        -> std::vector<std::string>;

    /**
     * @brief Locate the worker executable
     *
     * Checked in order: $STORAGE_FILLER_WORKER, the directory of the running
     * executable, then the install locations.
     *
     * @return Path of an executable worker, or std::nullopt if none was found
     */
    [[nodiscard]] static auto find_worker_binary() -> std::optional<std::filesystem::path>;

private:
    std::filesystem::path worker_binary_;
    std::filesystem::path log_dir_;
};

/**
 * @class WorkerChildProcess
 * @brief Child process handle; reaps the child once it has exited
 */
class WorkerChildProcess : public IWorkerProcess {
public:
    explicit WorkerChildProcess(pid_t pid);
    ~WorkerChildProcess() override;

    WorkerChildProcess(const WorkerChildProcess&) = delete;
    WorkerChildProcess& operator=(const WorkerChildProcess&) = delete;

    [[nodiscard]] auto is_alive() -> bool override;
    auto wait_for_exit(std::chrono::milliseconds timeout) -> bool override;
    [[nodiscard]] auto describe() const -> std::string override;

    /**
     * @brief Raw wait status once the child has been reaped
     */
    [[nodiscard]] auto exit_status() const -> std::optional<int> { return exit_status_; }

private:
    pid_t pid_;
    std::optional<int> exit_status_;
    bool exited_ = false;
};
