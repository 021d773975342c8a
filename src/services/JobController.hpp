/**
 * @file JobController.hpp
 * @brief Controller side of a fill job: start, stop, poll and reconcile
 *
 * The controller owns a registry of jobs keyed by working directory. It never
 * writes the status file and never talks to a worker directly: it starts the
 * worker through an IWorkerLauncher, signals cancellation with the stop marker,
 * and learns about progress by reading status.txt on every tick().
 *
 * The controller is single-threaded; all methods must be called from the
 * thread that drives tick() (normally the GLib main loop).
 */

#pragma once

#include "models/FillTypes.hpp"
#include "services/IWorkerLauncher.hpp"
#include "util/Result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class JobController {
public:
    static constexpr auto POLL_INTERVAL = std::chrono::seconds{1};
    static constexpr auto SHUTDOWN_TIMEOUT = std::chrono::seconds{5};

    explicit JobController(std::shared_ptr<IWorkerLauncher> launcher);
    ~JobController();

    JobController(const JobController&) = delete;
    JobController& operator=(const JobController&) = delete;

    /**
     * @brief Start a worker for @p config
     *
     * Refused when the configuration is invalid, when a job started by this
     * controller is still writing in the same directory, or when a stop marker
     * from an earlier run is present.
     */
    auto start_job(const WriteJobConfig& config) -> util::Result<JobHandle>;

    /**
     * @brief Ask the job in @p work_dir to stop by writing the cancellation marker
     * @return true if a writing job was signalled, false if there was nothing to stop
     */
    auto stop_job(const std::filesystem::path& work_dir) -> bool;

    /**
     * @brief Read the current snapshot of @p work_dir
     *
     * Does not change job state. For a directory this controller runs a job in,
     * fields that fail to parse keep the last value seen for that job.
     *
     * @return Snapshot, or std::nullopt if no status file exists ("not started")
     */
    [[nodiscard]] auto poll_status(const std::filesystem::path& work_dir) const
        -> std::optional<StatusSnapshot>;

    /**
     * @brief Chunk files of @p work_dir, oldest first, at most @p limit entries
     */
    [[nodiscard]] auto list_chunk_files(const std::filesystem::path& work_dir, size_t limit) const
        -> std::vector<ChunkFileInfo>;

    /**
     * @brief Reconcile every writing job with its status file and worker liveness
     *
     * Called once per POLL_INTERVAL. Jobs that already stopped writing are
     * left untouched.
     */
    void tick();

    [[nodiscard]] auto job_state(const std::filesystem::path& work_dir) const
        -> std::optional<JobState>;
    [[nodiscard]] auto is_writing(const std::filesystem::path& work_dir) const -> bool;
    [[nodiscard]] auto has_active_jobs() const -> bool;

    /**
     * @brief Unique token for a new run
     */
    [[nodiscard]] static auto generate_run_id() -> std::string;

private:
    struct Job {
        JobHandle handle;
        WriteJobConfig config;
        std::unique_ptr<IWorkerProcess> worker;
        JobState state;
        StatusSnapshot last_snapshot;  ///< Last snapshot carrying this job's run id
    };

    [[nodiscard]] static auto registry_key(const std::filesystem::path& work_dir)
        -> std::filesystem::path;

    /**
     * @brief Apply the status file to a writing job
     * @return true if the file carried this run's terminal line
     */
    static auto apply_status(Job& job) -> bool;
    static void reconcile(Job& job);

    std::shared_ptr<IWorkerLauncher> launcher_;
    std::map<std::filesystem::path, Job> jobs_;
};
