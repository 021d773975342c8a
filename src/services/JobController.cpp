#include "services/JobController.hpp"

#include "protocol/StatusProtocol.hpp"
#include "services/DirectoryService.hpp"
#include "util/Logger.hpp"

#include <atomic>
#include <sstream>

#include <unistd.h>

namespace {

constexpr auto COMPONENT = "JobController";

auto describe_state(const JobState& state) -> std::string {
    std::ostringstream oss;
    oss << "size " << state.current_size_gb << " GB, files " << state.file_count << ", errors "
        << state.error_count;
    return oss.str();
}

}  // namespace

JobController::JobController(std::shared_ptr<IWorkerLauncher> launcher)
    : launcher_(std::move(launcher)) {}

JobController::~JobController() {
    for (auto& [key, job] : jobs_) {
        if (!job.state.writing || !job.worker || !job.worker->is_alive()) {
            continue;
        }

        LOG_WARNING(COMPONENT, "Shutting down with a job still writing in " + key.string() +
                                   ", requesting stop");
        stop_job(key);
        if (!job.worker->wait_for_exit(SHUTDOWN_TIMEOUT)) {
            LOG_ERROR(COMPONENT, "Worker " + job.worker->describe() + " did not stop within " +
                                     std::to_string(SHUTDOWN_TIMEOUT.count()) + "s");
        }
    }
}

auto JobController::registry_key(const std::filesystem::path& work_dir) -> std::filesystem::path {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(work_dir, ec);
    if (ec) {
        absolute = work_dir;
    }
    auto canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        canonical = absolute;
    }
    auto key = canonical.lexically_normal();
    // "/a/b/" and "/a/b" name the same directory
    if (!key.has_filename() && key.has_parent_path() && key != key.root_path()) {
        key = key.parent_path();
    }
    return key;
}

auto JobController::generate_run_id() -> std::string {
    static std::atomic<unsigned> sequence{0};

    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    std::ostringstream oss;
    oss << now << '-' << ::getpid() << '-' << ++sequence;
    return oss.str();
}

auto JobController::start_job(const WriteJobConfig& config) -> util::Result<JobHandle> {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    if (!launcher_) {
        return util::make_error("No worker launcher configured");
    }

    auto key = registry_key(config.work_dir);
    if (auto it = jobs_.find(key); it != jobs_.end() && it->second.state.writing) {
        return util::make_error("A job is already writing in " + key.string());
    }

    DirectoryService directory(key);
    if (auto exists = directory.ensure_exists(); !exists) {
        return std::unexpected(exists.error());
    }
    if (directory.stop_marker_present()) {
        return util::make_error("Stop marker " + directory.stop_marker_path().string() +
                                " is left over from an earlier run; remove it before starting");
    }

    WriteJobConfig job_config = config;
    job_config.work_dir = key;

    auto run_id = generate_run_id();
    auto worker = launcher_->launch(job_config, run_id);
    if (!worker) {
        LOG_ERROR(COMPONENT, "Failed to start worker in " + key.string() + ": " +
                                 worker.error().message);
        return std::unexpected(worker.error());
    }

    Job job;
    job.handle = JobHandle{.work_dir = key, .run_id = run_id};
    job.config = job_config;
    job.worker = std::move(*worker);
    job.state.writing = true;
    job.state.current_size_gb =
        static_cast<double>(directory.directory_size_bytes()) / BYTES_PER_GB;
    job.state.file_count = static_cast<int64_t>(directory.highest_chunk_index());
    job.last_snapshot.run_id = run_id;

    LOG_INFO(COMPONENT, "Started run " + run_id + " in " + key.string() + " with " +
                            job.worker->describe());

    auto handle = job.handle;
    jobs_.insert_or_assign(key, std::move(job));
    return handle;
}

auto JobController::stop_job(const std::filesystem::path& work_dir) -> bool {
    auto it = jobs_.find(registry_key(work_dir));
    if (it == jobs_.end() || !it->second.state.writing) {
        return false;
    }

    DirectoryService directory(it->first);
    if (auto written = directory.write_stop_marker(); !written) {
        LOG_ERROR(COMPONENT, "Failed to request stop: " + written.error().message);
        return false;
    }

    it->second.state.stop_requested = true;
    LOG_INFO(COMPONENT, "Stop requested for run " + it->second.handle.run_id);
    return true;
}

auto JobController::poll_status(const std::filesystem::path& work_dir) const
    -> std::optional<StatusSnapshot> {
    auto key = registry_key(work_dir);
    DirectoryService directory(key);

    StatusSnapshot previous;
    if (auto it = jobs_.find(key); it != jobs_.end()) {
        previous = it->second.last_snapshot;
    }
    return protocol::read_status_file(directory.status_path(), previous);
}

auto JobController::list_chunk_files(const std::filesystem::path& work_dir, size_t limit) const
    -> std::vector<ChunkFileInfo> {
    return DirectoryService(registry_key(work_dir)).list_chunk_files(limit);
}

void JobController::tick() {
    for (auto& [key, job] : jobs_) {
        reconcile(job);
    }
}

auto JobController::apply_status(Job& job) -> bool {
    DirectoryService directory(job.handle.work_dir);
    auto snapshot = protocol::read_status_file(directory.status_path(), job.last_snapshot);
    if (!snapshot) {
        return false;
    }

    if (snapshot->run_id != job.handle.run_id) {
        LOG_DEBUG(COMPONENT, "Ignoring status of run '" + snapshot->run_id + "' in " +
                                 job.handle.work_dir.string());
        return false;
    }

    job.last_snapshot = *snapshot;
    job.state.current_size_gb = snapshot->size_gb;
    job.state.file_count = snapshot->file_count;
    job.state.error_count = snapshot->error_count;

    if (!snapshot->is_terminal()) {
        return false;
    }

    job.state.writing = false;
    job.state.terminal = snapshot->terminal;
    LOG_INFO(COMPONENT, "Run " + job.handle.run_id + " finished " +
                            terminal_state_to_string(snapshot->terminal) + ": " +
                            describe_state(job.state));
    return true;
}

void JobController::reconcile(Job& job) {
    if (!job.state.writing) {
        return;
    }

    if (apply_status(job)) {
        return;
    }

    if (job.worker && !job.worker->is_alive()) {
        // The worker may have written its terminal line between the read above
        // and the liveness check
        if (apply_status(job)) {
            return;
        }

        job.state.writing = false;
        job.state.terminal = TerminalState::STOPPED;
        job.state.worker_exited_without_status = true;
        LOG_WARNING(COMPONENT, "Worker " + job.worker->describe() + " for run " +
                                   job.handle.run_id +
                                   " exited without a terminal status; treating as stopped");
    }
}

auto JobController::job_state(const std::filesystem::path& work_dir) const
    -> std::optional<JobState> {
    auto it = jobs_.find(registry_key(work_dir));
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

auto JobController::is_writing(const std::filesystem::path& work_dir) const -> bool {
    auto state = job_state(work_dir);
    return state && state->writing;
}

auto JobController::has_active_jobs() const -> bool {
    for (const auto& [key, job] : jobs_) {
        if (job.state.writing) {
            return true;
        }
    }
    return false;
}
