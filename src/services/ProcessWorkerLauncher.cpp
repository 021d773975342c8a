#include "services/ProcessWorkerLauncher.hpp"

#include "util/Logger.hpp"
#include "util/WriteHelpers.hpp"

#include <glib.h>

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <thread>

#include <sys/wait.h>

namespace {

constexpr auto COMPONENT = "ProcessWorkerLauncher";
constexpr auto WORKER_BINARY_NAME = "storage-filler-worker";
constexpr auto WORKER_ENV_VARIABLE = "STORAGE_FILLER_WORKER";

// Install locations, in order of preference
constexpr const char* WORKER_INSTALL_PATHS[] = {
    "/usr/local/libexec/storage-filler/storage-filler-worker",
    "/usr/libexec/storage-filler/storage-filler-worker",
    "/usr/local/bin/storage-filler-worker",
    "/usr/bin/storage-filler-worker"
};

auto is_executable(const std::filesystem::path& path) -> bool {
    return g_file_test(path.c_str(), G_FILE_TEST_IS_EXECUTABLE) &&
           !g_file_test(path.c_str(), G_FILE_TEST_IS_DIR);
}

// Shortest representation that reads back to the same double
auto format_bytes_exact(double value) -> std::string {
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string(buffer.data(), ptr);
}

}  // namespace

ProcessWorkerLauncher::ProcessWorkerLauncher(std::filesystem::path worker_binary,
                                             std::filesystem::path log_dir)
    : worker_binary_(std::move(worker_binary)), log_dir_(std::move(log_dir)) {}

auto ProcessWorkerLauncher::find_worker_binary() -> std::optional<std::filesystem::path> {
    if (const gchar* from_env = g_getenv(WORKER_ENV_VARIABLE); from_env && *from_env) {
        if (is_executable(from_env)) {
            return std::filesystem::path(from_env);
        }
        LOG_WARNING(COMPONENT, std::string(WORKER_ENV_VARIABLE) + " points to " + from_env +
                                   ", which is not executable");
    }

    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        auto sibling = self.parent_path() / WORKER_BINARY_NAME;
        if (is_executable(sibling)) {
            return sibling;
        }
    }

    for (const auto* path : WORKER_INSTALL_PATHS) {
        if (is_executable(path)) {
            return std::filesystem::path(path);
        }
    }
    return std::nullopt;
}

auto ProcessWorkerLauncher::build_arguments(const WriteJobConfig& config,
                                            const std::string& run_id) const
    -> std::vector<std::string> {
    std::vector<std::string> args = {
        worker_binary_.string(),
        "--dir", config.work_dir.string(),
        "--target-bytes", format_bytes_exact(config.target_size_bytes),
        "--chunk-bytes", std::to_string(config.chunk_size_bytes),
        "--run-id", run_id
    };
    if (!log_dir_.empty()) {
        args.emplace_back("--log-dir");
        args.push_back(log_dir_.string());
    }
    return args;
}

auto ProcessWorkerLauncher::launch(const WriteJobConfig& config, const std::string& run_id)
    -> util::Result<std::unique_ptr<IWorkerProcess>> {
    if (!is_executable(worker_binary_)) {
        return util::make_error("Worker executable not found at " + worker_binary_.string());
    }

    auto args = build_arguments(config, run_id);
    std::vector<gchar*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    GPid child_pid = 0;
    GError* error = nullptr;

    gboolean spawned = g_spawn_async(
        nullptr,        // working directory
        argv.data(),    // arguments
        nullptr,        // environment (inherit)
        static_cast<GSpawnFlags>(G_SPAWN_DO_NOT_REAP_CHILD | G_SPAWN_STDOUT_TO_DEV_NULL),
        nullptr,        // child setup
        nullptr,        // user data
        &child_pid,
        &error
    );

    if (!spawned) {
        std::string message = std::string("Failed to spawn worker: ") +
                              (error ? error->message : "Unknown error");
        if (error) {
            g_error_free(error);
        }
        return util::make_error(message);
    }

    LOG_INFO(COMPONENT, "Started worker pid " + std::to_string(child_pid) + " for run " + run_id);
    return std::make_unique<WorkerChildProcess>(child_pid);
}

WorkerChildProcess::WorkerChildProcess(pid_t pid) : pid_(pid) {}

WorkerChildProcess::~WorkerChildProcess() {
    if (!is_alive()) {
        return;
    }
    // The worker keeps running on its own; it is re-parented once we exit
    LOG_WARNING(COMPONENT, "Worker " + describe() + " still running while its handle is released");
}

auto WorkerChildProcess::is_alive() -> bool {
    if (exited_) {
        return false;
    }

    int wait_status = 0;
    pid_t result = util::retry_on_eintr([&] { return waitpid(pid_, &wait_status, WNOHANG); });
    int wait_errno = errno;
    if (result == 0) {
        return true;
    }

    exited_ = true;
    if (result == pid_) {
        exit_status_ = wait_status;
        if (WIFEXITED(wait_status)) {
            LOG_INFO(COMPONENT, "Worker " + describe() + " exited with code " +
                                    std::to_string(WEXITSTATUS(wait_status)));
        } else if (WIFSIGNALED(wait_status)) {
            LOG_WARNING(COMPONENT, "Worker " + describe() + " killed by signal " +
                                       std::to_string(WTERMSIG(wait_status)));
        }
    } else {
        LOG_WARNING(COMPONENT,
                    "Lost track of worker " + describe() + ": " + std::strerror(wait_errno));
    }
    g_spawn_close_pid(pid_);
    return false;
}

auto WorkerChildProcess::wait_for_exit(std::chrono::milliseconds timeout) -> bool {
    auto start = std::chrono::steady_clock::now();
    while (is_alive()) {
        if (std::chrono::steady_clock::now() - start >= timeout) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
    }
    return true;
}

auto WorkerChildProcess::describe() const -> std::string {
    return "pid " + std::to_string(pid_);
}
