/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "cli/ProgressDisplay.hpp"
#include "config.h"
#include "protocol/StatusProtocol.hpp"
#include "services/ChunkWriter.hpp"
#include "services/DirectoryService.hpp"
#include "services/JobController.hpp"
#include "services/ProcessWorkerLauncher.hpp"
#include "services/ThreadWorkerLauncher.hpp"
#include "util/Logger.hpp"

#include <glib-unix.h>
#include <glib.h>

#include <unistd.h>

#include <charconv>
#include <chrono>
#include <cmath>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string_view>

#include <getopt.h>

namespace cli {

namespace {

// Application name
constexpr auto APP_NAME = "storage-filler";
constexpr auto LOG_NAME = "storage-filler-cli";

constexpr int64_t MIB = 1024 * 1024;
// Largest --chunk-mb whose byte count fits in int64_t
constexpr int64_t MAX_CHUNK_MB = std::numeric_limits<int64_t>::max() / MIB;

enum LongOnlyOption {
    OPT_LOG_DIR = 1000,
};

// Command line options
const struct option long_options[] = {
    {      "help",       no_argument, nullptr,         'h'},
    {   "version",       no_argument, nullptr,         'V'},
    {     "start",       no_argument, nullptr,         's'},
    {      "stop",       no_argument, nullptr,         'x'},
    {    "status",       no_argument, nullptr,         'S'},
    {      "list",       no_argument, nullptr,         'l'},
    {     "clear",       no_argument, nullptr,         'c'},
    {       "dir", required_argument, nullptr,         'd'},
    { "target-gb", required_argument, nullptr,         't'},
    {  "chunk-mb", required_argument, nullptr,         'm'},
    {     "limit", required_argument, nullptr,         'n'},
    {      "json",       no_argument, nullptr,         'j'},
    {     "force",       no_argument, nullptr,         'f'},
    {"in-process",       no_argument, nullptr,         'i'},
    {   "log-dir", required_argument, nullptr, OPT_LOG_DIR},
    {     nullptr,                 0, nullptr,           0}
};

template<typename T>
auto parse_number(std::string_view text) -> std::optional<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto json_escape(const std::string& text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            default:
                escaped += c;
                break;
        }
    }
    return escaped;
}

auto format_time(std::filesystem::file_time_type time) -> std::string {
    auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(time));
    std::time_t seconds = std::chrono::system_clock::to_time_t(system_time);

    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

auto snapshot_status_text(const std::optional<StatusSnapshot>& snapshot) -> std::string {
    if (!snapshot) {
        return "Not started";
    }
    switch (snapshot->terminal) {
        case TerminalState::DONE:
            return "Finished (target reached)";
        case TerminalState::STOPPED:
            return "Stopped";
        case TerminalState::NONE:
            break;
    }
    return "Writing in progress";
}

auto snapshot_shows_running_job(const std::optional<StatusSnapshot>& snapshot) -> bool {
    return snapshot && !snapshot->is_terminal();
}

/**
 * @brief State shared with the GLib sources of a start command
 */
struct FollowContext {
    JobController* controller = nullptr;
    ProgressDisplay* display = nullptr;
    GMainLoop* loop = nullptr;
    std::filesystem::path work_dir;
    bool stop_signalled = false;
};

auto on_poll_tick(gpointer user_data) -> gboolean {
    auto* ctx = static_cast<FollowContext*>(user_data);

    ctx->controller->tick();
    auto state = ctx->controller->job_state(ctx->work_dir);
    if (!state || !state->writing) {
        g_main_loop_quit(ctx->loop);
        return G_SOURCE_REMOVE;
    }

    ctx->display->update(*state);
    return G_SOURCE_CONTINUE;
}

auto on_stop_signal(gpointer user_data) -> gboolean {
    auto* ctx = static_cast<FollowContext*>(user_data);

    if (ctx->stop_signalled) {
        std::cerr << "\nStop already requested, waiting for the worker to finish..." << std::endl;
        return G_SOURCE_CONTINUE;
    }

    ctx->stop_signalled = true;
    std::cerr << "\nCancellation requested..." << std::endl;
    if (!ctx->controller->stop_job(ctx->work_dir)) {
        LOG_WARNING("CLI", "Stop signal received but no job is writing in " +
                               ctx->work_dir.string());
    }
    return G_SOURCE_CONTINUE;
}

}  // namespace

auto CliOptions::to_job_config() const -> WriteJobConfig {
    return WriteJobConfig{
        .target_size_bytes = target_gb * BYTES_PER_GB,
        .chunk_size_bytes = chunk_mb * MIB,
        .work_dir = work_dir.empty() ? CliApplication::default_work_dir() : work_dir,
    };
}

CliApplication::CliApplication() = default;

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    if (!options.parse_error.empty()) {
        std::cerr << "Error: " << options.parse_error << "\n"
                  << "Run with --help for usage.\n";
        return 2;
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    auto log_dir = options.log_dir.empty()
                       ? std::filesystem::path(g_get_user_data_dir()) / "storage-filler" / "logs"
                       : options.log_dir;
    if (auto initialized = util::Logger::instance().initialize(log_dir, LOG_NAME); !initialized) {
        std::cerr << "Warning: " << initialized.error().message << "\n";
    }

    switch (options.command) {
        case Command::START:
            return cmd_start(options);
        case Command::STOP:
            return cmd_stop(options);
        case Command::STATUS:
            return cmd_status(options);
        case Command::LIST:
            return cmd_list(options);
        case Command::CLEAR:
            return cmd_clear(options);
        case Command::NONE:
            break;
    }

    // No command specified
    print_help();
    return 1;
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    auto set_command = [&options](Command command) {
        if (options.command != Command::NONE && options.command != command) {
            options.parse_error = "Only one of --start, --stop, --status, --list, --clear may be given";
        }
        options.command = command;
    };

    // Full rescan on every call (GNU getopt)
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVsxSlcd:t:m:n:jfi", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 's':
                set_command(Command::START);
                break;
            case 'x':
                set_command(Command::STOP);
                break;
            case 'S':
                set_command(Command::STATUS);
                break;
            case 'l':
                set_command(Command::LIST);
                break;
            case 'c':
                set_command(Command::CLEAR);
                break;
            case 'd':
                options.work_dir = optarg;
                break;
            case 't': {
                auto value = parse_number<double>(optarg);
                if (!value || !std::isfinite(*value) || *value <= 0.0 ||
                    !std::isfinite(*value * BYTES_PER_GB)) {
                    options.parse_error = std::string("Invalid --target-gb value '") + optarg +
                                          "' (expected a positive finite number)";
                } else {
                    options.target_gb = *value;
                }
                break;
            }
            case 'm': {
                auto value = parse_number<int64_t>(optarg);
                if (!value || *value <= 0 || *value > MAX_CHUNK_MB) {
                    options.parse_error = std::string("Invalid --chunk-mb value '") + optarg +
                                          "' (expected an integer from 1 to " +
                                          std::to_string(MAX_CHUNK_MB) + ")";
                } else {
                    options.chunk_mb = *value;
                }
                break;
            }
            case 'n': {
                auto value = parse_number<size_t>(optarg);
                if (!value) {
                    options.parse_error = std::string("Invalid --limit value '") + optarg + "'";
                } else {
                    options.list_limit = *value;
                }
                break;
            }
            case 'j':
                options.json_output = true;
                break;
            case 'f':
                options.force = true;
                break;
            case 'i':
                options.in_process = true;
                break;
            case OPT_LOG_DIR:
                options.log_dir = optarg;
                break;
            default:
                options.parse_error = "Unknown or incomplete option";
                break;
        }
    }

    if (options.parse_error.empty() && optind < argc) {
        options.parse_error = std::string("Unexpected argument '") + argv[optind] + "'";
    }

    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " COMMAND [OPTIONS]\n\n"
              << "Fill a directory with generated data files up to a target size\n\n"
              << "Commands:\n"
              << "  -s, --start             Start writing and follow progress (Ctrl-C stops)\n"
              << "  -x, --stop              Ask the running job to stop\n"
              << "  -S, --status            Show the current status\n"
              << "  -l, --list              List chunk files, oldest first\n"
              << "  -c, --clear             Delete all files in the working directory\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -V, --version           Show version information\n"
              << "  -d, --dir <path>        Working directory (default: "
              << default_work_dir().string() << ")\n"
              << "  -t, --target-gb <n>     Target directory size in GB (default: 0.1)\n"
              << "  -m, --chunk-mb <n>      Chunk file size in MB (default: 100)\n"
              << "  -i, --in-process        Write on a thread instead of a worker process\n"
              << "  -n, --limit <n>         Entries to show with --list (default: 10)\n"
              << "  -j, --json              Output in JSON format (with --list, --status)\n"
              << "  -f, --force             Clear even if a job appears to be running\n"
              << "      --log-dir <path>    Log directory\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --start --target-gb 2 --chunk-mb 256\n"
              << "  " << APP_NAME << " --status --json\n"
              << "  " << APP_NAME << " --list --limit 20\n"
              << "  " << APP_NAME << " --stop\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of Storage Filler - directory fill tool\n";
}

auto CliApplication::default_work_dir() -> std::filesystem::path {
    return std::filesystem::path(g_get_tmp_dir()) / "storage-filler";
}

auto CliApplication::make_launcher(const CliOptions& options) -> std::shared_ptr<IWorkerLauncher> {
    if (options.in_process) {
        return std::make_shared<ThreadWorkerLauncher>(std::make_shared<ChunkWriter>());
    }

    auto worker = ProcessWorkerLauncher::find_worker_binary();
    if (!worker) {
        return nullptr;
    }
    LOG_DEBUG("CLI", "Using worker " + worker->string());
    return std::make_shared<ProcessWorkerLauncher>(*worker, options.log_dir);
}

auto CliApplication::cmd_start(const CliOptions& options) -> int {
    auto config = options.to_job_config();

    auto launcher = make_launcher(options);
    if (!launcher) {
        LOG_ERROR("CLI", "storage-filler-worker not found");
        std::cerr << "Error: storage-filler-worker not found.\n"
                  << "Set STORAGE_FILLER_WORKER or use --in-process.\n";
        return 1;
    }

    JobController controller(launcher);
    auto handle = controller.start_job(config);
    if (!handle) {
        LOG_ERROR("CLI", "Failed to start job: " + handle.error().message);
        std::cerr << "Error: " << handle.error().message << "\n";
        return 1;
    }

    ProgressDisplay display(handle->work_dir.string(), config.target_size_bytes,
                            config.chunk_size_bytes);

    FollowContext ctx;
    ctx.controller = &controller;
    ctx.display = &display;
    ctx.work_dir = handle->work_dir;
    ctx.loop = g_main_loop_new(nullptr, FALSE);

    if (auto state = controller.job_state(handle->work_dir)) {
        display.update(*state);
    }

    g_timeout_add_seconds(static_cast<guint>(JobController::POLL_INTERVAL.count()), on_poll_tick,
                          &ctx);
    guint sigint_source = g_unix_signal_add(SIGINT, on_stop_signal, &ctx);
    guint sigterm_source = g_unix_signal_add(SIGTERM, on_stop_signal, &ctx);

    g_main_loop_run(ctx.loop);

    g_source_remove(sigint_source);
    g_source_remove(sigterm_source);
    g_main_loop_unref(ctx.loop);

    auto state = controller.job_state(handle->work_dir);
    if (!state) {
        return 1;
    }
    display.complete(*state);

    if (state->terminal == TerminalState::DONE) {
        return 0;
    }
    // A stop we asked for is a clean finish
    return state->stop_requested && !state->worker_exited_without_status ? 0 : 1;
}

auto CliApplication::cmd_stop(const CliOptions& options) -> int {
    DirectoryService directory(options.to_job_config().work_dir);
    auto snapshot = protocol::read_status_file(directory.status_path());

    if (!snapshot_shows_running_job(snapshot)) {
        std::cout << "No job is writing in " << directory.work_dir().string() << ".\n";
        return 1;
    }

    if (auto written = directory.write_stop_marker(); !written) {
        LOG_ERROR("CLI", "Failed to write stop marker: " + written.error().message);
        std::cerr << "Error: " << written.error().message << "\n";
        return 1;
    }

    LOG_INFO("CLI", "Stop requested for run '" + snapshot->run_id + "' in " +
                        directory.work_dir().string());
    std::cout << "Stop requested. The job stops after its current chunk.\n";
    return 0;
}

auto CliApplication::cmd_status(const CliOptions& options) -> int {
    JobController controller(nullptr);
    auto work_dir = options.to_job_config().work_dir;
    auto snapshot = controller.poll_status(work_dir);

    if (options.json_output) {
        print_status_json(work_dir, snapshot);
    } else {
        print_status_text(work_dir, snapshot);
    }
    return 0;
}

auto CliApplication::cmd_list(const CliOptions& options) -> int {
    JobController controller(nullptr);
    auto chunks = controller.list_chunk_files(options.to_job_config().work_dir,
                                              options.list_limit);

    if (chunks.empty()) {
        if (options.json_output) {
            std::cout << "[]\n";
        } else {
            std::cout << "No chunk files found.\n";
        }
        return 0;
    }

    if (options.json_output) {
        print_chunks_json(chunks);
    } else {
        print_chunks_table(chunks);
    }

    return 0;
}

auto CliApplication::cmd_clear(const CliOptions& options) -> int {
    DirectoryService directory(options.to_job_config().work_dir);

    if (!options.force) {
        auto snapshot = protocol::read_status_file(directory.status_path());
        if (snapshot_shows_running_job(snapshot)) {
            std::cerr << "Error: A job appears to be writing in " << directory.work_dir().string()
                      << ".\nStop it first, or use --force.\n";
            return 1;
        }
    }

    auto removed = directory.clear_data();
    if (!removed) {
        LOG_ERROR("CLI", "Failed to clear " + directory.work_dir().string() + ": " +
                             removed.error().message);
        std::cerr << "Error: " << removed.error().message << "\n";
        return 1;
    }

    std::cout << "Removed " << *removed << " files from " << directory.work_dir().string()
              << ".\n";
    return 0;
}

void CliApplication::print_status_json(const std::filesystem::path& work_dir,
                                       const std::optional<StatusSnapshot>& snapshot) {
    std::cout << "{\n";
    std::cout << "  \"directory\": \"" << json_escape(work_dir.string()) << "\",\n";
    std::cout << "  \"started\": " << (snapshot ? "true" : "false") << ",\n";
    std::cout << "  \"writing\": " << (snapshot_shows_running_job(snapshot) ? "true" : "false")
              << ",\n";
    if (snapshot) {
        std::cout << "  \"run_id\": \"" << json_escape(snapshot->run_id) << "\",\n";
        std::cout << "  \"size_gb\": " << snapshot->size_gb << ",\n";
        std::cout << "  \"file_count\": " << snapshot->file_count << ",\n";
        std::cout << "  \"error_count\": " << snapshot->error_count << ",\n";
    }
    std::cout << "  \"terminal\": \""
              << terminal_state_to_string(snapshot ? snapshot->terminal : TerminalState::NONE)
              << "\"\n";
    std::cout << "}\n";
}

void CliApplication::print_status_text(const std::filesystem::path& work_dir,
                                       const std::optional<StatusSnapshot>& snapshot) {
    constexpr int COL_LABEL = 12;

    std::cout << std::left << std::setw(COL_LABEL) << "Directory:" << work_dir.string() << "\n";
    std::cout << std::left << std::setw(COL_LABEL) << "Status:" << snapshot_status_text(snapshot)
              << "\n";
    if (!snapshot) {
        return;
    }

    std::cout << std::left << std::setw(COL_LABEL) << "Size:" << std::fixed
              << std::setprecision(3) << snapshot->size_gb << " GB\n";
    std::cout << std::left << std::setw(COL_LABEL) << "Files:" << snapshot->file_count << "\n";
    if (snapshot->error_count > 0) {
        std::cout << std::left << std::setw(COL_LABEL) << "Errors:" << snapshot->error_count
                  << "\n";
    }
    if (!snapshot->run_id.empty()) {
        std::cout << std::left << std::setw(COL_LABEL) << "Run:" << snapshot->run_id << "\n";
    }
}

void CliApplication::print_chunks_json(const std::vector<ChunkFileInfo>& chunks) {
    std::cout << "[\n";
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];

        std::cout << "  {\n";
        std::cout << "    \"name\": \"" << json_escape(chunk.name) << "\",\n";
        std::cout << "    \"index\": " << chunk.index << ",\n";
        std::cout << "    \"size_bytes\": " << chunk.size_bytes << ",\n";
        std::cout << "    \"modified\": \"" << format_time(chunk.modified) << "\"\n";
        std::cout << "  }" << (i < chunks.size() - 1 ? "," : "") << "\n";
    }
    std::cout << "]\n";
}

void CliApplication::print_chunks_table(const std::vector<ChunkFileInfo>& chunks) {
    // Column widths for table formatting
    constexpr int COL_NAME = 28;
    constexpr int COL_SIZE = 12;
    constexpr int COL_MODIFIED = 20;

    std::cout << std::left << std::setw(COL_NAME) << "NAME" << std::setw(COL_SIZE) << "SIZE"
              << std::setw(COL_MODIFIED) << "MODIFIED"
              << "\n";
    std::cout << std::string(COL_NAME + COL_SIZE + COL_MODIFIED, '-') << "\n";

    for (const auto& chunk : chunks) {
        std::cout << std::left << std::setw(COL_NAME) << chunk.name << std::setw(COL_SIZE)
                  << ProgressDisplay::format_bytes(static_cast<double>(chunk.size_bytes))
                  << std::setw(COL_MODIFIED) << format_time(chunk.modified) << "\n";
    }
}

}  // namespace cli
