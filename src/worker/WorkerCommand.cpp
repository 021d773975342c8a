#include "worker/WorkerCommand.hpp"

#include "services/ChunkWriter.hpp"
#include "services/FillService.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string_view>

#include <getopt.h>
#include <unistd.h>

namespace worker {

namespace {

constexpr auto APP_NAME = "storage-filler-worker";

enum LongOnlyOption {
    OPT_LOG_DIR = 1000,
};

const struct option long_options[] = {
    {        "dir", required_argument, nullptr,         'd'},
    {"target-bytes", required_argument, nullptr,         't'},
    { "chunk-bytes", required_argument, nullptr,         'c'},
    {      "run-id", required_argument, nullptr,         'r'},
    {     "log-dir", required_argument, nullptr, OPT_LOG_DIR},
    {     "verbose",       no_argument, nullptr,         'v'},
    {        "help",       no_argument, nullptr,         'h'},
    {       nullptr,                 0, nullptr,           0}
};

template<typename T>
auto parse_value(std::string_view text) -> std::optional<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto default_log_dir() -> std::filesystem::path {
    return std::filesystem::path(g_get_user_data_dir()) / "storage-filler" / "logs";
}

}  // namespace

auto parse_worker_args(int argc, char* argv[]) -> util::Result<WorkerOptions> {
    WorkerOptions options;
    bool have_dir = false;
    bool have_target = false;
    bool have_chunk = false;

    // Full rescan on every call (GNU getopt)
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "d:t:c:r:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'd':
                options.config.work_dir = optarg;
                have_dir = true;
                break;
            case 't': {
                auto value = parse_value<double>(optarg);
                if (!value) {
                    return util::make_error(std::string("Invalid --target-bytes value '") +
                                            optarg + "'");
                }
                options.config.target_size_bytes = *value;
                have_target = true;
                break;
            }
            case 'c': {
                auto value = parse_value<int64_t>(optarg);
                if (!value) {
                    return util::make_error(std::string("Invalid --chunk-bytes value '") +
                                            optarg + "'");
                }
                options.config.chunk_size_bytes = *value;
                have_chunk = true;
                break;
            }
            case 'r':
                options.run_id = optarg;
                break;
            case OPT_LOG_DIR:
                options.log_dir = optarg;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'h':
                options.show_help = true;
                return options;
            default:
                return util::make_error("Unknown or incomplete option");
        }
    }

    if (optind < argc) {
        return util::make_error(std::string("Unexpected argument '") + argv[optind] + "'");
    }
    if (!have_dir || !have_target || !have_chunk) {
        return util::make_error("--dir, --target-bytes and --chunk-bytes are required");
    }
    if (auto valid = options.config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return options;
}

void print_worker_usage() {
    std::cout << "Usage: " << APP_NAME << " --dir PATH --target-bytes N --chunk-bytes N [OPTIONS]\n\n"
              << "Fills PATH with data_chunk_<N>.dat files until it holds at least\n"
              << "--target-bytes, publishing progress in PATH/status.txt. Stops early\n"
              << "when PATH/stop.txt appears.\n\n"
              << "Options:\n"
              << "  -d, --dir PATH          Working directory\n"
              << "  -t, --target-bytes N    Target directory size in bytes\n"
              << "  -c, --chunk-bytes N     Size of each chunk file in bytes\n"
              << "  -r, --run-id ID         Run identifier written to status.txt\n"
              << "      --log-dir PATH      Log directory\n"
              << "  -v, --verbose           Debug logging, mirrored to stderr\n"
              << "  -h, --help              Show this help message\n"
              << std::endl;
}

auto run_worker(const WorkerOptions& options) -> int {
    auto log_dir = options.log_dir.empty() ? default_log_dir() : options.log_dir;
    auto& logger = util::Logger::instance();
    auto level = options.verbose ? util::LogLevel::DEBUG : util::LogLevel::INFO;
    if (auto initialized = logger.initialize(log_dir, APP_NAME, level); !initialized) {
        std::cerr << "Warning: " << initialized.error().message << std::endl;
    }
    logger.set_console_output(options.verbose);

    auto run_id = options.run_id.empty() ? "pid-" + std::to_string(::getpid()) : options.run_id;
    logger.set_run_context(run_id);

    FillService service(std::make_shared<ChunkWriter>());
    auto outcome = service.run(options.config, run_id);
    if (!outcome) {
        LOG_ERROR("Worker", "Run " + run_id + " could not start: " + outcome.error().message);
        std::cerr << "Error: " << outcome.error().message << std::endl;
        logger.shutdown();
        return EXIT_START_FAILED;
    }

    logger.shutdown();
    return EXIT_FINISHED;
}

}  // namespace worker
