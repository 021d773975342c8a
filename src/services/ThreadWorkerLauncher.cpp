#include "services/ThreadWorkerLauncher.hpp"

#include "util/Logger.hpp"

#include <utility>

namespace {

constexpr auto COMPONENT = "ThreadWorkerLauncher";

}  // namespace

ThreadWorkerLauncher::ThreadWorkerLauncher(std::shared_ptr<IChunkWriter> chunk_writer,
                                           FillOptions options)
    : chunk_writer_(std::move(chunk_writer)), options_(options) {}

auto ThreadWorkerLauncher::launch(const WriteJobConfig& config, const std::string& run_id)
    -> util::Result<std::unique_ptr<IWorkerProcess>> {
    if (!chunk_writer_) {
        return util::make_error("No chunk writer configured for in-process worker");
    }

    LOG_INFO(COMPONENT, "Starting in-process worker for run " + run_id);
    return std::make_unique<WorkerThread>(chunk_writer_, options_, config, run_id);
}

WorkerThread::WorkerThread(std::shared_ptr<IChunkWriter> chunk_writer, FillOptions options,
                           WriteJobConfig config, std::string run_id)
    : state_(std::make_shared<ThreadState>()), run_id_(std::move(run_id)) {
    thread_ = std::thread([chunk_writer = std::move(chunk_writer), options,
                           config = std::move(config), run_id = run_id_, state = state_]() {
        FillService service(chunk_writer, options);
        auto outcome = service.run(config, run_id);
        if (!outcome) {
            LOG_ERROR(COMPONENT, "In-process worker for run " + run_id +
                                     " could not start: " + outcome.error().message);
        }
        state->finished.store(true);
    });
}

WorkerThread::~WorkerThread() {
    if (thread_.joinable()) {
        // Never detach: the loop owns open files in the working directory
        thread_.join();
    }
}

auto WorkerThread::is_alive() -> bool {
    return !state_->finished.load();
}

auto WorkerThread::wait_for_exit(std::chrono::milliseconds timeout) -> bool {
    auto start = std::chrono::steady_clock::now();
    while (is_alive()) {
        if (std::chrono::steady_clock::now() - start >= timeout) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return true;
}

auto WorkerThread::describe() const -> std::string {
    return "thread for run " + run_id_;
}
