/**
 * @file ThreadWorkerLauncher.hpp
 * @brief Runs the write loop on a thread of the controller process
 *
 * The worker still communicates only through the working directory, so the
 * controller treats it exactly like a child process.
 */

#pragma once

#include "services/FillService.hpp"
#include "services/IChunkWriter.hpp"
#include "services/IWorkerLauncher.hpp"

#include <atomic>
#include <memory>
#include <thread>

class ThreadWorkerLauncher : public IWorkerLauncher {
public:
    explicit ThreadWorkerLauncher(std::shared_ptr<IChunkWriter> chunk_writer,
                                  FillOptions options = {});

    auto launch(const WriteJobConfig& config, const std::string& run_id)
        -> util::Result<std::unique_ptr<IWorkerProcess>> override;

private:
    std::shared_ptr<IChunkWriter> chunk_writer_;
    FillOptions options_;
};

/**
 * @class WorkerThread
 * @brief Thread running one FillService::run; joined on destruction
 */
class WorkerThread : public IWorkerProcess {
public:
    WorkerThread(std::shared_ptr<IChunkWriter> chunk_writer, FillOptions options,
                 WriteJobConfig config, std::string run_id);
    ~WorkerThread() override;

    WorkerThread(const WorkerThread&) = delete;
    WorkerThread& operator=(const WorkerThread&) = delete;

    [[nodiscard]] auto is_alive() -> bool override;
    auto wait_for_exit(std::chrono::milliseconds timeout) -> bool override;
    [[nodiscard]] auto describe() const -> std::string override;

private:
    // Shared with the thread so a late finish never touches a destroyed object
    struct ThreadState {
        std::atomic<bool> finished{false};
    };

    std::shared_ptr<ThreadState> state_;
    std::string run_id_;
    std::thread thread_;
};
