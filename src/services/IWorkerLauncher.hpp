/**
 * @file IWorkerLauncher.hpp
 * @brief Interfaces for starting a fill worker and watching its liveness
 */

#pragma once

#include "models/FillTypes.hpp"
#include "util/Result.hpp"

#include <chrono>
#include <memory>
#include <string>

/**
 * @class IWorkerProcess
 * @brief Execution context of one running worker
 *
 * The controller never talks to the worker through this object; it only asks
 * whether the worker is still alive. Everything else goes through files.
 */
class IWorkerProcess {
public:
    virtual ~IWorkerProcess() = default;

    /**
     * @brief Non-blocking liveness check
     * @return false once the worker has exited, for any reason
     */
    [[nodiscard]] virtual auto is_alive() -> bool = 0;

    /**
     * @brief Block until the worker exits or the timeout expires
     * @return true if the worker has exited
     */
    virtual auto wait_for_exit(std::chrono::milliseconds timeout) -> bool = 0;

    /**
     * @brief Human-readable identity for logs ("pid 1234", "thread")
     */
    [[nodiscard]] virtual auto describe() const -> std::string = 0;
};

/**
 * @class IWorkerLauncher
 * @brief Starts a worker for one job
 */
class IWorkerLauncher {
public:
    virtual ~IWorkerLauncher() = default;

    /**
     * @brief Start a worker running the write loop for @p config
     * @param config Validated job parameters
     * @param run_id Token the worker must write into every snapshot
     * @return Handle to the running worker, or error if it could not be started
     */
    virtual auto launch(const WriteJobConfig& config, const std::string& run_id)
        -> util::Result<std::unique_ptr<IWorkerProcess>> = 0;
};
