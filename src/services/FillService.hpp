/**
 * @file FillService.hpp
 * @brief Worker-side write loop
 *
 * Fills a working directory with sequentially numbered chunk files until the
 * directory reaches the target size or the cancellation marker appears, and
 * publishes a status snapshot after every chunk and once at termination.
 */

#pragma once

#include "models/FillTypes.hpp"
#include "services/IChunkWriter.hpp"
#include "util/Result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace protocol {
class StatusWriter;
}
class DirectoryService;

/**
 * @struct FillOptions
 * @brief Tunables of the write loop that are not part of the job itself
 */
struct FillOptions {
    std::chrono::milliseconds failure_backoff{1000};  ///< Pause after a failed chunk
};

/**
 * @struct FillOutcome
 * @brief Summary of one worker run
 */
struct FillOutcome {
    TerminalState terminal = TerminalState::NONE;
    uint64_t first_index = 0;         ///< Index the run started numbering at
    uint64_t last_index = 0;          ///< Highest index attempted (equals first_index - 1 if none)
    uint64_t chunks_written = 0;
    uint64_t chunks_failed = 0;
    uint64_t final_size_bytes = 0;
};

class FillService {
public:
    explicit FillService(std::shared_ptr<IChunkWriter> chunk_writer, FillOptions options = {});

    /**
     * @brief Run the write loop to completion on the calling thread
     *
     * Chunk I/O failures never end the run; they are counted in the ERRORS
     * field and the loop re-measures the directory and carries on. The first
     * chunk of a run is always attempted (unless the target is already met)
     * before the cancellation marker is consulted.
     *
     * @param config Job parameters
     * @param run_id Token echoed in every snapshot so the controller can tell
     *               this run's status from a leftover file
     * @return Outcome, or error if the job could not start (invalid config or
     *         unusable working directory)
     */
    auto run(const WriteJobConfig& config, const std::string& run_id) -> util::Result<FillOutcome>;

private:
    static void publish(protocol::StatusWriter& status, const DirectoryService& directory,
                        uint64_t file_counter, uint64_t error_count);
    static void finish(protocol::StatusWriter& status, TerminalState terminal, uint64_t size_bytes,
                       uint64_t file_counter, uint64_t error_count);

    std::shared_ptr<IChunkWriter> chunk_writer_;
    FillOptions options_;
};
