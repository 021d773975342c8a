#include "services/FillService.hpp"

#include "protocol/StatusProtocol.hpp"
#include "services/DirectoryService.hpp"
#include "util/Logger.hpp"

#include <thread>
#include <utility>

namespace {

constexpr auto COMPONENT = "FillService";

auto to_gb(uint64_t bytes) -> double {
    return static_cast<double>(bytes) / BYTES_PER_GB;
}

}  // namespace

FillService::FillService(std::shared_ptr<IChunkWriter> chunk_writer, FillOptions options)
    : chunk_writer_(std::move(chunk_writer)), options_(options) {}

auto FillService::run(const WriteJobConfig& config, const std::string& run_id)
    -> util::Result<FillOutcome> {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    if (!chunk_writer_) {
        return util::make_error("No chunk writer configured");
    }

    DirectoryService directory(config.work_dir);
    if (auto exists = directory.ensure_exists(); !exists) {
        return std::unexpected(exists.error());
    }

    protocol::StatusWriter status(directory.status_path(), run_id);
    const auto chunk_size = static_cast<uint64_t>(config.chunk_size_bytes);

    uint64_t file_counter = directory.highest_chunk_index();
    FillOutcome outcome{.first_index = file_counter + 1, .last_index = file_counter};

    LOG_INFO(COMPONENT, "Run " + run_id + " filling " + config.work_dir.string() + " to " +
                            std::to_string(config.target_size_bytes) + " bytes in chunks of " +
                            std::to_string(chunk_size) + " bytes, next chunk index " +
                            std::to_string(outcome.first_index));

    publish(status, directory, file_counter, outcome.chunks_failed);

    uint64_t attempts = 0;
    while (true) {
        const uint64_t current_size = directory.directory_size_bytes();

        if (static_cast<double>(current_size) >= config.target_size_bytes) {
            outcome.terminal = TerminalState::DONE;
            outcome.final_size_bytes = current_size;
            finish(status, TerminalState::DONE, current_size, file_counter, outcome.chunks_failed);
            break;
        }

        if (attempts > 0 && directory.stop_marker_present()) {
            outcome.terminal = TerminalState::STOPPED;
            outcome.final_size_bytes = current_size;
            finish(status, TerminalState::STOPPED, current_size, file_counter,
                   outcome.chunks_failed);
            break;
        }

        ++file_counter;
        ++attempts;
        outcome.last_index = file_counter;

        auto chunk_path = directory.chunk_path(file_counter);
        auto written = chunk_writer_->write_chunk(chunk_path, chunk_size);
        if (!written) {
            ++outcome.chunks_failed;
            LOG_WARNING(COMPONENT, "Chunk " + std::to_string(file_counter) +
                                       " failed, continuing: " + written.error().message);
            publish(status, directory, file_counter, outcome.chunks_failed);
            std::this_thread::sleep_for(options_.failure_backoff);
            continue;
        }

        ++outcome.chunks_written;
        LOG_DEBUG(COMPONENT, "Wrote " + chunk_path.filename().string());
        publish(status, directory, file_counter, outcome.chunks_failed);
    }

    LOG_INFO(COMPONENT, "Run " + run_id + " finished " + terminal_state_to_string(outcome.terminal) +
                            ": " + std::to_string(outcome.chunks_written) + " chunks written, " +
                            std::to_string(outcome.chunks_failed) + " failed, directory size " +
                            std::to_string(outcome.final_size_bytes) + " bytes");
    return outcome;
}

void FillService::publish(protocol::StatusWriter& status, const DirectoryService& directory,
                          uint64_t file_counter, uint64_t error_count) {
    auto result = status.publish(to_gb(directory.directory_size_bytes()),
                                 static_cast<int64_t>(file_counter),
                                 static_cast<int64_t>(error_count));
    if (!result) {
        LOG_WARNING(COMPONENT, "Status update skipped: " + result.error().message);
    }
}

void FillService::finish(protocol::StatusWriter& status, TerminalState terminal,
                         uint64_t size_bytes, uint64_t file_counter, uint64_t error_count) {
    auto result = status.finish(terminal, to_gb(size_bytes), static_cast<int64_t>(file_counter),
                                static_cast<int64_t>(error_count));
    if (!result) {
        // The controller falls back to process-exit detection
        LOG_ERROR(COMPONENT, "Failed to record terminal status: " + result.error().message);
    }
}
