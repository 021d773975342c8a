/**
 * @file StatusProtocol.hpp
 * @brief Text format of status.txt, shared by the worker and the controller
 *
 * Format version 1, one field per line:
 *
 *     VERSION:1
 *     RUN:<run id>
 *     SIZE:<directory size in GB>
 *     FILES:<highest chunk index written>
 *     ERRORS:<failed chunk attempts in this run>
 *     DONE | STOPPED            (only as the last line of a finished run)
 *
 * Readers take the last occurrence of every keyed line, so the file may be
 * either rewritten or appended to. A line starting with DONE or STOPPED anywhere
 * in the file marks the run as finished. Unknown keys are ignored.
 */

#pragma once

#include "models/FillTypes.hpp"
#include "util/Result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace protocol {

constexpr int STATUS_FORMAT_VERSION = 1;

constexpr std::string_view STATUS_FILE_NAME = "status.txt";
constexpr std::string_view STOP_MARKER_FILE_NAME = "stop.txt";

constexpr std::string_view KEY_VERSION = "VERSION:";
constexpr std::string_view KEY_RUN = "RUN:";
constexpr std::string_view KEY_SIZE = "SIZE:";
constexpr std::string_view KEY_FILES = "FILES:";
constexpr std::string_view KEY_ERRORS = "ERRORS:";
constexpr std::string_view LINE_DONE = "DONE";
constexpr std::string_view LINE_STOPPED = "STOPPED";

/**
 * @brief Serialize the keyed block of a snapshot (no terminal line)
 */
[[nodiscard]] auto encode_fields(const StatusSnapshot& snapshot) -> std::string;

/**
 * @brief Terminal line for a finished run, including the newline
 * @return Empty string for TerminalState::NONE
 */
[[nodiscard]] auto encode_terminal(TerminalState state) -> std::string;

/**
 * @brief Serialize a full snapshot, terminal line last
 */
[[nodiscard]] auto encode_status(const StatusSnapshot& snapshot) -> std::string;

/**
 * @brief Decode status file content
 *
 * Fields that are absent, or whose last line does not parse, keep the value
 * from @p previous. The terminal state is only ever raised by the content:
 * a previous terminal state is kept, a NONE content never clears it.
 *
 * @param content Raw file content, possibly torn by a concurrent write
 * @param previous Last known snapshot
 */
[[nodiscard]] auto decode_status(std::string_view content, const StatusSnapshot& previous = {})
    -> StatusSnapshot;

/**
 * @brief Read and decode a status file
 * @return Decoded snapshot, or std::nullopt if the file does not exist or cannot be read
 */
[[nodiscard]] auto read_status_file(const std::filesystem::path& path,
                                    const StatusSnapshot& previous = {})
    -> std::optional<StatusSnapshot>;

/**
 * @class StatusWriter
 * @brief Single writer of status.txt for one worker run
 *
 * Every publish() rewrites the keyed block; finish() rewrites it once more and
 * appends the terminal line. After finish() the writer refuses further writes,
 * so a finished snapshot is never overwritten by the same run.
 */
class StatusWriter {
public:
    StatusWriter(std::filesystem::path status_path, std::string run_id);

    /**
     * @brief Publish a progress snapshot (terminal state NONE)
     */
    auto publish(double size_gb, int64_t file_count, int64_t error_count) -> util::Result<void>;

    /**
     * @brief Publish the final snapshot followed by the terminal line
     * @param terminal DONE or STOPPED
     */
    auto finish(TerminalState terminal, double size_gb, int64_t file_count, int64_t error_count)
        -> util::Result<void>;

    [[nodiscard]] auto is_finished() const -> bool { return finished_; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return status_path_; }

private:
    auto write_content(const std::string& content, bool append) -> util::Result<void>;

    std::filesystem::path status_path_;
    std::string run_id_;
    bool finished_ = false;
};

}  // namespace protocol
