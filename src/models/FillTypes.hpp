/**
 * @file FillTypes.hpp
 * @brief Data types shared by the fill worker and the job controller
 */

#pragma once

#include "util/Result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

/**
 * @enum TerminalState
 * @brief Final state of a worker run as recorded in the status file
 */
enum class TerminalState {
    NONE,     ///< Worker still running (or never finished)
    DONE,     ///< Target size reached
    STOPPED   ///< Cancellation marker observed, or worker died without a terminal line
};

/**
 * @struct WriteJobConfig
 * @brief Parameters of one fill job, fixed at start
 */
struct WriteJobConfig {
    double target_size_bytes = 0.0;     ///< Stop once the directory holds at least this much
    int64_t chunk_size_bytes = 0;       ///< Size of every generated chunk file
    std::filesystem::path work_dir;     ///< Directory holding chunks, status and marker

    /**
     * @brief Check that both sizes are positive and a directory is set
     */
    [[nodiscard]] auto validate() const -> util::Result<void>;

    auto operator==(const WriteJobConfig&) const -> bool = default;
};

/**
 * @struct StatusSnapshot
 * @brief Decoded content of status.txt
 */
struct StatusSnapshot {
    int format_version = 1;
    std::string run_id;                       ///< Empty when the file carries no RUN line
    double size_gb = 0.0;
    int64_t file_count = 0;
    int64_t error_count = 0;
    TerminalState terminal = TerminalState::NONE;

    [[nodiscard]] auto is_terminal() const -> bool { return terminal != TerminalState::NONE; }

    auto operator==(const StatusSnapshot&) const -> bool = default;
};

/**
 * @struct ChunkFileInfo
 * @brief One row of the chunk file listing
 */
struct ChunkFileInfo {
    std::string name;
    uint64_t index = 0;                               ///< N in data_chunk_<N>.dat
    uint64_t size_bytes = 0;
    std::filesystem::file_time_type modified{};
};

/**
 * @struct JobState
 * @brief Controller-side view of a job, reconciled on every poll tick
 */
struct JobState {
    bool writing = false;
    bool stop_requested = false;                 ///< Marker written by this controller
    double current_size_gb = 0.0;
    int64_t file_count = 0;
    int64_t error_count = 0;
    TerminalState terminal = TerminalState::NONE;
    bool worker_exited_without_status = false;  ///< Implicit stop detected from process death

    auto operator==(const JobState&) const -> bool = default;
};

/**
 * @struct JobHandle
 * @brief Identifies a started job
 */
struct JobHandle {
    std::filesystem::path work_dir;
    std::string run_id;
};

constexpr double BYTES_PER_GB = 1024.0 * 1024.0 * 1024.0;

[[nodiscard]] auto terminal_state_to_string(TerminalState state) -> std::string;
