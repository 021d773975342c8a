/**
 * @file DirectoryService.hpp
 * @brief Layout and inspection of a fill working directory
 *
 * The working directory is the unit of measurement and the only channel between
 * the controller and the worker. It holds:
 * - data_chunk_<N>.dat  chunk payloads, N starting at 1
 * - status.txt          status snapshot written by the worker
 * - stop.txt            cancellation marker written by the controller
 */

#pragma once

#include "models/FillTypes.hpp"
#include "util/Result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class DirectoryService {
public:
    static constexpr std::string_view CHUNK_PREFIX = "data_chunk_";
    static constexpr std::string_view CHUNK_SUFFIX = ".dat";

    explicit DirectoryService(std::filesystem::path work_dir);

    [[nodiscard]] auto work_dir() const -> const std::filesystem::path& { return work_dir_; }
    [[nodiscard]] auto status_path() const -> std::filesystem::path;
    [[nodiscard]] auto stop_marker_path() const -> std::filesystem::path;
    [[nodiscard]] auto chunk_path(uint64_t index) const -> std::filesystem::path;

    /**
     * @brief Create the working directory if it does not exist
     */
    auto ensure_exists() const -> util::Result<void>;

    /**
     * @brief Sum of the sizes of the regular files directly in the directory
     *
     * status.txt and stop.txt are not counted, so a target below the size of
     * the status file still gets its chunk. Files that disappear while the
     * directory is being listed are skipped. A missing directory measures 0.
     */
    [[nodiscard]] auto directory_size_bytes() const -> uint64_t;

    /**
     * @brief Highest N among data_chunk_<N>.dat files, 0 if there are none
     */
    [[nodiscard]] auto highest_chunk_index() const -> uint64_t;

    [[nodiscard]] auto stop_marker_present() const -> bool;

    /**
     * @brief Create stop.txt; an existing marker is left as is
     */
    auto write_stop_marker() const -> util::Result<void>;

    /**
     * @brief Remove stop.txt if present
     */
    auto clear_stop_marker() const -> util::Result<void>;

    /**
     * @brief Chunk files sorted by modification time, oldest first
     *
     * Files with equal timestamps are ordered by chunk index.
     *
     * @param limit Maximum number of entries returned
     */
    [[nodiscard]] auto list_chunk_files(size_t limit) const -> std::vector<ChunkFileInfo>;

    /**
     * @brief Delete every regular file in the directory
     * @return Number of files removed, or error if the directory cannot be listed
     */
    auto clear_data() const -> util::Result<size_t>;

    /**
     * @brief Extract N from "data_chunk_<N>.dat"
     * @return std::nullopt for any other name
     */
    [[nodiscard]] static auto parse_chunk_index(std::string_view file_name)
        -> std::optional<uint64_t>;

    [[nodiscard]] static auto chunk_file_name(uint64_t index) -> std::string;

    /**
     * @brief True for status.txt and stop.txt
     */
    [[nodiscard]] static auto is_control_file(std::string_view file_name) -> bool;

private:
    std::filesystem::path work_dir_;
};
