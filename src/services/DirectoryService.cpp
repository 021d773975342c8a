#include "services/DirectoryService.hpp"

#include "protocol/StatusProtocol.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>

DirectoryService::DirectoryService(std::filesystem::path work_dir)
    : work_dir_(std::move(work_dir)) {}

auto DirectoryService::status_path() const -> std::filesystem::path {
    return work_dir_ / protocol::STATUS_FILE_NAME;
}

auto DirectoryService::stop_marker_path() const -> std::filesystem::path {
    return work_dir_ / protocol::STOP_MARKER_FILE_NAME;
}

auto DirectoryService::chunk_path(uint64_t index) const -> std::filesystem::path {
    return work_dir_ / chunk_file_name(index);
}

auto DirectoryService::chunk_file_name(uint64_t index) -> std::string {
    return std::string(CHUNK_PREFIX) + std::to_string(index) + std::string(CHUNK_SUFFIX);
}

auto DirectoryService::parse_chunk_index(std::string_view file_name) -> std::optional<uint64_t> {
    if (!file_name.starts_with(CHUNK_PREFIX) || !file_name.ends_with(CHUNK_SUFFIX)) {
        return std::nullopt;
    }
    if (file_name.size() <= CHUNK_PREFIX.size() + CHUNK_SUFFIX.size()) {
        return std::nullopt;
    }

    auto digits = file_name.substr(CHUNK_PREFIX.size(),
                                   file_name.size() - CHUNK_PREFIX.size() - CHUNK_SUFFIX.size());
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }

    uint64_t index = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return index;
}

auto DirectoryService::ensure_exists() const -> util::Result<void> {
    std::error_code ec;
    std::filesystem::create_directories(work_dir_, ec);
    if (ec) {
        return util::make_error(
            "Failed to create working directory " + work_dir_.string() + ": " + ec.message(),
            ec.value());
    }
    if (!std::filesystem::is_directory(work_dir_, ec)) {
        return util::make_error(work_dir_.string() + " is not a directory");
    }
    return {};
}

auto DirectoryService::is_control_file(std::string_view file_name) -> bool {
    return file_name == protocol::STATUS_FILE_NAME || file_name == protocol::STOP_MARKER_FILE_NAME;
}

auto DirectoryService::directory_size_bytes() const -> uint64_t {
    std::error_code ec;
    std::filesystem::directory_iterator it(work_dir_, ec);
    if (ec) {
        return 0;
    }

    uint64_t total = 0;
    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || is_control_file(it->path().filename().string())) {
            continue;
        }
        auto size = it->file_size(entry_ec);
        if (!entry_ec) {
            total += size;
        }
    }
    return total;
}

auto DirectoryService::highest_chunk_index() const -> uint64_t {
    std::error_code ec;
    std::filesystem::directory_iterator it(work_dir_, ec);
    if (ec) {
        return 0;
    }

    uint64_t highest = 0;
    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        if (auto index = parse_chunk_index(it->path().filename().string())) {
            highest = std::max(highest, *index);
        }
    }
    return highest;
}

auto DirectoryService::stop_marker_present() const -> bool {
    std::error_code ec;
    return std::filesystem::exists(stop_marker_path(), ec);
}

auto DirectoryService::write_stop_marker() const -> util::Result<void> {
    if (stop_marker_present()) {
        return {};
    }

    std::ofstream marker(stop_marker_path());
    if (!marker.is_open()) {
        return util::make_error("Failed to create " + stop_marker_path().string());
    }
    marker << "stop\n";
    marker.close();
    if (marker.fail()) {
        return util::make_error("Failed to write " + stop_marker_path().string());
    }
    return {};
}

auto DirectoryService::clear_stop_marker() const -> util::Result<void> {
    std::error_code ec;
    std::filesystem::remove(stop_marker_path(), ec);
    if (ec) {
        return util::make_error(
            "Failed to remove " + stop_marker_path().string() + ": " + ec.message(), ec.value());
    }
    return {};
}

auto DirectoryService::list_chunk_files(size_t limit) const -> std::vector<ChunkFileInfo> {
    std::vector<ChunkFileInfo> files;

    std::error_code ec;
    std::filesystem::directory_iterator it(work_dir_, ec);
    if (ec) {
        return files;
    }

    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        auto name = it->path().filename().string();
        auto index = parse_chunk_index(name);
        if (!index) {
            continue;
        }

        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        auto size = it->file_size(entry_ec);
        if (entry_ec) {
            continue;
        }
        auto modified = it->last_write_time(entry_ec);
        if (entry_ec) {
            continue;
        }

        files.push_back(ChunkFileInfo{
            .name = std::move(name), .index = *index, .size_bytes = size, .modified = modified});
    }

    std::sort(files.begin(), files.end(), [](const ChunkFileInfo& a, const ChunkFileInfo& b) {
        if (a.modified != b.modified) {
            return a.modified < b.modified;
        }
        return a.index < b.index;
    });

    if (files.size() > limit) {
        files.resize(limit);
    }
    return files;
}

auto DirectoryService::clear_data() const -> util::Result<size_t> {
    std::error_code ec;
    std::filesystem::directory_iterator it(work_dir_, ec);
    if (ec) {
        return util::make_error(
            "Failed to list " + work_dir_.string() + ": " + ec.message(), ec.value());
    }

    // Collect first; removing entries while iterating is unspecified
    std::vector<std::filesystem::path> doomed;
    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            doomed.push_back(it->path());
        }
    }

    size_t removed = 0;
    for (const auto& path : doomed) {
        std::error_code remove_ec;
        if (std::filesystem::remove(path, remove_ec)) {
            ++removed;
        } else if (remove_ec) {
            LOG_WARNING("DirectoryService",
                        "Failed to delete " + path.string() + ": " + remove_ec.message());
        }
    }

    LOG_INFO("DirectoryService",
             "Cleared " + std::to_string(removed) + " files from " + work_dir_.string());
    return removed;
}
