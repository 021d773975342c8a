/**
 * @file ChunkWriter.hpp
 * @brief Chunk writer producing random alphanumeric content
 */

#pragma once

#include "services/IChunkWriter.hpp"

#include <cstddef>

/**
 * @class ChunkWriter
 * @brief Writes chunks in bounded sub-chunks so a chunk is never held in memory whole
 */
class ChunkWriter : public IChunkWriter {
public:
    static constexpr size_t DEFAULT_SUB_CHUNK_SIZE = 10 * 1024 * 1024;  // 10 MiB per write

    explicit ChunkWriter(size_t sub_chunk_size = DEFAULT_SUB_CHUNK_SIZE);

    auto write_chunk(const std::filesystem::path& path, uint64_t size_bytes)
        -> util::Result<uint64_t> override;

    [[nodiscard]] auto sub_chunk_size() const -> size_t { return sub_chunk_size_; }

private:
    size_t sub_chunk_size_;
};
