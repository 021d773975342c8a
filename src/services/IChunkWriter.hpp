/**
 * @file IChunkWriter.hpp
 * @brief Interface for producing one chunk file
 */

#pragma once

#include "util/Result.hpp"

#include <cstdint>
#include <filesystem>

/**
 * @class IChunkWriter
 * @brief Writes a single chunk file of an exact size
 */
class IChunkWriter {
public:
    virtual ~IChunkWriter() = default;

    /**
     * @brief Create (or truncate) @p path and fill it with @p size_bytes of data
     * @param path Chunk file to write
     * @param size_bytes Exact number of bytes to write
     * @return Bytes written, or the I/O error that interrupted the chunk. A
     *         partially written file is left in place on error.
     */
    virtual auto write_chunk(const std::filesystem::path& path, uint64_t size_bytes)
        -> util::Result<uint64_t> = 0;
};
