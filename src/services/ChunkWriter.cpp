#include "services/ChunkWriter.hpp"

#include "util/FileDescriptor.hpp"
#include "util/RandomBuffer.hpp"
#include "util/WriteHelpers.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

ChunkWriter::ChunkWriter(size_t sub_chunk_size)
    : sub_chunk_size_(std::max<size_t>(sub_chunk_size, 1)) {}

auto ChunkWriter::write_chunk(const std::filesystem::path& path, uint64_t size_bytes)
    -> util::Result<uint64_t> {
    auto fd = util::FileDescriptor::open_for_write(path);
    if (!fd) {
        int err = errno;
        return util::make_error("Failed to create " + path.string() + ": " + std::strerror(err),
                                err);
    }

    std::vector<char> buffer(
        static_cast<size_t>(std::min<uint64_t>(sub_chunk_size_, size_bytes)));
    uint64_t written = 0;

    while (written < size_bytes) {
        auto to_write = static_cast<size_t>(std::min<uint64_t>(buffer.size(), size_bytes - written));
        buffer.resize(to_write);
        util::AlphanumericBufferGenerator::fill(buffer);

        if (!util::write_all(fd.get(), buffer.data(), to_write)) {
            int err = errno;
            return util::make_error("Write to " + path.string() + " failed after " +
                                        std::to_string(written) + " bytes: " + std::strerror(err),
                                    err);
        }
        written += to_write;
    }

    if (fd.close() != 0) {
        int err = errno;
        return util::make_error("Failed to close " + path.string() + ": " + std::strerror(err),
                                err);
    }
    return written;
}
