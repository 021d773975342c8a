/**
 * @file MockChunkWriter.hpp
 * @brief Google Mock implementation of IChunkWriter
 */

#pragma once

#include "services/IChunkWriter.hpp"
#include <gmock/gmock.h>

#include <fstream>
#include <memory>
#include <string>

class MockChunkWriter : public IChunkWriter {
public:
    MOCK_METHOD(util::Result<uint64_t>, write_chunk,
                (const std::filesystem::path& path, uint64_t size_bytes), (override));

    // Writes a real file of the requested size, like ChunkWriter without the randomness
    static auto WriteZeros(const std::filesystem::path& path, uint64_t size_bytes)
        -> util::Result<uint64_t> {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return util::make_error("cannot open " + path.string());
        }
        std::string data(static_cast<size_t>(size_bytes), '0');
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        return size_bytes;
    }

    // Factory for a mock that really writes files
    static std::shared_ptr<MockChunkWriter> CreateWriting() {
        auto mock = std::make_shared<testing::NiceMock<MockChunkWriter>>();
        ON_CALL(*mock, write_chunk(testing::_, testing::_))
            .WillByDefault(testing::Invoke(&MockChunkWriter::WriteZeros));
        return mock;
    }
};
