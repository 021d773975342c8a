/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures for storage-filler tests
 */

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include "mocks/MockChunkWriter.hpp"
#include "mocks/MockWorkerLauncher.hpp"

/**
 * @brief Fixture owning a fresh temporary working directory
 */
class TempDirTestFixture : public ::testing::Test {
protected:
    std::filesystem::path temp_dir;

    void SetUp() override {
        auto pattern = (std::filesystem::temp_directory_path() / "storage-filler-test-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        ASSERT_NE(mkdtemp(buffer.data()), nullptr) << "mkdtemp failed";
        temp_dir = buffer.data();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
    }

    // Create a file holding size_bytes of filler
    static void WriteFile(const std::filesystem::path& path, size_t size_bytes) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        std::string data(size_bytes, 'x');
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

    // Create a file holding exactly the given contents
    static void WriteFile(const std::filesystem::path& path, const std::string& contents) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }

    static auto ReadFile(const std::filesystem::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};

/**
 * @brief Builds a mutable argv for getopt-based parsers
 */
class ArgvBuilder {
public:
    ArgvBuilder(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

/**
 * @brief Helper for testing threaded operations with timeouts
 */
class ThreadingTestHelper {
public:
    template<typename Predicate>
    static bool WaitUntil(Predicate&& predicate,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds{10000},
                          std::chrono::milliseconds poll_interval = std::chrono::milliseconds{10}) {
        auto start = std::chrono::steady_clock::now();
        while (std::chrono::steady_clock::now() - start < timeout) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(poll_interval);
        }
        return false;
    }
};
