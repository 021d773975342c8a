/**
 * @file DirectoryServiceTest.cpp
 * @brief Unit tests for DirectoryService
 */

#include <gtest/gtest.h>

#include "fixtures/TestFixtures.hpp"
#include "services/DirectoryService.hpp"

class DirectoryServiceTest : public TempDirTestFixture {
protected:
    std::unique_ptr<DirectoryService> directory;

    void SetUp() override {
        TempDirTestFixture::SetUp();
        directory = std::make_unique<DirectoryService>(temp_dir);
    }

    void SetModified(const std::filesystem::path& path, std::chrono::seconds offset) {
        auto base = std::filesystem::file_time_type::clock::now() - std::chrono::hours{1};
        std::filesystem::last_write_time(path, base + offset);
    }
};

TEST(DirectoryServiceNamingTest, ChunkFileName_UsesPrefixIndexSuffix) {
    EXPECT_EQ(DirectoryService::chunk_file_name(1), "data_chunk_1.dat");
    EXPECT_EQ(DirectoryService::chunk_file_name(42), "data_chunk_42.dat");
}

TEST(DirectoryServiceNamingTest, ParseChunkIndex_AcceptsChunkNames) {
    EXPECT_EQ(DirectoryService::parse_chunk_index("data_chunk_7.dat"), 7u);
    EXPECT_EQ(DirectoryService::parse_chunk_index("data_chunk_0012.dat"), 12u);
}

TEST(DirectoryServiceNamingTest, ParseChunkIndex_RejectsOtherNames) {
    EXPECT_FALSE(DirectoryService::parse_chunk_index("status.txt").has_value());
    EXPECT_FALSE(DirectoryService::parse_chunk_index("data_chunk_.dat").has_value());
    EXPECT_FALSE(DirectoryService::parse_chunk_index("data_chunk_1a.dat").has_value());
    EXPECT_FALSE(DirectoryService::parse_chunk_index("data_chunk_-1.dat").has_value());
    EXPECT_FALSE(DirectoryService::parse_chunk_index("data_chunk_3.dat.tmp").has_value());
}

TEST_F(DirectoryServiceTest, Paths_LiveInWorkingDirectory) {
    EXPECT_EQ(directory->status_path(), temp_dir / "status.txt");
    EXPECT_EQ(directory->stop_marker_path(), temp_dir / "stop.txt");
    EXPECT_EQ(directory->chunk_path(3), temp_dir / "data_chunk_3.dat");
}

TEST_F(DirectoryServiceTest, EnsureExists_CreatesNestedDirectories) {
    DirectoryService nested(temp_dir / "a" / "b");

    ASSERT_TRUE(nested.ensure_exists().has_value());

    EXPECT_TRUE(std::filesystem::is_directory(temp_dir / "a" / "b"));
}

TEST_F(DirectoryServiceTest, EnsureExists_FailsWhenPathIsAFile) {
    WriteFile(temp_dir / "plain", 10);
    DirectoryService blocked(temp_dir / "plain");

    EXPECT_FALSE(blocked.ensure_exists().has_value());
}

TEST_F(DirectoryServiceTest, DirectorySize_SumsRegularFilesOnly) {
    WriteFile(temp_dir / "data_chunk_1.dat", 1000);
    WriteFile(temp_dir / "notes.bin", 24);
    std::filesystem::create_directory(temp_dir / "sub");
    WriteFile(temp_dir / "sub" / "nested.bin", 5000);

    EXPECT_EQ(directory->directory_size_bytes(), 1024u);
}

TEST_F(DirectoryServiceTest, DirectorySize_IgnoresStatusAndStopFiles) {
    WriteFile(temp_dir / "data_chunk_1.dat", 1000);
    WriteFile(directory->status_path(), 44);
    WriteFile(directory->stop_marker_path(), 3);

    EXPECT_EQ(directory->directory_size_bytes(), 1000u);
    EXPECT_TRUE(DirectoryService::is_control_file("status.txt"));
    EXPECT_TRUE(DirectoryService::is_control_file("stop.txt"));
    EXPECT_FALSE(DirectoryService::is_control_file("data_chunk_1.dat"));
}

TEST_F(DirectoryServiceTest, DirectorySize_MissingDirectoryIsZero) {
    DirectoryService missing(temp_dir / "missing");

    EXPECT_EQ(missing.directory_size_bytes(), 0u);
}

TEST_F(DirectoryServiceTest, HighestChunkIndex_ZeroWithoutChunks) {
    WriteFile(temp_dir / "status.txt", 10);

    EXPECT_EQ(directory->highest_chunk_index(), 0u);
}

TEST_F(DirectoryServiceTest, HighestChunkIndex_UsesLargestIndexNotCount) {
    WriteFile(temp_dir / "data_chunk_2.dat", 1);
    WriteFile(temp_dir / "data_chunk_10.dat", 1);
    WriteFile(temp_dir / "data_chunk_9.dat", 1);

    EXPECT_EQ(directory->highest_chunk_index(), 10u);
}

TEST_F(DirectoryServiceTest, StopMarker_WriteDetectClear) {
    EXPECT_FALSE(directory->stop_marker_present());

    ASSERT_TRUE(directory->write_stop_marker().has_value());
    EXPECT_TRUE(directory->stop_marker_present());

    // Writing twice is harmless
    ASSERT_TRUE(directory->write_stop_marker().has_value());

    ASSERT_TRUE(directory->clear_stop_marker().has_value());
    EXPECT_FALSE(directory->stop_marker_present());

    // Clearing a missing marker is not an error
    EXPECT_TRUE(directory->clear_stop_marker().has_value());
}

TEST_F(DirectoryServiceTest, StopMarker_PresenceOnlyContentIgnored) {
    WriteFile(directory->stop_marker_path(), 0);

    EXPECT_TRUE(directory->stop_marker_present());
}

TEST_F(DirectoryServiceTest, ListChunkFiles_OldestFirstWithLimit) {
    for (int i = 1; i <= 4; ++i) {
        auto path = directory->chunk_path(static_cast<uint64_t>(i));
        WriteFile(path, static_cast<size_t>(i) * 10);
        // Index 3 is the oldest
        SetModified(path, std::chrono::seconds{i == 3 ? 0 : i * 10});
    }
    WriteFile(temp_dir / "status.txt", 10);

    auto files = directory->list_chunk_files(3);

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].name, "data_chunk_3.dat");
    EXPECT_EQ(files[0].size_bytes, 30u);
    EXPECT_EQ(files[1].name, "data_chunk_1.dat");
    EXPECT_EQ(files[2].name, "data_chunk_2.dat");
}

TEST_F(DirectoryServiceTest, ListChunkFiles_TiesOrderedByIndex) {
    for (uint64_t index : {5, 2, 9}) {
        auto path = directory->chunk_path(index);
        WriteFile(path, 1);
        SetModified(path, std::chrono::seconds{0});
    }

    auto files = directory->list_chunk_files(10);

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].index, 2u);
    EXPECT_EQ(files[1].index, 5u);
    EXPECT_EQ(files[2].index, 9u);
}

TEST_F(DirectoryServiceTest, ListChunkFiles_ZeroLimitIsEmpty) {
    WriteFile(directory->chunk_path(1), 1);

    EXPECT_TRUE(directory->list_chunk_files(0).empty());
}

TEST_F(DirectoryServiceTest, ClearData_RemovesRegularFilesKeepsSubdirectories) {
    WriteFile(directory->chunk_path(1), 10);
    WriteFile(directory->chunk_path(2), 10);
    WriteFile(directory->status_path(), 10);
    WriteFile(directory->stop_marker_path(), 5);
    std::filesystem::create_directory(temp_dir / "keep");

    auto removed = directory->clear_data();

    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 4u);
    EXPECT_EQ(directory->directory_size_bytes(), 0u);
    EXPECT_TRUE(std::filesystem::is_directory(temp_dir / "keep"));
}

TEST_F(DirectoryServiceTest, ClearData_MissingDirectoryIsError) {
    DirectoryService missing(temp_dir / "missing");

    EXPECT_FALSE(missing.clear_data().has_value());
}
