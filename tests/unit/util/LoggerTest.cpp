/**
 * @file LoggerTest.cpp
 * @brief Unit tests for util::Logger
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "fixtures/TestFixtures.hpp"
#include "util/Logger.hpp"

using util::LogLevel;
using util::Logger;

class LoggerTest : public TempDirTestFixture {
protected:
    void TearDown() override {
        Logger::instance().shutdown();
        Logger::instance().set_min_level(LogLevel::INFO);
        TempDirTestFixture::TearDown();
    }
};

TEST_F(LoggerTest, Initialize_CreatesLogFileNamedAfterApp) {
    ASSERT_TRUE(Logger::instance().initialize(temp_dir / "logs", "test-app").has_value());

    EXPECT_EQ(Logger::instance().get_log_file_path(), temp_dir / "logs" / "test-app.log");
    EXPECT_TRUE(std::filesystem::exists(temp_dir / "logs" / "test-app.log"));
}

TEST_F(LoggerTest, Log_WritesLevelComponentAndMessage) {
    ASSERT_TRUE(Logger::instance().initialize(temp_dir, "test-app").has_value());

    LOG_WARNING("FillService", "Chunk 3 failed");

    auto content = ReadFile(temp_dir / "test-app.log");
    EXPECT_THAT(content, testing::HasSubstr("[WARN ] [FillService] Chunk 3 failed\n"));
}

TEST_F(LoggerTest, Log_DropsMessagesBelowMinLevel) {
    ASSERT_TRUE(Logger::instance().initialize(temp_dir, "test-app", LogLevel::WARNING).has_value());

    LOG_INFO("Test", "informational");
    LOG_ERROR("Test", "broken");

    auto content = ReadFile(temp_dir / "test-app.log");
    EXPECT_THAT(content, testing::Not(testing::HasSubstr("informational")));
    EXPECT_THAT(content, testing::HasSubstr("broken"));
}

TEST_F(LoggerTest, Rotation_KeepsConfiguredNumberOfFiles) {
    util::LogRotationPolicy policy{.max_file_size_bytes = 512, .max_files = 2};
    ASSERT_TRUE(Logger::instance().initialize(temp_dir, "rot", LogLevel::INFO, policy).has_value());

    for (int i = 0; i < 100; ++i) {
        LOG_INFO("Test", "line number " + std::to_string(i) + " with some padding text");
    }

    EXPECT_TRUE(std::filesystem::exists(temp_dir / "rot.log"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir / "rot.1.log"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir / "rot.2.log"));
    EXPECT_FALSE(std::filesystem::exists(temp_dir / "rot.3.log"));
    EXPECT_THAT(ReadFile(temp_dir / "rot.log"), testing::HasSubstr("line number 99"));
}

TEST_F(LoggerTest, Initialize_FailsWhenDirectoryCannotBeCreated) {
    WriteFile(temp_dir / "blocker", 1);

    auto result = Logger::instance().initialize(temp_dir / "blocker" / "logs", "test-app");

    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(Logger::instance().is_initialized());
}

TEST_F(LoggerTest, Shutdown_StopsWritingToFile) {
    ASSERT_TRUE(Logger::instance().initialize(temp_dir, "test-app").has_value());
    Logger::instance().shutdown();

    LOG_ERROR("Test", "after shutdown");

    EXPECT_THAT(ReadFile(temp_dir / "test-app.log"), testing::Not(testing::HasSubstr("after shutdown")));
    EXPECT_TRUE(Logger::instance().get_log_file_path().empty());
}

TEST_F(LoggerTest, RunContext_TagsLinesUntilCleared) {
    ASSERT_TRUE(Logger::instance().initialize(temp_dir, "test-app").has_value());

    Logger::instance().set_run_context("1a2b");
    LOG_INFO("FillService", "tagged");
    Logger::instance().set_run_context("");
    LOG_INFO("FillService", "plain");

    auto content = ReadFile(temp_dir / "test-app.log");
    EXPECT_THAT(content, testing::HasSubstr("[INFO ] [run=1a2b] [FillService] tagged\n"));
    EXPECT_THAT(content, testing::HasSubstr("[INFO ] [FillService] plain\n"));
}
