/**
 * @file StatusProtocolTest.cpp
 * @brief Unit tests for the status.txt format and StatusWriter
 */

#include <gtest/gtest.h>

#include "fixtures/TestFixtures.hpp"
#include "protocol/StatusProtocol.hpp"

using protocol::decode_status;
using protocol::encode_status;

namespace {

auto MakeSnapshot(double size_gb, int64_t files, TerminalState terminal = TerminalState::NONE)
    -> StatusSnapshot {
    StatusSnapshot snapshot;
    snapshot.run_id = "run-1";
    snapshot.size_gb = size_gb;
    snapshot.file_count = files;
    snapshot.terminal = terminal;
    return snapshot;
}

}  // namespace

TEST(StatusProtocolTest, EncodeStatus_WritesKeyedLinesAndTerminalLast) {
    auto text = encode_status(MakeSnapshot(0.5, 4, TerminalState::DONE));

    EXPECT_EQ(text, "VERSION:1\nRUN:run-1\nSIZE:0.5\nFILES:4\nERRORS:0\nDONE\n");
}

TEST(StatusProtocolTest, EncodeStatus_NoTerminalLineWhileRunning) {
    auto text = encode_status(MakeSnapshot(0.25, 2));

    EXPECT_EQ(text.find("DONE"), std::string::npos);
    EXPECT_EQ(text.find("STOPPED"), std::string::npos);
}

TEST(StatusProtocolTest, DecodeStatus_ReadsEncodedSnapshot) {
    auto original = MakeSnapshot(0.0029296875, 3, TerminalState::STOPPED);
    original.error_count = 2;

    EXPECT_EQ(decode_status(encode_status(original)), original);
}

TEST(StatusProtocolTest, DecodeStatus_LastOccurrenceWins) {
    auto snapshot = decode_status("SIZE:0.1\nFILES:1\nSIZE:0.2\nFILES:2\n");

    EXPECT_DOUBLE_EQ(snapshot.size_gb, 0.2);
    EXPECT_EQ(snapshot.file_count, 2);
}

TEST(StatusProtocolTest, DecodeStatus_AppendedBlocksReadLikeRewrites) {
    auto first = encode_status(MakeSnapshot(0.1, 1));
    auto second = encode_status(MakeSnapshot(0.2, 2));

    EXPECT_EQ(decode_status(first + second), decode_status(second));
}

TEST(StatusProtocolTest, DecodeStatus_IsIdempotent) {
    auto content = encode_status(MakeSnapshot(0.3, 3));
    auto once = decode_status(content);

    EXPECT_EQ(decode_status(content, once), once);
}

TEST(StatusProtocolTest, DecodeStatus_MalformedValueKeepsPrevious) {
    auto previous = MakeSnapshot(0.75, 7);

    auto snapshot = decode_status("SIZE:abc\nFILES:12x\n", previous);

    EXPECT_DOUBLE_EQ(snapshot.size_gb, 0.75);
    EXPECT_EQ(snapshot.file_count, 7);
}

TEST(StatusProtocolTest, DecodeStatus_NegativeValuesKeepPrevious) {
    auto previous = MakeSnapshot(0.5, 5);
    previous.error_count = 1;

    auto snapshot = decode_status("SIZE:-1\nFILES:-3\nERRORS:-2\n", previous);

    EXPECT_DOUBLE_EQ(snapshot.size_gb, 0.5);
    EXPECT_EQ(snapshot.file_count, 5);
    EXPECT_EQ(snapshot.error_count, 1);
}

TEST(StatusProtocolTest, DecodeStatus_NonFiniteSizeKeepsPrevious) {
    auto previous = MakeSnapshot(0.5, 5);

    for (const char* value : {"SIZE:inf\n", "SIZE:nan\n", "SIZE:infinity\n"}) {
        SCOPED_TRACE(value);
        EXPECT_DOUBLE_EQ(decode_status(value, previous).size_gb, 0.5);
    }
}

TEST(StatusProtocolTest, DecodeStatus_TornFileKeepsUnfinishedFields) {
    auto previous = MakeSnapshot(0.1, 1);

    // Writer truncated the file and had not yet written the FILES value
    auto snapshot = decode_status("VERSION:1\nRUN:run-1\nSIZE:0.2\nFILES:", previous);

    EXPECT_DOUBLE_EQ(snapshot.size_gb, 0.2);
    EXPECT_EQ(snapshot.file_count, 1);
    EXPECT_FALSE(snapshot.is_terminal());
}

TEST(StatusProtocolTest, DecodeStatus_EmptyContentReturnsPrevious) {
    auto previous = MakeSnapshot(0.4, 4);

    EXPECT_EQ(decode_status("", previous), previous);
}

TEST(StatusProtocolTest, DecodeStatus_TerminalLineAnywhere) {
    EXPECT_EQ(decode_status("DONE\nSIZE:1\n").terminal, TerminalState::DONE);
    EXPECT_EQ(decode_status("SIZE:1\nSTOPPED\nFILES:2\n").terminal, TerminalState::STOPPED);
}

TEST(StatusProtocolTest, DecodeStatus_NeverClearsPreviousTerminal) {
    auto previous = MakeSnapshot(0.5, 5, TerminalState::DONE);

    auto snapshot = decode_status("SIZE:0.5\nFILES:5\n", previous);

    EXPECT_EQ(snapshot.terminal, TerminalState::DONE);
}

TEST(StatusProtocolTest, DecodeStatus_IgnoresUnknownLines) {
    auto snapshot = decode_status("HOST:example\nSIZE:0.5\n# comment\n");

    EXPECT_DOUBLE_EQ(snapshot.size_gb, 0.5);
    EXPECT_FALSE(snapshot.is_terminal());
}

TEST(StatusProtocolTest, DecodeStatus_ToleratesCarriageReturns) {
    auto snapshot = decode_status("SIZE:0.5\r\nFILES:3\r\nDONE\r\n");

    EXPECT_DOUBLE_EQ(snapshot.size_gb, 0.5);
    EXPECT_EQ(snapshot.file_count, 3);
    EXPECT_EQ(snapshot.terminal, TerminalState::DONE);
}

class StatusWriterTest : public TempDirTestFixture {
protected:
    std::filesystem::path StatusPath() const { return temp_dir / protocol::STATUS_FILE_NAME; }
};

TEST_F(StatusWriterTest, ReadStatusFile_MissingFileIsNotStarted) {
    EXPECT_FALSE(protocol::read_status_file(StatusPath()).has_value());
}

TEST_F(StatusWriterTest, Publish_RewritesWholeBlock) {
    protocol::StatusWriter writer(StatusPath(), "abc");

    ASSERT_TRUE(writer.publish(0.1, 1, 0).has_value());
    ASSERT_TRUE(writer.publish(0.2, 2, 1).has_value());

    EXPECT_EQ(ReadFile(StatusPath()), "VERSION:1\nRUN:abc\nSIZE:0.2\nFILES:2\nERRORS:1\n");

    auto snapshot = protocol::read_status_file(StatusPath());
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->run_id, "abc");
    EXPECT_EQ(snapshot->error_count, 1);
}

TEST_F(StatusWriterTest, Finish_AppendsTerminalLineLast) {
    protocol::StatusWriter writer(StatusPath(), "abc");

    ASSERT_TRUE(writer.publish(0.1, 1, 0).has_value());
    ASSERT_TRUE(writer.finish(TerminalState::STOPPED, 0.1, 1, 0).has_value());

    auto content = ReadFile(StatusPath());
    EXPECT_TRUE(content.ends_with("\nSTOPPED\n")) << content;
    EXPECT_TRUE(writer.is_finished());

    auto snapshot = protocol::read_status_file(StatusPath());
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->terminal, TerminalState::STOPPED);
}

TEST_F(StatusWriterTest, PublishAfterFinish_IsRefused) {
    protocol::StatusWriter writer(StatusPath(), "abc");
    ASSERT_TRUE(writer.finish(TerminalState::DONE, 0.3, 3, 0).has_value());
    auto before = ReadFile(StatusPath());

    EXPECT_FALSE(writer.publish(0.4, 4, 0).has_value());
    EXPECT_FALSE(writer.finish(TerminalState::STOPPED, 0.4, 4, 0).has_value());

    EXPECT_EQ(ReadFile(StatusPath()), before);
}

TEST_F(StatusWriterTest, FinishWithoutTerminalState_IsRejected) {
    protocol::StatusWriter writer(StatusPath(), "abc");

    auto result = writer.finish(TerminalState::NONE, 0.0, 0, 0);

    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(writer.is_finished());
}

TEST_F(StatusWriterTest, Publish_ReportsUnwritablePath) {
    protocol::StatusWriter writer(temp_dir / "missing" / "status.txt", "abc");

    auto result = writer.publish(0.0, 0, 0);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ENOENT);
}
