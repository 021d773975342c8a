/**
 * @file WriteHelpersTest.cpp
 * @brief Unit tests for the EINTR-retrying syscall helpers
 */

#include <gtest/gtest.h>

#include <cerrno>

#include "fixtures/TestFixtures.hpp"
#include "util/FileDescriptor.hpp"
#include "util/WriteHelpers.hpp"

TEST(RetryOnEintrTest, RepeatsInterruptedCalls) {
    int calls = 0;

    auto result = util::retry_on_eintr([&] {
        if (++calls < 3) {
            errno = EINTR;
            return -1;
        }
        return 0;
    });

    EXPECT_EQ(result, 0);
    EXPECT_EQ(calls, 3);
}

TEST(RetryOnEintrTest, ReturnsOtherFailuresImmediately) {
    int calls = 0;

    auto result = util::retry_on_eintr([&] {
        ++calls;
        errno = ECHILD;
        return -1;
    });

    EXPECT_EQ(result, -1);
    EXPECT_EQ(errno, ECHILD);
    EXPECT_EQ(calls, 1);
}

class WriteAllTest : public TempDirTestFixture {};

TEST_F(WriteAllTest, WritesWholeBuffer) {
    auto path = temp_dir / "out.bin";
    std::string payload(100000, 'x');
    {
        auto fd = util::FileDescriptor::open_for_write(path);
        ASSERT_TRUE(fd.is_valid());
        ASSERT_TRUE(util::write_all(fd.get(), payload.data(), payload.size()));
    }

    EXPECT_EQ(ReadFile(path), payload);
}
