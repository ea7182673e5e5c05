#include "sandbox/capture_sink.hpp"

#include <string>

#include <gtest/gtest.h>

namespace hoya::sandbox {
namespace {

TEST(CaptureSinkTest, KeepsStreamsSeparate) {
    CaptureSink sink(64);
    sink.Write(Stream::kStdout, "out\n");
    sink.Write(Stream::kStderr, "err\n");

    EXPECT_EQ(sink.Drain(Stream::kStdout), "out\n");
    EXPECT_EQ(sink.Drain(Stream::kStderr), "err\n");
    EXPECT_FALSE(sink.Truncated(Stream::kStdout));
    EXPECT_FALSE(sink.Truncated(Stream::kStderr));
}

TEST(CaptureSinkTest, NeverGrowsPastCapacity) {
    CaptureSink sink(10);
    for (int i = 0; i < 100; ++i) {
        sink.Write(Stream::kStdout, "abcdefg");
        EXPECT_LE(sink.Size(Stream::kStdout), 10u);
    }
    EXPECT_TRUE(sink.Truncated(Stream::kStdout));
    EXPECT_FALSE(sink.Truncated(Stream::kStderr));
    EXPECT_EQ(sink.Drain(Stream::kStdout), "abcdefgabc");
}

TEST(CaptureSinkTest, ExactFitIsNotTruncated) {
    CaptureSink sink(4);
    sink.Write(Stream::kStdout, "abcd");
    EXPECT_FALSE(sink.Truncated(Stream::kStdout));
    sink.Write(Stream::kStdout, "");
    EXPECT_FALSE(sink.Truncated(Stream::kStdout));
    sink.Write(Stream::kStdout, "e");
    EXPECT_TRUE(sink.Truncated(Stream::kStdout));
}

TEST(CaptureSinkTest, DrainReplacesInvalidUtf8) {
    CaptureSink sink(64);
    sink.Write(Stream::kStdout, std::string("ok\xff", 3));
    EXPECT_EQ(sink.Drain(Stream::kStdout), "ok\xEF\xBF\xBD");
}

TEST(CaptureSinkTest, TruncationSurvivesDrain) {
    CaptureSink sink(2);
    sink.Write(Stream::kStderr, "xyz");
    EXPECT_EQ(sink.Drain(Stream::kStderr), "xy");
    EXPECT_TRUE(sink.Truncated(Stream::kStderr));
    EXPECT_EQ(sink.Size(Stream::kStderr), 0u);
}

}  // namespace
}  // namespace hoya::sandbox
