#include <chrono>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "terminal/output_buffer.hpp"

namespace {

using shellgate::terminal::clean_output;
using shellgate::terminal::extract_command_output;
using shellgate::terminal::OutputBuffer;
using shellgate::terminal::WaitStatus;

std::string marker(int exit_code) {
    return "\x1b]133;D;" + std::to_string(exit_code) + "\x07";
}

std::chrono::steady_clock::time_point in_ms(int ms) {
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
}

TEST(OutputBufferTest, FindsMarkerAndExitCode) {
    OutputBuffer buffer;
    buffer.append("echo hi\r\nhi\r\n" + marker(0) + "$ ");

    const auto wait = buffer.wait_for_marker(0, in_ms(10));
    ASSERT_EQ(wait.status, WaitStatus::Marker);
    EXPECT_EQ(wait.marker.exit_code, 0);
    EXPECT_EQ(wait.marker.offset, std::string("echo hi\r\nhi\r\n").size());
    EXPECT_EQ(buffer.snapshot().marker_count, 1u);
}

TEST(OutputBufferTest, FindsMarkerSplitAcrossChunks) {
    OutputBuffer buffer;
    const std::string full = "out\n" + marker(127);
    for (const char c : full) {
        buffer.append(std::string(1, c));
    }
    const auto wait = buffer.wait_for_marker(0, in_ms(10));
    ASSERT_EQ(wait.status, WaitStatus::Marker);
    EXPECT_EQ(wait.marker.exit_code, 127);
    EXPECT_EQ(wait.marker.offset, 4u);
}

TEST(OutputBufferTest, AcceptsStringTerminator) {
    OutputBuffer buffer;
    buffer.append("\x1b]133;D;2\x1b\\");
    const auto wait = buffer.wait_for_marker(0, in_ms(10));
    ASSERT_EQ(wait.status, WaitStatus::Marker);
    EXPECT_EQ(wait.marker.exit_code, 2);
}

TEST(OutputBufferTest, IgnoresMalformedMarker) {
    OutputBuffer buffer;
    buffer.append("\x1b]133;D;x\x07 and then " + marker(1));
    EXPECT_EQ(buffer.snapshot().marker_count, 1u);
    EXPECT_EQ(buffer.wait_for_marker(0, in_ms(10)).marker.exit_code, 1);
}

TEST(OutputBufferTest, TimesOutWithoutMarker) {
    OutputBuffer buffer;
    buffer.append("still running");
    const auto started = std::chrono::steady_clock::now();
    const auto wait = buffer.wait_for_marker(0, in_ms(120));
    EXPECT_EQ(wait.status, WaitStatus::TimedOut);
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(100));
}

TEST(OutputBufferTest, WakesWaiterWhenMarkerArrives) {
    OutputBuffer buffer;
    std::thread producer([&buffer]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        buffer.append("done\n" + marker(0));
    });
    const auto wait = buffer.wait_for_marker(0, in_ms(2000));
    producer.join();
    EXPECT_EQ(wait.status, WaitStatus::Marker);
}

TEST(OutputBufferTest, ReportsClosedAndCancelled) {
    OutputBuffer buffer;
    std::atomic_bool cancel{true};
    EXPECT_EQ(buffer.wait_for_marker(0, in_ms(1000), &cancel).status, WaitStatus::Cancelled);

    buffer.close();
    EXPECT_TRUE(buffer.closed());
    EXPECT_EQ(buffer.wait_for_marker(0, in_ms(1000)).status, WaitStatus::Closed);
}

TEST(OutputBufferTest, KeepsAbsoluteOffsetsWhenTrimming) {
    OutputBuffer buffer(4096);
    buffer.append(std::string(5000, 'a'));
    buffer.append(marker(0));

    const auto snapshot = buffer.snapshot();
    EXPECT_EQ(snapshot.end_offset, 5000u + marker(0).size());
    const auto wait = buffer.wait_for_marker(0, in_ms(10));
    ASSERT_EQ(wait.status, WaitStatus::Marker);
    EXPECT_EQ(wait.marker.offset, 5000u);
    // The oldest bytes are gone; the tail is still addressable.
    EXPECT_EQ(buffer.slice(4990, 5000), std::string(10, 'a'));
    EXPECT_LT(buffer.slice(0, 5000).size(), 5000u);
}

TEST(OutputBufferTest, CleansEscapesAndCarriageReturns) {
    const std::string raw = "\x1b[1;32mgreen\x1b[0m\r\n\x1b]0;title\x07line\r\nab\bc\n";
    EXPECT_EQ(clean_output(raw), "green\nline\nac\n");
    EXPECT_EQ(clean_output("\x1b(Bsgr\x1b[m \x1b=ok"), "sgr ok");
}

TEST(OutputBufferTest, DropsEchoedCommandLine) {
    const std::string window = "\x15" "echo hello\r\nhello\r\n";
    EXPECT_EQ(extract_command_output(window), "hello\n");
    EXPECT_EQ(extract_command_output("true"), "");
}

TEST(OutputBufferTest, WaitsForMarkerAtOrAfterOffset) {
    OutputBuffer buffer;
    buffer.append(marker(1) + "$ ");
    const auto start = buffer.snapshot().end_offset;

    EXPECT_EQ(buffer.wait_for_marker(start, in_ms(20)).status, WaitStatus::TimedOut);
    buffer.append("ls\r\n" + marker(0));
    const auto wait = buffer.wait_for_marker(start, in_ms(20));
    ASSERT_EQ(wait.status, WaitStatus::Marker);
    EXPECT_EQ(wait.marker.exit_code, 0);
    EXPECT_EQ(wait.marker.offset, start + 4);
}

TEST(OutputBufferTest, CommandEndNeedsLineBreakBeforeMarker) {
    OutputBuffer buffer;
    const auto start = buffer.snapshot().end_offset;
    // A prompt redrawn while the command sits unsubmitted on the line.
    buffer.append("\x15" "echo staged\r" + marker(0) + "$ echo staged");

    EXPECT_FALSE(buffer.has_line_break_since(start));
    EXPECT_EQ(buffer.wait_for_command_end(start, in_ms(20)).status, WaitStatus::TimedOut);

    buffer.append("\r\nstaged\r\n" + marker(3) + "$ ");
    EXPECT_TRUE(buffer.has_line_break_since(start));
    const auto wait = buffer.wait_for_command_end(start, in_ms(20));
    ASSERT_EQ(wait.status, WaitStatus::Marker);
    EXPECT_EQ(wait.marker.exit_code, 3);
}

TEST(OutputBufferTest, MarkersMustCarryTheToken) {
    OutputBuffer buffer(OutputBuffer::kDefaultMaxBytes, "sg-00c0ffee");
    EXPECT_EQ(buffer.marker_token(), "sg-00c0ffee");

    buffer.append("cat notes\r\n" + marker(0) + "\x1b]133;D;0;sg-deadbeef\x07");
    EXPECT_EQ(buffer.snapshot().marker_count, 0u);

    const std::string ours = "\x1b]133;D;4;sg-00c0ffee\x07";
    for (const char c : ours) {
        buffer.append(std::string(1, c));
    }
    EXPECT_EQ(buffer.snapshot().marker_count, 1u);
    const auto wait = buffer.wait_for_command_end(0, in_ms(10));
    ASSERT_EQ(wait.status, WaitStatus::Marker);
    EXPECT_EQ(wait.marker.exit_code, 4);
}

}  // namespace
