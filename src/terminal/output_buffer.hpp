#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace shellgate::terminal {

// Shell-integration prompt marker (OSC 133 "D"):
//   ESC ] 133 ; D ; <exit> ; <token> BEL
// printed by the shell before each prompt. With an empty token the
// "; <token>" part is absent.
inline constexpr std::string_view kPromptMarkerPrefix = "\x1b]133;D;";

struct PromptMarker {
    std::uint64_t offset = 0;   // absolute offset of the marker's ESC byte
    int exit_code = 0;
};

enum class WaitStatus {
    Marker,
    TimedOut,
    Closed,
    Cancelled
};

struct MarkerWait {
    WaitStatus status = WaitStatus::TimedOut;
    PromptMarker marker;
};

struct BufferSnapshot {
    std::uint64_t end_offset = 0;
    std::size_t marker_count = 0;   // markers ever seen
};

// Accumulates everything the shell prints. Offsets are absolute (bytes ever
// appended) so callers can keep them across trimming of old data.
class OutputBuffer {
public:
    static constexpr std::size_t kDefaultMaxBytes = 64 * 1024 * 1024;

    // Only markers carrying `marker_token` count; anything else is output.
    explicit OutputBuffer(std::size_t max_bytes = kDefaultMaxBytes,
                          std::string marker_token = "");

    void append(const std::string& chunk);
    BufferSnapshot snapshot() const;
    const std::string& marker_token() const { return marker_token_; }

    // First marker at or after `from_offset`.
    MarkerWait wait_for_marker(std::uint64_t from_offset,
                               std::chrono::steady_clock::time_point deadline,
                               const std::atomic_bool* cancel_token = nullptr) const;

    // First marker after the first line break at or after `window_start`,
    // i.e. the prompt that follows a line typed from there on.
    MarkerWait wait_for_command_end(std::uint64_t window_start,
                                    std::chrono::steady_clock::time_point deadline,
                                    const std::atomic_bool* cancel_token = nullptr) const;

    bool has_line_break_since(std::uint64_t offset) const;

    // Bytes in [from, to); the part already trimmed away is skipped.
    std::string slice(std::uint64_t from, std::uint64_t to) const;

    // The shell is gone; wakes every waiter.
    void close();
    bool closed() const;

private:
    void scan_markers();
    std::optional<std::uint64_t> line_break_since(std::uint64_t offset) const;
    std::optional<PromptMarker> first_marker_since(std::uint64_t offset) const;
    MarkerWait wait_for(std::uint64_t offset, bool after_line_break,
                        std::chrono::steady_clock::time_point deadline,
                        const std::atomic_bool* cancel_token) const;

    std::size_t max_bytes_;
    std::string marker_token_;
    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::string data_;
    std::uint64_t base_offset_ = 0;
    std::uint64_t scan_offset_ = 0;
    std::deque<PromptMarker> markers_;
    std::size_t marker_count_ = 0;
    bool closed_ = false;
};

// Removes CSI/OSC escape sequences and carriage returns, and applies backspaces.
std::string clean_output(std::string_view raw);

// Output of one command: the cleaned window with the shell's echo of the
// command line (its first line) dropped.
std::string extract_command_output(std::string_view raw_window);

}  // namespace shellgate::terminal
