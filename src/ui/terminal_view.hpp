#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace shellgate::ui {

// Line model of the shell's output for the output pane. Escape sequences
// are dropped; carriage return, backspace, tab and CSI K are honoured.
// Fed by the output pump, read by the render loop.
class TerminalView {
public:
    static constexpr std::size_t kDefaultMaxLines = 5000;

    explicit TerminalView(std::size_t max_lines = kDefaultMaxLines);

    void feed(std::string_view bytes);

    // The last `count` lines, oldest first. The line being written is included.
    std::vector<std::string> tail(std::size_t count) const;

    std::size_t line_count() const;

    // Bumped on every feed so the render loop can skip redundant redraws.
    std::uint64_t revision() const;

private:
    enum class ParseState {
        Text,
        Escape,
        Csi,
        Osc,
        OscEscape
    };

    void put(char c);
    void new_line();
    void finish_csi(char final_byte);

    std::size_t max_lines_;
    mutable std::mutex mutex_;
    std::deque<std::string> lines_;
    std::size_t column_ = 0;
    ParseState state_ = ParseState::Text;
    std::uint64_t revision_ = 0;
};

}  // namespace shellgate::ui
