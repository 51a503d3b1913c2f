#include "ui/terminal_view.hpp"

#include <algorithm>

namespace shellgate::ui {

namespace {

constexpr std::size_t kTabWidth = 8;

}  // namespace

TerminalView::TerminalView(const std::size_t max_lines)
    : max_lines_(std::max<std::size_t>(max_lines, 1)) {
    lines_.emplace_back();
}

void TerminalView::feed(const std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const char c : bytes) {
        switch (state_) {
            case ParseState::Escape:
                if (c == '[') {
                    state_ = ParseState::Csi;
                } else if (c == ']') {
                    state_ = ParseState::Osc;
                } else if (static_cast<unsigned char>(c) >= 0x20 &&
                           static_cast<unsigned char>(c) <= 0x2f) {
                    // intermediate byte; the sequence continues
                } else {
                    state_ = ParseState::Text;
                }
                continue;
            case ParseState::Csi: {
                const auto byte = static_cast<unsigned char>(c);
                if (byte >= 0x40 && byte <= 0x7e) {
                    finish_csi(c);
                    state_ = ParseState::Text;
                }
                continue;
            }
            case ParseState::Osc:
                if (c == '\x07') {
                    state_ = ParseState::Text;
                } else if (c == '\x1b') {
                    state_ = ParseState::OscEscape;
                }
                continue;
            case ParseState::OscEscape:
                state_ = c == '\\' ? ParseState::Text : ParseState::Osc;
                continue;
            case ParseState::Text:
            default:
                break;
        }

        switch (c) {
            case '\x1b':
                state_ = ParseState::Escape;
                break;
            case '\n':
                new_line();
                break;
            case '\r':
                column_ = 0;
                break;
            case '\b':
                if (column_ > 0) {
                    --column_;
                }
                break;
            case '\t':
                do {
                    put(' ');
                } while (column_ % kTabWidth != 0);
                break;
            case '\x07':
            case '\x15':
                break;
            default:
                if (static_cast<unsigned char>(c) >= 0x20) {
                    put(c);
                }
                break;
        }
    }
    ++revision_;
}

void TerminalView::put(const char c) {
    std::string& line = lines_.back();
    if (column_ < line.size()) {
        line[column_] = c;
    } else {
        line.append(column_ - line.size(), ' ');
        line.push_back(c);
    }
    ++column_;
}

void TerminalView::new_line() {
    lines_.emplace_back();
    column_ = 0;
    while (lines_.size() > max_lines_) {
        lines_.pop_front();
    }
}

void TerminalView::finish_csi(const char final_byte) {
    // Erase in line; parameters are ignored, everything right of the cursor goes.
    if (final_byte == 'K' && column_ < lines_.back().size()) {
        lines_.back().erase(column_);
    }
}

std::vector<std::string> TerminalView::tail(const std::size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t take = std::min(count, lines_.size());
    return std::vector<std::string>(lines_.end() - static_cast<std::ptrdiff_t>(take),
                                    lines_.end());
}

std::size_t TerminalView::line_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

std::uint64_t TerminalView::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

}  // namespace shellgate::ui
