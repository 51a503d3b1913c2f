#include "terminal/output_buffer.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace shellgate::terminal {

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(50);
constexpr std::size_t kMaxExitDigits = 4;

}  // namespace

OutputBuffer::OutputBuffer(const std::size_t max_bytes, std::string marker_token)
    : max_bytes_(max_bytes == 0 ? kDefaultMaxBytes : max_bytes),
      marker_token_(std::move(marker_token)) {}

void OutputBuffer::append(const std::string& chunk) {
    if (chunk.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        data_ += chunk;
        scan_markers();

        if (data_.size() > max_bytes_) {
            std::size_t drop = data_.size() - (max_bytes_ / 4) * 3;
            drop = std::min<std::size_t>(drop, static_cast<std::size_t>(scan_offset_ - base_offset_));
            data_.erase(0, drop);
            base_offset_ += drop;
            while (!markers_.empty() && markers_.front().offset < base_offset_) {
                markers_.pop_front();
            }
        }
    }
    changed_.notify_all();
}

void OutputBuffer::scan_markers() {
    const std::size_t prefix_len = kPromptMarkerPrefix.size();
    const std::string token_field = marker_token_.empty() ? "" : ";" + marker_token_;
    while (true) {
        const std::size_t local = static_cast<std::size_t>(scan_offset_ - base_offset_);
        const std::size_t pos = data_.find(kPromptMarkerPrefix.data(), local, prefix_len);
        if (pos == std::string::npos) {
            // Keep a possibly split prefix at the tail for the next chunk.
            const std::size_t keep = prefix_len - 1;
            const std::size_t resume =
                data_.size() > keep ? std::max(local, data_.size() - keep) : local;
            scan_offset_ = base_offset_ + resume;
            return;
        }

        std::size_t p = pos + prefix_len;
        bool negative = false;
        if (p < data_.size() && data_[p] == '-') {
            negative = true;
            ++p;
        }
        const std::size_t digits_start = p;
        int code = 0;
        while (p < data_.size() && std::isdigit(static_cast<unsigned char>(data_[p])) != 0 &&
               p - digits_start < kMaxExitDigits) {
            code = code * 10 + (data_[p] - '0');
            ++p;
        }

        if (p >= data_.size()) {
            scan_offset_ = base_offset_ + pos;  // incomplete, wait for more bytes
            return;
        }

        bool valid = p > digits_start;
        if (valid && !token_field.empty()) {
            const std::size_t available = std::min(token_field.size(), data_.size() - p);
            if (data_.compare(p, available, token_field, 0, available) != 0) {
                valid = false;
            } else if (available < token_field.size()) {
                scan_offset_ = base_offset_ + pos;
                return;
            } else {
                p += token_field.size();
                if (p >= data_.size()) {
                    scan_offset_ = base_offset_ + pos;
                    return;
                }
            }
        }

        std::size_t end = std::string::npos;
        if (valid) {
            if (data_[p] == '\x07') {
                end = p + 1;
            } else if (data_[p] == '\x1b') {
                if (p + 1 >= data_.size()) {
                    scan_offset_ = base_offset_ + pos;
                    return;
                }
                if (data_[p + 1] == '\\') {
                    end = p + 2;
                }
            }
        }

        if (end == std::string::npos) {
            scan_offset_ = base_offset_ + pos + 1;  // not one of ours
            continue;
        }

        markers_.push_back(PromptMarker{base_offset_ + pos, negative ? -code : code});
        ++marker_count_;
        scan_offset_ = base_offset_ + end;
    }
}

BufferSnapshot OutputBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return BufferSnapshot{base_offset_ + data_.size(), marker_count_};
}

std::optional<std::uint64_t> OutputBuffer::line_break_since(const std::uint64_t offset) const {
    const std::uint64_t from = std::max(offset, base_offset_);
    if (from >= base_offset_ + data_.size()) {
        return std::nullopt;
    }
    const std::size_t pos = data_.find('\n', static_cast<std::size_t>(from - base_offset_));
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return base_offset_ + pos;
}

std::optional<PromptMarker> OutputBuffer::first_marker_since(const std::uint64_t offset) const {
    for (const auto& marker : markers_) {
        if (marker.offset >= offset) {
            return marker;
        }
    }
    return std::nullopt;
}

bool OutputBuffer::has_line_break_since(const std::uint64_t offset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return line_break_since(offset).has_value();
}

MarkerWait OutputBuffer::wait_for_marker(const std::uint64_t from_offset,
                                         const std::chrono::steady_clock::time_point deadline,
                                         const std::atomic_bool* cancel_token) const {
    return wait_for(from_offset, false, deadline, cancel_token);
}

MarkerWait OutputBuffer::wait_for_command_end(
    const std::uint64_t window_start, const std::chrono::steady_clock::time_point deadline,
    const std::atomic_bool* cancel_token) const {
    return wait_for(window_start, true, deadline, cancel_token);
}

MarkerWait OutputBuffer::wait_for(const std::uint64_t offset, const bool after_line_break,
                                  const std::chrono::steady_clock::time_point deadline,
                                  const std::atomic_bool* cancel_token) const {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        std::optional<std::uint64_t> from = offset;
        if (after_line_break) {
            from = line_break_since(offset);
            if (from.has_value()) {
                ++*from;
            }
        }
        if (from.has_value()) {
            if (const auto marker = first_marker_since(*from)) {
                return MarkerWait{WaitStatus::Marker, *marker};
            }
        }
        if (closed_) {
            return MarkerWait{WaitStatus::Closed, {}};
        }
        if (cancel_token != nullptr && cancel_token->load()) {
            return MarkerWait{WaitStatus::Cancelled, {}};
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return MarkerWait{WaitStatus::TimedOut, {}};
        }
        changed_.wait_until(lock, std::min(deadline, now + kWaitSlice));
    }
}

std::string OutputBuffer::slice(std::uint64_t from, std::uint64_t to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t end = base_offset_ + data_.size();
    from = std::max(from, base_offset_);
    to = std::min(to, end);
    if (from >= to) {
        return "";
    }
    return data_.substr(static_cast<std::size_t>(from - base_offset_),
                        static_cast<std::size_t>(to - from));
}

void OutputBuffer::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    changed_.notify_all();
}

bool OutputBuffer::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::string clean_output(const std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    std::size_t i = 0;
    while (i < raw.size()) {
        const char c = raw[i];
        if (c == '\x1b') {
            if (i + 1 < raw.size() && raw[i + 1] == '[') {
                i += 2;
                while (i < raw.size() &&
                       !(static_cast<unsigned char>(raw[i]) >= 0x40 &&
                         static_cast<unsigned char>(raw[i]) <= 0x7e)) {
                    ++i;
                }
                ++i;
            } else if (i + 1 < raw.size() && raw[i + 1] == ']') {
                i += 2;
                while (i < raw.size()) {
                    if (raw[i] == '\x07') {
                        ++i;
                        break;
                    }
                    if (raw[i] == '\x1b' && i + 1 < raw.size() && raw[i + 1] == '\\') {
                        i += 2;
                        break;
                    }
                    ++i;
                }
            } else {
                // ESC, intermediates (0x20-0x2f), final byte; e.g. ESC ( B
                ++i;
                while (i < raw.size() && static_cast<unsigned char>(raw[i]) >= 0x20 &&
                       static_cast<unsigned char>(raw[i]) <= 0x2f) {
                    ++i;
                }
                ++i;
            }
            continue;
        }
        if (c == '\b') {
            if (!out.empty() && out.back() != '\n') {
                out.pop_back();
            }
            ++i;
            continue;
        }
        if (c != '\r' && c != '\x07') {
            out.push_back(c);
        }
        ++i;
    }
    return out;
}

std::string extract_command_output(const std::string_view raw_window) {
    const std::string cleaned = clean_output(raw_window);
    const auto newline = cleaned.find('\n');
    if (newline == std::string::npos) {
        return "";
    }
    return cleaned.substr(newline + 1);
}

}  // namespace shellgate::terminal
