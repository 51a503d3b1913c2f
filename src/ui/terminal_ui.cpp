#include "ui/terminal_ui.hpp"

#include <algorithm>
#include <clocale>
#include <utility>
#include <vector>
#include <curses.h>
#include "core/logging/logger.hpp"

namespace shellgate::ui {

using runtime::ConfirmationAction;
using runtime::ConfirmationDecision;

namespace {

constexpr int kInputPollMs = 50;
constexpr int kEscape = 27;
constexpr short kPairModal = 1;
constexpr short kPairDanger = 2;

std::string clip(const std::string& text, const int width) {
    if (width <= 0) {
        return "";
    }
    if (static_cast<int>(text.size()) <= width) {
        return text;
    }
    return text.substr(0, static_cast<std::size_t>(width));
}

}  // namespace

TerminalUi::TerminalUi(ConfirmationBroker& broker, TerminalView& view, UiHooks hooks)
    : broker_(broker), view_(view), hooks_(std::move(hooks)) {}

TerminalUi::~TerminalUi() {
    shutdown_screen();
}

void TerminalUi::stop() {
    stop_requested_ = true;
}

void TerminalUi::init_screen() {
    setlocale(LC_ALL, "");
    set_escdelay(25);
    initscr();
    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(kPairModal, COLOR_YELLOW, -1);
        init_pair(kPairDanger, COLOR_RED, -1);
    }
    cbreak();
    noecho();
    nonl();
    keypad(stdscr, TRUE);
    curs_set(0);
    refresh();
    screen_active_ = true;
    create_windows();
}

void TerminalUi::shutdown_screen() {
    if (!screen_active_) {
        return;
    }
    destroy_windows();
    endwin();
    screen_active_ = false;
}

void TerminalUi::create_windows() {
    getmaxyx(stdscr, rows_, cols_);
    const int output_height = std::max(rows_ - 1, 1);
    output_win_ = newwin(output_height, cols_, 0, 0);
    status_win_ = newwin(1, cols_, output_height, 0);
    keypad(status_win_, TRUE);
    wtimeout(status_win_, kInputPollMs);

    if (hooks_.resize_shell) {
        hooks_.resize_shell(static_cast<unsigned short>(output_height),
                            static_cast<unsigned short>(std::max(cols_, 1)));
    }
    dirty_ = true;
}

void TerminalUi::destroy_windows() {
    if (output_win_ != nullptr) {
        delwin(output_win_);
        output_win_ = nullptr;
    }
    if (status_win_ != nullptr) {
        delwin(status_win_);
        status_win_ = nullptr;
    }
}

core::errors::Result<bool> TerminalUi::run() {
    init_screen();
    broker_.start_streaming();
    SHELLGATE_LOG_INFO("TerminalUi: confirmation surface attached");

    while (!stop_requested_) {
        if (broker_.state() == SurfaceState::Resolved) {
            broker_.acknowledge();
            dirty_ = true;
        }
        draw();

        const int key = wgetch(status_win_);
        if (key == ERR) {
            continue;
        }
        if (!handle_key(key)) {
            break;
        }
    }

    shutdown_screen();
    SHELLGATE_LOG_INFO("TerminalUi: confirmation surface detached");
    return true;
}

void TerminalUi::draw() {
    const auto pending = broker_.front();
    if (editing_ && (!pending.has_value() || pending->id != editing_id_)) {
        // The prompt being edited was withdrawn or resolved elsewhere.
        editing_ = false;
        edit_buffer_.clear();
        dirty_ = true;
    }

    const std::uint64_t revision = view_.revision();
    if (revision == drawn_revision_ && !dirty_ && !pending.has_value()) {
        return;
    }
    drawn_revision_ = revision;
    dirty_ = false;

    draw_output();
    draw_status(pending);
    if (pending.has_value()) {
        draw_modal(*pending);
    }
    doupdate();
}

void TerminalUi::draw_output() {
    int height = 0;
    int width = 0;
    getmaxyx(output_win_, height, width);
    werase(output_win_);
    const auto lines = view_.tail(static_cast<std::size_t>(std::max(height, 0)));
    int row = height - static_cast<int>(lines.size());
    for (const auto& line : lines) {
        mvwaddnstr(output_win_, row++, 0, line.c_str(), width);
    }
    wnoutrefresh(output_win_);
}

void TerminalUi::draw_status(const std::optional<PendingConfirmation>& pending) {
    const std::string mode =
        pending.has_value() ? protocol::to_string(pending->mode) : "streaming";
    const std::string status = hooks_.status_text ? hooks_.status_text() : "";
    const std::string text = " Mode: " + mode + " | Status: " + status + " | Pending: " +
                             std::to_string(broker_.pending_count()) + " | F10 quit";

    werase(status_win_);
    wattron(status_win_, A_REVERSE);
    mvwaddstr(status_win_, 0, 0, clip(text, cols_).c_str());
    for (int col = static_cast<int>(std::min<std::size_t>(text.size(), cols_)); col < cols_;
         ++col) {
        waddch(status_win_, ' ');
    }
    wattroff(status_win_, A_REVERSE);
    wnoutrefresh(status_win_);
}

void TerminalUi::draw_modal(const PendingConfirmation& pending) {
    const int width = std::max(std::min(cols_ - 4, 100), 20);
    const int height = 7;
    const int top = std::max((rows_ - height) / 2, 0);
    const int left = std::max((cols_ - width) / 2, 0);

    WINDOW* modal = newwin(height, width, top, left);
    if (modal == nullptr) {
        return;
    }
    wattron(modal, COLOR_PAIR(kPairModal));
    box(modal, 0, 0);
    wattroff(modal, COLOR_PAIR(kPairModal));

    mvwaddstr(modal, 0, 2, clip(" Confirm command " + pending.id + " ", width - 4).c_str());
    if (editing_) {
        mvwaddstr(modal, 2, 2, "Edit:");
        mvwaddstr(modal, 3, 2, clip("> " + edit_buffer_, width - 4).c_str());
        mvwaddstr(modal, 5, 2, clip("[Enter] submit  [Esc] back", width - 4).c_str());
    } else {
        wattron(modal, COLOR_PAIR(kPairDanger) | A_BOLD);
        mvwaddstr(modal, 2, 2, clip("$ " + pending.command, width - 4).c_str());
        wattroff(modal, COLOR_PAIR(kPairDanger) | A_BOLD);
        mvwaddstr(modal, 3, 2, clip("mode: " + protocol::to_string(pending.mode), width - 4).c_str());
        mvwaddstr(modal, 5, 2, clip("[y] approve  [n] deny  [e] edit", width - 4).c_str());
    }
    wnoutrefresh(modal);
    delwin(modal);
}

bool TerminalUi::handle_key(const int key) {
    if (key == KEY_F(10)) {
        broker_.cancel_all("Operator closed the confirmation surface.");
        return false;
    }
    if (key == KEY_RESIZE) {
        destroy_windows();
        endwin();
        refresh();
        create_windows();
        return true;
    }

    const auto pending = broker_.front();
    if (pending.has_value()) {
        if (editing_) {
            handle_edit_key(key, *pending);
        } else {
            handle_prompt_key(key, *pending);
        }
        dirty_ = true;
        return true;
    }

    if (hooks_.send_to_shell) {
        const std::string bytes = key_to_bytes(key);
        if (!bytes.empty()) {
            hooks_.send_to_shell(bytes);
        }
    }
    return true;
}

void TerminalUi::handle_prompt_key(const int key, const PendingConfirmation& pending) {
    switch (key) {
        case 'y':
        case 'Y':
            resolve(pending, ConfirmationDecision{ConfirmationAction::Approve, "", ""});
            break;
        case 'n':
        case 'N':
            resolve(pending, ConfirmationDecision{ConfirmationAction::Deny, "",
                                                  "Operator denied the command."});
            break;
        case 'e':
        case 'E':
            editing_ = true;
            editing_id_ = pending.id;
            edit_buffer_ = pending.command;
            break;
        default:
            break;
    }
}

void TerminalUi::handle_edit_key(const int key, const PendingConfirmation& pending) {
    switch (key) {
        case kEscape:
            editing_ = false;
            edit_buffer_.clear();
            break;
        case '\r':
        case '\n':
        case KEY_ENTER:
            if (edit_buffer_.find_first_not_of(" \t") == std::string::npos) {
                break;
            }
            resolve(pending, ConfirmationDecision{ConfirmationAction::Edit, edit_buffer_, ""});
            editing_ = false;
            edit_buffer_.clear();
            break;
        case KEY_BACKSPACE:
        case 127:
        case 8:
            if (!edit_buffer_.empty()) {
                edit_buffer_.pop_back();
            }
            break;
        case 21:  // ^U
            edit_buffer_.clear();
            break;
        default:
            if (key >= 0x20 && key < 0x7f) {
                edit_buffer_.push_back(static_cast<char>(key));
            }
            break;
    }
}

void TerminalUi::resolve(const PendingConfirmation& pending, const ConfirmationDecision& decision) {
    if (!broker_.resolve(pending.id, decision)) {
        SHELLGATE_LOG_WARN("TerminalUi: prompt for " + pending.id + " was no longer pending");
    }
}

std::string TerminalUi::key_to_bytes(const int key) {
    switch (key) {
        case KEY_ENTER:
        case '\n':
            return "\r";
        case KEY_BACKSPACE:
            return "\x7f";
        case KEY_UP:
            return "\x1b[A";
        case KEY_DOWN:
            return "\x1b[B";
        case KEY_RIGHT:
            return "\x1b[C";
        case KEY_LEFT:
            return "\x1b[D";
        case KEY_HOME:
            return "\x1b[H";
        case KEY_END:
            return "\x1b[F";
        case KEY_DC:
            return "\x1b[3~";
        default:
            break;
    }
    if (key >= 0 && key < 0x100) {
        return std::string(1, static_cast<char>(key));
    }
    return "";
}

}  // namespace shellgate::ui
