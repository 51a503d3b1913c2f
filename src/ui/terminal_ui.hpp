#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "ui/confirmation_broker.hpp"
#include "ui/terminal_view.hpp"

typedef struct _win_st WINDOW;

namespace shellgate::ui {

struct UiHooks {
    // Keystrokes typed while no prompt is shown go to the shell.
    std::function<void(const std::string& bytes)> send_to_shell;
    // Called with the output pane size after start and on every resize.
    std::function<void(unsigned short rows, unsigned short cols)> resize_shell;
    // Short agent status for the status bar, e.g. "shell 1234 idle".
    std::function<std::string()> status_text;
};

// ncurses surface: live output pane, status bar and a modal box for the
// oldest pending confirmation.
class TerminalUi {
public:
    TerminalUi(ConfirmationBroker& broker, TerminalView& view, UiHooks hooks);
    ~TerminalUi();

    TerminalUi(const TerminalUi&) = delete;
    TerminalUi& operator=(const TerminalUi&) = delete;

    // Owns the screen and runs the render loop on the calling thread until
    // F10 is pressed or stop() is called. F10 cancels every pending prompt.
    core::errors::Result<bool> run();

    // Safe from any thread; the loop notices within one input poll.
    void stop();

private:
    void init_screen();
    void shutdown_screen();
    void create_windows();
    void destroy_windows();

    void draw();
    void draw_output();
    void draw_status(const std::optional<PendingConfirmation>& pending);
    void draw_modal(const PendingConfirmation& pending);

    // Returns false when the loop should end.
    bool handle_key(int key);
    void handle_prompt_key(int key, const PendingConfirmation& pending);
    void handle_edit_key(int key, const PendingConfirmation& pending);
    void resolve(const PendingConfirmation& pending, const runtime::ConfirmationDecision& decision);
    static std::string key_to_bytes(int key);

    ConfirmationBroker& broker_;
    TerminalView& view_;
    UiHooks hooks_;
    std::atomic_bool stop_requested_{false};
    bool screen_active_ = false;

    WINDOW* output_win_ = nullptr;
    WINDOW* status_win_ = nullptr;
    int rows_ = 0;
    int cols_ = 0;

    bool editing_ = false;
    std::string editing_id_;
    std::string edit_buffer_;
    std::uint64_t drawn_revision_ = 0;
    bool dirty_ = true;
};

}  // namespace shellgate::ui
