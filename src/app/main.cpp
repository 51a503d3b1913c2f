#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include "agent/shell_agent.hpp"
#include "app/cli_parser.hpp"
#include "core/config/agent_config.hpp"
#include "core/config/request_id.hpp"
#include "core/errors/gate_errors.hpp"
#include "core/logging/logger.hpp"
#include "ipc/controller_client.hpp"
#include "protocol/message_codec.hpp"
#include "ui/confirmation_broker.hpp"
#include "ui/terminal_ui.hpp"
#include "ui/terminal_view.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) {
    g_stop_requested = 1;
}

void report(const shellgate::core::errors::GateError& err, const std::string& what) {
    SHELLGATE_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        SHELLGATE_LOG_INFO("Hint: " + err.hint);
    }
}

shellgate::core::errors::Result<shellgate::core::config::AgentConfig> resolve_config(
    const shellgate::app::cli::CliOptions& options) {
    const std::filesystem::path path = options.config_path.has_value()
                                           ? std::filesystem::path(options.config_path.value())
                                           : shellgate::core::config::default_config_path();
    auto loaded = shellgate::core::config::load_config(path);
    if (shellgate::core::errors::is_error(loaded)) {
        return loaded;
    }
    auto config = shellgate::core::errors::take_value(loaded);
    if (options.socket_path) config.socket_path = options.socket_path.value();
    if (options.shell_path) config.shell.path = options.shell_path.value();
    if (options.log_level) config.logging.level = options.log_level.value();
    return config;
}

int run_init(const shellgate::app::cli::CliOptions& options) {
    const std::filesystem::path path = options.config_path.has_value()
                                           ? std::filesystem::path(options.config_path.value())
                                           : shellgate::core::config::default_config_path();
    auto written = shellgate::core::config::write_default_config(path);
    if (shellgate::core::errors::is_error(written)) {
        report(shellgate::core::errors::get_error(written), "Init failed");
        return 1;
    }
    std::cout << shellgate::core::errors::get_value(written).string() << std::endl;
    return 0;
}

int run_exec(const shellgate::app::cli::CliOptions& options,
             const shellgate::core::config::AgentConfig& config) {
    shellgate::protocol::ExecutionRequest request;
    request.id = shellgate::core::config::generate_request_id();
    request.command = options.exec_command;
    request.mode = options.mode;
    request.timeout = options.timeout.value_or(std::chrono::seconds(config.default_timeout_seconds));

    shellgate::ipc::ControllerClient client(config.socket_path);
    auto connected = client.connect();
    if (shellgate::core::errors::is_error(connected)) {
        report(shellgate::core::errors::get_error(connected), "Connection failed");
        return 1;
    }

    const auto result = client.submit_execution(request);
    std::cout << shellgate::protocol::encode_envelope(
                     shellgate::protocol::result_to_envelope(result))
              << std::endl;
    return result.status == shellgate::protocol::ExecutionStatus::Completed ? 0 : 1;
}

int run_status(const shellgate::core::config::AgentConfig& config) {
    shellgate::ipc::ControllerClient client(config.socket_path);
    shellgate::protocol::Envelope request{shellgate::core::config::generate_request_id(),
                                          shellgate::protocol::message_type::kStatus,
                                          nlohmann::json::object()};
    auto response = client.round_trip(request);
    if (shellgate::core::errors::is_error(response)) {
        report(shellgate::core::errors::get_error(response), "Status request failed");
        return 1;
    }
    std::cout << shellgate::protocol::encode_envelope(shellgate::core::errors::get_value(response))
              << std::endl;
    return shellgate::core::errors::get_value(response).type ==
                   shellgate::protocol::message_type::kStatus
               ? 0
               : 1;
}

int run_agent(const shellgate::app::cli::CliOptions& options,
              const shellgate::core::config::AgentConfig& config) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);

    shellgate::agent::ShellAgent agent(config);
    shellgate::ui::ConfirmationBroker broker;
    shellgate::ui::TerminalView view;
    if (!options.headless) {
        agent.attach_surface(broker, view);
    }

    auto started = agent.start();
    if (shellgate::core::errors::is_error(started)) {
        report(shellgate::core::errors::get_error(started), "Agent failed to start");
        return 1;
    }

    if (options.headless) {
        SHELLGATE_LOG_INFO("Running headless; commands needing approval will be denied.");
        while (g_stop_requested == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        agent.stop();
        return 0;
    }

    // The surface owns the screen from here on.
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(config.logging.file).parent_path(), ec);
    if (!shellgate::core::logging::Logger::get().set_output_file(config.logging.file)) {
        SHELLGATE_LOG_WARN("Unable to open log file " + config.logging.file +
                           "; log records will be lost while the surface runs.");
    }

    shellgate::ui::TerminalUi surface(
        broker, view,
        shellgate::ui::UiHooks{
            [&agent](const std::string& bytes) { agent.send_keys(bytes); },
            [&agent](unsigned short rows, unsigned short cols) {
                auto resized = agent.resize(rows, cols);
                if (shellgate::core::errors::is_error(resized)) {
                    SHELLGATE_LOG_WARN("Resize failed: " +
                                       shellgate::core::errors::get_error(resized).message);
                }
            },
            [&agent]() { return agent.status_line(); }});

    std::atomic_bool surface_done{false};
    std::thread signal_watch([&surface, &surface_done]() {
        while (!surface_done) {
            if (g_stop_requested != 0) {
                surface.stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto ran = surface.run();
    surface_done = true;
    signal_watch.join();
    agent.stop();
    shellgate::core::logging::Logger::get().use_stderr();

    if (shellgate::core::errors::is_error(ran)) {
        report(shellgate::core::errors::get_error(ran), "Confirmation surface failed");
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log record of this process with one agent id
    shellgate::core::logging::Logger::get().set_session_id(
        shellgate::core::config::generate_agent_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = shellgate::app::cli::parse_and_validate(argc, argv);
    if (shellgate::core::errors::is_error(parsed)) {
        const auto& err = shellgate::core::errors::get_error(parsed);
        SHELLGATE_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            std::cerr << err.hint;
        }
        return 2;
    }
    const auto& options = shellgate::core::errors::get_value(parsed);

    if (options.command == shellgate::app::cli::Command::Init) {
        return run_init(options);
    }

    // 3. Load configuration; flags override file values
    auto config_result = resolve_config(options);
    if (shellgate::core::errors::is_error(config_result)) {
        report(shellgate::core::errors::get_error(config_result), "Configuration error");
        return 2;
    }
    const auto& config = shellgate::core::errors::get_value(config_result);

    shellgate::core::logging::LogLevel level = shellgate::core::logging::LogLevel::INFO;
    if (shellgate::core::logging::parse_level(config.logging.level, level)) {
        shellgate::core::logging::Logger::get().set_level(level);
    }

    switch (options.command) {
        case shellgate::app::cli::Command::Exec:
            return run_exec(options, config);
        case shellgate::app::cli::Command::Status:
            return run_status(config);
        case shellgate::app::cli::Command::Agent:
        default:
            return run_agent(options, config);
    }
}
