#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <vector>
#include "core/logging/logger.hpp"

namespace shellgate::app::cli {

    using namespace shellgate::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> config;
        std::optional<std::string> socket;
        std::optional<std::string> shell;
        std::optional<std::string> log_level;
        std::optional<std::string> command;
        std::optional<std::string> mode;
        std::optional<std::string> timeout;
        bool headless = false;
    };

    std::string usage() {
        return "Usage:\n"
               "  shellgate agent [--config FILE] [--socket PATH] [--shell PATH] [--log-level LEVEL] [--headless]\n"
               "  shellgate exec --command CMD [--mode autonomous|review|tutor] [--timeout SECONDS] [--socket PATH]\n"
               "  shellgate status [--socket PATH]\n"
               "  shellgate init [--config FILE]\n";
    }

    namespace {

        // Flags each subcommand accepts; anything else is rejected.
        bool accepts(const Command command, const std::string& flag) {
            switch (command) {
                case Command::Agent:
                    return flag == "--config" || flag == "--socket" || flag == "--shell" ||
                           flag == "--log-level" || flag == "--headless";
                case Command::Exec:
                    return flag == "--command" || flag == "--mode" || flag == "--timeout" ||
                           flag == "--socket" || flag == "--config";
                case Command::Status:
                    return flag == "--socket" || flag == "--config";
                case Command::Init:
                    return flag == "--config";
                default:
                    return false;
            }
        }

    } // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return GateError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        CliOptions options;
        const std::string command = argv[1];
        if (command == "agent") {
            options.command = Command::Agent;
        } else if (command == "exec") {
            options.command = Command::Exec;
        } else if (command == "status") {
            options.command = Command::Status;
        } else if (command == "init") {
            options.command = Command::Init;
        } else {
            return GateError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and subcommand
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (!accepts(options.command, flag)) {
                return GateError{ErrorCategory::Input, "Unknown argument for '" + command + "': " + flag, "unknown_argument", usage()};
            }
            if (flag == "--headless") {
                raw.headless = true;
                continue;
            }
            if (i + 1 >= args.size()) {
                return GateError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            const std::string& value = args[++i];
            if (flag == "--config") raw.config = value;
            else if (flag == "--socket") raw.socket = value;
            else if (flag == "--shell") raw.shell = value;
            else if (flag == "--log-level") raw.log_level = value;
            else if (flag == "--command") raw.command = value;
            else if (flag == "--mode") raw.mode = value;
            else if (flag == "--timeout") raw.timeout = value;
        }

        // 3. Validator Phase: Enforce logic and bounds
        options.config_path = raw.config;
        options.socket_path = raw.socket;
        options.shell_path = raw.shell;
        options.headless = raw.headless;

        if (raw.config && raw.config->empty()) {
            return GateError{ErrorCategory::Input, "--config cannot be empty", "invalid_path"};
        }
        if (raw.socket && raw.socket->empty()) {
            return GateError{ErrorCategory::Input, "--socket cannot be empty", "invalid_path"};
        }
        if (raw.shell && raw.shell->empty()) {
            return GateError{ErrorCategory::Input, "--shell cannot be empty", "invalid_path"};
        }

        if (raw.log_level) {
            core::logging::LogLevel level = core::logging::LogLevel::INFO;
            if (!core::logging::parse_level(raw.log_level.value(), level)) {
                return GateError{ErrorCategory::Input, "Unknown log level: " + raw.log_level.value(), "invalid_log_level", "Use debug, info, warn or error."};
            }
            options.log_level = raw.log_level;
        }

        if (options.command != Command::Exec) {
            return options;
        }

        if (!raw.command.has_value() || raw.command->find_first_not_of(" \t") == std::string::npos) {
            return GateError{ErrorCategory::Input, "exec requires a non-empty --command", "missing_required_flag"};
        }
        options.exec_command = raw.command.value();

        if (raw.mode) {
            const auto mode = protocol::parse_mode(raw.mode.value());
            if (!mode.has_value()) {
                return GateError{ErrorCategory::Input, "Unknown mode: " + raw.mode.value(), "invalid_mode", "Use autonomous, review or tutor."};
            }
            options.mode = mode.value();
        }

        // Exception-free integer parsing
        if (raw.timeout) {
            uint32_t seconds = 0;
            const char* begin = raw.timeout->data();
            const char* end = raw.timeout->data() + raw.timeout->size();
            auto [ptr, ec] = std::from_chars(begin, end, seconds);
            if (ec != std::errc() || ptr != end) {
                return GateError{ErrorCategory::Input, "Invalid number for --timeout", "invalid_integer", "Provide a positive number of seconds."};
            }
            if (seconds == 0 || seconds > 86400) {
                return GateError{ErrorCategory::Input, "--timeout out of bounds", "bounds_error", "Must be between 1 and 86400."};
            }
            options.timeout = std::chrono::seconds(seconds);
        }

        return options;
    }

} // namespace shellgate::app::cli
