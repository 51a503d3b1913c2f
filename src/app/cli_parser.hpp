#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "core/errors/gate_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace shellgate::app::cli {

    enum class Command {
        Agent,
        Exec,
        Status,
        Init
    };

    struct CliOptions {
        Command command = Command::Agent;
        std::optional<std::string> config_path;
        std::optional<std::string> socket_path;
        std::optional<std::string> shell_path;
        std::optional<std::string> log_level;
        bool headless = false;

        // exec only
        std::string exec_command;
        protocol::ExecutionMode mode = protocol::ExecutionMode::Autonomous;
        std::optional<std::chrono::seconds> timeout;
    };

    std::string usage();

    shellgate::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
