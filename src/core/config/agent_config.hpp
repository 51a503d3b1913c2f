#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/gate_errors.hpp"
#include "policy/policy_guard.hpp"

namespace shellgate::core::config {

// Replaced with the agent's marker token when the bootstrap line is written.
inline constexpr const char* kMarkerTokenPlaceholder = "{token}";

// Prints the OSC 133 "D" marker once per prompt, carrying the last exit
// status and the agent's marker token.
inline constexpr const char* kDefaultBashBootstrap =
    R"(PROMPT_COMMAND='printf "\033]133;D;%s;{token}\007" "$?"')";

struct ShellConfig {
    std::string path = "/bin/bash";
    std::vector<std::string> args = {"-i"};
    std::string bootstrap = kDefaultBashBootstrap;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;   // used while the confirmation surface owns the screen
};

struct AgentConfig {
    std::string socket_path;
    ShellConfig shell;
    LoggingConfig logging;
    ::shellgate::policy::CommandPolicy policy;
    int default_timeout_seconds = 30;
    int startup_timeout_seconds = 10;
    std::size_t max_output_bytes = 64 * 1024 * 1024;
    std::string audit_log;   // empty disables auditing
};

// $XDG_RUNTIME_DIR (or /tmp) + "/shellgate-<uid>.sock"
std::string default_socket_path();
// $XDG_CONFIG_HOME (or ~/.config) + "/shellgate/config.json"
std::filesystem::path default_config_path();
// $XDG_DATA_HOME (or ~/.local/share) + "/shellgate"
std::filesystem::path default_data_dir();

AgentConfig default_config();

// Missing keys keep their defaults. Wrong types and unknown log levels are
// "invalid_config" errors; a pattern that does not compile is "invalid_pattern".
errors::Result<AgentConfig> parse_config(const std::string& text);

// A missing file yields the defaults.
errors::Result<AgentConfig> load_config(const std::filesystem::path& path);

nlohmann::json to_json(const AgentConfig& config);

// Substitutes every kMarkerTokenPlaceholder in `bootstrap`.
std::string render_bootstrap(const std::string& bootstrap, const std::string& token);

// Refuses to overwrite ("config_exists").
errors::Result<std::filesystem::path> write_default_config(const std::filesystem::path& path);

}  // namespace shellgate::core::config
