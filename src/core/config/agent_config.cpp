#include "core/config/agent_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <pwd.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace shellgate::core::config {

using errors::ErrorCategory;
using errors::GateError;
using nlohmann::json;

namespace {

constexpr int kMaxTimeoutSeconds = 24 * 60 * 60;

GateError invalid_config(const std::string& message) {
    return GateError{ErrorCategory::Input, message, "invalid_config",
                     "Fix the configuration file or regenerate it with `shellgate init`."};
}

std::filesystem::path home_directory() {
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return home;
    }
    if (const passwd* entry = getpwuid(getuid()); entry != nullptr && entry->pw_dir != nullptr) {
        return entry->pw_dir;
    }
    return "/tmp";
}

std::filesystem::path xdg_dir(const char* variable, const char* fallback_under_home) {
    if (const char* value = std::getenv(variable); value != nullptr && *value != '\0') {
        return value;
    }
    return home_directory() / fallback_under_home;
}

// Reads `key` from `object` into `out` when present. Type mismatches are
// reported with the dotted key path.
template <typename T>
bool read_field(const json& object, const char* key, const std::string& path, T& out,
                std::string& error) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return true;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        error = "Configuration key '" + path + "' has the wrong type.";
        return false;
    }
    return true;
}

bool read_section(const json& root, const char* key, json& out, std::string& error) {
    const auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        out = json::object();
        return true;
    }
    if (!it->is_object()) {
        error = std::string("Configuration key '") + key + "' must be an object.";
        return false;
    }
    out = *it;
    return true;
}

}  // namespace

std::string default_socket_path() {
    std::filesystem::path dir = "/tmp";
    if (const char* runtime = std::getenv("XDG_RUNTIME_DIR"); runtime != nullptr && *runtime != '\0') {
        dir = runtime;
    }
    return (dir / ("shellgate-" + std::to_string(getuid()) + ".sock")).string();
}

std::filesystem::path default_config_path() {
    return xdg_dir("XDG_CONFIG_HOME", ".config") / "shellgate" / "config.json";
}

std::filesystem::path default_data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share") / "shellgate";
}

AgentConfig default_config() {
    AgentConfig config;
    config.socket_path = default_socket_path();
    config.logging.file = (default_data_dir() / "shellgate.log").string();
    config.audit_log = (default_data_dir() / "audit.jsonl").string();
    return config;
}

errors::Result<AgentConfig> parse_config(const std::string& text) {
    const json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        return invalid_config("Configuration is not valid JSON.");
    }
    if (!root.is_object()) {
        return invalid_config("Configuration must be a JSON object.");
    }

    AgentConfig config = default_config();
    std::string error;
    json shell_section;
    json logging_section;
    json policy_section;
    const bool ok =
        read_field(root, "socket_path", "socket_path", config.socket_path, error) &&
        read_field(root, "default_timeout_seconds", "default_timeout_seconds",
                   config.default_timeout_seconds, error) &&
        read_field(root, "startup_timeout_seconds", "startup_timeout_seconds",
                   config.startup_timeout_seconds, error) &&
        read_field(root, "max_output_bytes", "max_output_bytes", config.max_output_bytes, error) &&
        read_field(root, "audit_log", "audit_log", config.audit_log, error) &&
        read_section(root, "shell", shell_section, error) &&
        read_field(shell_section, "path", "shell.path", config.shell.path, error) &&
        read_field(shell_section, "args", "shell.args", config.shell.args, error) &&
        read_field(shell_section, "bootstrap", "shell.bootstrap", config.shell.bootstrap, error) &&
        read_section(root, "logging", logging_section, error) &&
        read_field(logging_section, "level", "logging.level", config.logging.level, error) &&
        read_field(logging_section, "file", "logging.file", config.logging.file, error) &&
        read_section(root, "policy", policy_section, error) &&
        read_field(policy_section, "deny_patterns", "policy.deny_patterns",
                   config.policy.deny_patterns, error) &&
        read_field(policy_section, "allow_patterns", "policy.allow_patterns",
                   config.policy.allow_patterns, error) &&
        read_field(policy_section, "confirm_patterns", "policy.confirm_patterns",
                   config.policy.confirm_patterns, error);
    if (!ok) {
        return invalid_config(error);
    }

    if (config.socket_path.empty()) {
        return invalid_config("socket_path cannot be empty.");
    }
    if (config.shell.path.empty()) {
        return invalid_config("shell.path cannot be empty.");
    }
    if (config.default_timeout_seconds <= 0 || config.default_timeout_seconds > kMaxTimeoutSeconds) {
        return invalid_config("default_timeout_seconds must be between 1 and 86400.");
    }
    if (config.startup_timeout_seconds <= 0 || config.startup_timeout_seconds > kMaxTimeoutSeconds) {
        return invalid_config("startup_timeout_seconds must be between 1 and 86400.");
    }
    if (config.max_output_bytes < 4096) {
        return invalid_config("max_output_bytes must be at least 4096.");
    }
    logging::LogLevel level = logging::LogLevel::INFO;
    if (!logging::parse_level(config.logging.level, level)) {
        return invalid_config("Unknown logging.level '" + config.logging.level + "'.");
    }

    auto guard = policy::PolicyGuard::create(config.policy);
    if (errors::is_error(guard)) {
        return errors::get_error(guard);
    }
    return config;
}

errors::Result<AgentConfig> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        SHELLGATE_LOG_DEBUG("Config: " + path.string() + " not found, using defaults");
        return default_config();
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Input, "Unable to open configuration: " + path.string(),
                         "invalid_config"};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse_config(buffer.str());
    if (errors::is_error(parsed)) {
        auto error = errors::get_error(parsed);
        error.message = path.string() + ": " + error.message;
        return error;
    }
    SHELLGATE_LOG_INFO("Config: loaded " + path.string());
    return parsed;
}

json to_json(const AgentConfig& config) {
    json root;
    root["socket_path"] = config.socket_path;
    root["shell"] = {{"path", config.shell.path},
                     {"args", config.shell.args},
                     {"bootstrap", config.shell.bootstrap}};
    root["logging"] = {{"level", config.logging.level}, {"file", config.logging.file}};
    root["policy"] = {{"deny_patterns", config.policy.deny_patterns},
                      {"allow_patterns", config.policy.allow_patterns},
                      {"confirm_patterns", config.policy.confirm_patterns}};
    root["default_timeout_seconds"] = config.default_timeout_seconds;
    root["startup_timeout_seconds"] = config.startup_timeout_seconds;
    root["max_output_bytes"] = config.max_output_bytes;
    root["audit_log"] = config.audit_log;
    return root;
}

std::string render_bootstrap(const std::string& bootstrap, const std::string& token) {
    const std::string placeholder = kMarkerTokenPlaceholder;
    std::string rendered = bootstrap;
    std::size_t pos = rendered.find(placeholder);
    while (pos != std::string::npos) {
        rendered.replace(pos, placeholder.size(), token);
        pos = rendered.find(placeholder, pos + token.size());
    }
    return rendered;
}

errors::Result<std::filesystem::path> write_default_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return GateError{ErrorCategory::Input, "Configuration already exists: " + path.string(),
                         "config_exists", "Edit the existing file instead."};
    }
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return GateError{ErrorCategory::Internal,
                             "Unable to create directory: " + path.parent_path().string(),
                             "config_dir_create_failed"};
        }
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        return GateError{ErrorCategory::Internal, "Unable to write configuration: " + path.string(),
                         "config_write_failed"};
    }
    out << to_json(default_config()).dump(2) << "\n";
    if (!out.good()) {
        return GateError{ErrorCategory::Internal, "Unable to write configuration: " + path.string(),
                         "config_write_failed"};
    }
    return path;
}

}  // namespace shellgate::core::config
