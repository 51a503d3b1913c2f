#pragma once
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <string>
#include <mutex>

namespace shellgate::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline bool parse_level(const std::string& text, LogLevel& level) {
        if (text == "debug") { level = LogLevel::DEBUG; return true; }
        if (text == "info")  { level = LogLevel::INFO;  return true; }
        if (text == "warn" || text == "warning") { level = LogLevel::WARN; return true; }
        if (text == "error") { level = LogLevel::ERROR; return true; }
        return false;
    }

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the agent threads share one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // The ncurses surface owns stdout/stderr while it runs, so the agent
        // redirects records into a file for that lifetime.
        bool set_output_file(const std::string& path) {
            std::lock_guard<std::mutex> lock(mutex_);
            file_.close();
            file_.clear();
            file_.open(path, std::ios::app);
            to_file_ = file_.is_open();
            return to_file_;
        }

        void use_stderr() {
            std::lock_guard<std::mutex> lock(mutex_);
            file_.close();
            to_file_ = false;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (level < min_level_) {
                return;
            }

            std::ostream& out = to_file_ ? static_cast<std::ostream&>(file_) : std::cerr;
            out << timestamp() << " [" << level_to_string(level) << "] "
                << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ofstream file_;
        bool to_file_ = false;

        static std::string timestamp() {
            const std::time_t now =
                std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm_buf{};
            localtime_r(&now, &tm_buf);
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_buf);
            return buffer;
        }

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define SHELLGATE_LOG_DEBUG(msg) shellgate::core::logging::Logger::get().log(shellgate::core::logging::LogLevel::DEBUG, msg)
    #define SHELLGATE_LOG_INFO(msg)  shellgate::core::logging::Logger::get().log(shellgate::core::logging::LogLevel::INFO, msg)
    #define SHELLGATE_LOG_WARN(msg)  shellgate::core::logging::Logger::get().log(shellgate::core::logging::LogLevel::WARN, msg)
    #define SHELLGATE_LOG_ERROR(msg) shellgate::core::logging::Logger::get().log(shellgate::core::logging::LogLevel::ERROR, msg)

} // namespace shellgate::core::logging
