#pragma once
#include <random>
#include <string>

namespace shellgate::core::config {

    // "<prefix>-" followed by 8 random hex digits, e.g. "req-3fa0c19b".
    // Safe to call from any connection thread.
    inline std::string generate_id(const std::string& prefix) {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        thread_local std::mt19937 engine{std::random_device{}()};
        std::uniform_int_distribution<int> digit(0, 15);

        std::string id = prefix;
        id.push_back('-');
        for (int i = 0; i < 8; ++i) {
            id.push_back(kHexDigits[digit(engine)]);
        }
        return id;
    }

    // Correlates an execute envelope with its result when the caller gave no id.
    inline std::string generate_request_id() {
        return generate_id("req");
    }

    // Tags every log record of one agent process.
    inline std::string generate_agent_id() {
        return generate_id("agent");
    }

} // namespace shellgate::core::config
