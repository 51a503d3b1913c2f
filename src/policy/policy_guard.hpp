#pragma once

#include <regex>
#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace shellgate::policy {

struct CommandPolicy {
    // Destructive operations; a match always denies.
    std::vector<std::string> deny_patterns = {
        R"(rm\s+-[rf]+.*/)",
        R"(:\(\)\s*\{\s*:\s*\|\s*:\s*&\s*\};\s*:)",
        R"(mkfs)",
        R"(dd\s+if=)",
        R"(>\s*/dev/sd[a-z])",
        R"(\b(shutdown|reboot|poweroff|halt)\b)"};
    // Exempts a command from confirmation escalation, never from a deny match.
    std::vector<std::string> allow_patterns;
    // Sensitive operations that need a human decision even in autonomous mode.
    std::vector<std::string> confirm_patterns = {
        R"(\bsudo\b)",
        R"(\buserdel\b)",
        R"(\busermod\b)",
        R"(\bpasswd\b)",
        R"(\biptables\b)",
        R"(\bfirewall-cmd\b)",
        R"(\bsystemctl\s+(stop|disable|mask)\b)"};
};

enum class Verdict {
    Allow,
    Deny,
    RequireConfirmation
};

struct PolicyDecision {
    Verdict verdict = Verdict::Deny;
    std::string reason;
};

std::string to_string(Verdict verdict);

class PolicyGuard {
public:
    // Compiles every pattern; an invalid regex is reported instead of thrown.
    static core::errors::Result<PolicyGuard> create(CommandPolicy command_policy = {});

    PolicyDecision evaluate(const std::string& command,
                            protocol::ExecutionMode mode) const;

    const CommandPolicy& policy() const { return command_policy_; }

private:
    struct Rule {
        std::string source;
        std::regex pattern;
    };

    PolicyGuard() = default;

    static core::errors::Result<bool> compile_rules(
        const std::vector<std::string>& sources, std::vector<Rule>& rules,
        const std::string& list_name);
    static const Rule* first_match(const std::vector<Rule>& rules,
                                   const std::string& command);

    CommandPolicy command_policy_;
    std::vector<Rule> deny_rules_;
    std::vector<Rule> allow_rules_;
    std::vector<Rule> confirm_rules_;
};

}  // namespace shellgate::policy
