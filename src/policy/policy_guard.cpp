#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace shellgate::policy {

using core::errors::ErrorCategory;
using core::errors::GateError;

namespace {

bool is_blank(const std::string& command) {
    return std::all_of(command.begin(), command.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
}

}  // namespace

std::string to_string(const Verdict verdict) {
    switch (verdict) {
        case Verdict::Allow:
            return "allow";
        case Verdict::Deny:
            return "deny";
        case Verdict::RequireConfirmation:
            return "require_confirmation";
        default:
            return "unknown";
    }
}

core::errors::Result<bool> PolicyGuard::compile_rules(
    const std::vector<std::string>& sources, std::vector<Rule>& rules,
    const std::string& list_name) {
    for (const auto& source : sources) {
        try {
            rules.push_back(
                Rule{source, std::regex(source, std::regex::ECMAScript | std::regex::icase)});
        } catch (const std::regex_error& e) {
            return GateError{ErrorCategory::Policy,
                             "Invalid " + list_name + " pattern '" + source +
                                 "': " + e.what(),
                             "invalid_pattern"};
        }
    }
    return true;
}

core::errors::Result<PolicyGuard> PolicyGuard::create(CommandPolicy command_policy) {
    PolicyGuard guard;
    auto compiled = compile_rules(command_policy.deny_patterns, guard.deny_rules_, "deny");
    if (core::errors::is_error(compiled)) {
        return core::errors::get_error(compiled);
    }
    compiled = compile_rules(command_policy.allow_patterns, guard.allow_rules_, "allow");
    if (core::errors::is_error(compiled)) {
        return core::errors::get_error(compiled);
    }
    compiled = compile_rules(command_policy.confirm_patterns, guard.confirm_rules_,
                             "confirm");
    if (core::errors::is_error(compiled)) {
        return core::errors::get_error(compiled);
    }

    guard.command_policy_ = std::move(command_policy);
    return guard;
}

const PolicyGuard::Rule* PolicyGuard::first_match(const std::vector<Rule>& rules,
                                                  const std::string& command) {
    for (const auto& rule : rules) {
        if (std::regex_search(command, rule.pattern)) {
            return &rule;
        }
    }
    return nullptr;
}

PolicyDecision PolicyGuard::evaluate(const std::string& command,
                                     const protocol::ExecutionMode mode) const {
    if (command.empty() || is_blank(command)) {
        return PolicyDecision{Verdict::Deny, "Command cannot be empty."};
    }

    // Deny wins over every allow pattern.
    if (const Rule* denied = first_match(deny_rules_, command)) {
        return PolicyDecision{Verdict::Deny,
                              "Command matches blocked pattern: " + denied->source};
    }

    if (mode == protocol::ExecutionMode::Tutor) {
        return PolicyDecision{Verdict::RequireConfirmation,
                              "Tutor mode requires operator approval."};
    }

    const Rule* sensitive = first_match(confirm_rules_, command);
    if (sensitive != nullptr && first_match(allow_rules_, command) == nullptr) {
        return PolicyDecision{Verdict::RequireConfirmation,
                              "Command matches sensitive pattern: " + sensitive->source};
    }

    return PolicyDecision{Verdict::Allow, "No blocking rule matched."};
}

}  // namespace shellgate::policy
