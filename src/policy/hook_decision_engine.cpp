#include "policy/hook_decision_engine.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "policy/chmod_validator.hpp"
#include "policy/init_script_validator.hpp"
#include "policy/pkill_policy.hpp"

namespace bashgate::policy {

using protocol::Decision;

std::string to_string(const ValidatorKind kind) {
    switch (kind) {
        case ValidatorKind::Chmod:
            return "chmod";
        case ValidatorKind::InitScript:
            return "init_script";
        case ValidatorKind::Pkill:
            return "pkill";
        case ValidatorKind::Generic:
            return "generic";
        default:
            return "unknown";
    }
}

HookDecisionEngine::HookDecisionEngine(
    core::config::PolicyConfig config,
    std::shared_ptr<const parsing::CommandSplitter> splitter)
    : config_(std::move(config)),
      splitter_(std::move(splitter)),
      allowlist_(config_.allowed_commands) {
    if (!splitter_) {
        splitter_ = std::make_shared<parsing::ShellOperatorSplitter>();
    }
}

ValidatorKind HookDecisionEngine::classify(const parsing::Invocation& invocation) const {
    if (invocation.program == config_.init_script_name ||
        is_interpreted_init_script(invocation, config_)) {
        return ValidatorKind::InitScript;
    }
    if (invocation.program == "chmod") {
        return ValidatorKind::Chmod;
    }
    if (invocation.program == "pkill" || invocation.program == "killall") {
        return ValidatorKind::Pkill;
    }
    return ValidatorKind::Generic;
}

Decision HookDecisionEngine::decide(const protocol::HookRequest& request) const {
    if (config_.shell_tool_names.count(request.tool_name) == 0) {
        LOG_DEBUG("Tool '" + request.tool_name + "' is not governed; passing through.");
        return Decision::allow();
    }
    if (!request.command.has_value()) {
        return Decision::block("missing command: tool_input.command must be a string");
    }
    return evaluate_command(request.command.value());
}

Decision HookDecisionEngine::evaluate_command(const std::string& command) const {
    if (parsing::has_command_substitution(command)) {
        return Decision::block("command substitution is not allowed");
    }

    const auto sub_commands = splitter_->split(command);
    if (sub_commands.empty()) {
        return Decision::block("no command found");
    }

    for (const auto& sub_command : sub_commands) {
        Decision decision = evaluate_sub_command(sub_command);
        if (!decision.allowed()) {
            LOG_DEBUG("Blocked sub-command '" + sub_command + "': " + decision.reason);
            return decision;
        }
    }
    return Decision::allow();
}

Decision HookDecisionEngine::evaluate_sub_command(const std::string& sub_command) const {
    auto extracted = parsing::extract_invocation(sub_command);
    if (core::errors::is_error(extracted)) {
        return Decision::block(core::errors::get_error(extracted).message);
    }
    const auto& invocation = core::errors::get_value(extracted);

    const ValidatorKind kind = classify(invocation);
    LOG_DEBUG("Sub-command '" + sub_command + "' -> " + invocation.program + " (" +
              to_string(kind) + ")");

    // Interpreters are not allowlisted, so the init script check runs first
    // to report why "bash init.sh" is refused.
    if (kind == ValidatorKind::InitScript) {
        return validate_init_script(invocation, config_);
    }

    Decision allowed = allowlist_.check(invocation);
    if (!allowed.allowed()) {
        return allowed;
    }

    switch (kind) {
        case ValidatorKind::Chmod:
            return validate_chmod(invocation.arguments);
        case ValidatorKind::Pkill:
            return validate_pkill(invocation.arguments, config_.dev_process_names);
        case ValidatorKind::Generic:
        case ValidatorKind::InitScript:
            break;
    }
    return Decision::allow();
}

}  // namespace bashgate::policy
