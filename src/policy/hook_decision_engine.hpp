#pragma once

#include <memory>
#include <string>
#include "core/config/policy_config.hpp"
#include "parsing/command_splitter.hpp"
#include "parsing/invocation_extractor.hpp"
#include "policy/allowlist_policy.hpp"
#include "protocol/hook_contract.hpp"

namespace bashgate::policy {

enum class ValidatorKind {
    Chmod,
    InitScript,
    Pkill,
    Generic
};

std::string to_string(ValidatorKind kind);

// Decides whether a proposed shell command may run. Holds only immutable
// policy, so one engine can serve concurrent requests.
class HookDecisionEngine {
public:
    explicit HookDecisionEngine(
        core::config::PolicyConfig config = core::config::default_policy_config(),
        std::shared_ptr<const parsing::CommandSplitter> splitter = nullptr);

    // Tools outside shell_tool_names pass through.
    protocol::Decision decide(const protocol::HookRequest& request) const;

    // Every sub-command must pass; the first failure supplies the reason.
    protocol::Decision evaluate_command(const std::string& command) const;

    ValidatorKind classify(const parsing::Invocation& invocation) const;

    const core::config::PolicyConfig& config() const { return config_; }

private:
    protocol::Decision evaluate_sub_command(const std::string& sub_command) const;

    core::config::PolicyConfig config_;
    std::shared_ptr<const parsing::CommandSplitter> splitter_;
    AllowlistPolicy allowlist_;
};

}  // namespace bashgate::policy
