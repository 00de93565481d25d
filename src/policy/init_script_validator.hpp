#pragma once

#include <string>
#include "core/config/policy_config.hpp"
#include "parsing/invocation_extractor.hpp"
#include "protocol/hook_contract.hpp"

namespace bashgate::policy {

// The project init script may only run directly through its own path
// (./init.sh, /abs/init.sh, ../dir/init.sh), never through an interpreter.
protocol::Decision validate_init_script(const parsing::Invocation& invocation,
                                        const core::config::PolicyConfig& config);

// Validates every sub-command of a raw command; the first failure wins.
protocol::Decision validate_init_script(const std::string& command,
                                        const core::config::PolicyConfig& config);

// True when an interpreter is handed the init script as an argument.
bool is_interpreted_init_script(const parsing::Invocation& invocation,
                                const core::config::PolicyConfig& config);

}  // namespace bashgate::policy
