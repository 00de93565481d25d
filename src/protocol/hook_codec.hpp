#pragma once

#include <string>
#include "core/errors/gate_errors.hpp"
#include "protocol/hook_contract.hpp"

namespace bashgate::protocol {

// Request shape: {"tool_name": "Bash", "tool_input": {"command": "..."}}
core::errors::Result<HookRequest> parse_hook_request(const std::string& text);

// Response shape: {"decision": "allow"|"block", "reason": "..."}
std::string to_json(const Decision& decision);

}  // namespace bashgate::protocol
