#pragma once

#include <string>
#include <vector>
#include "protocol/hook_contract.hpp"

namespace bashgate::policy {

// chmod may only grant execute permission: [ugoa]*+x on one or more files,
// never recursively.
protocol::Decision validate_chmod(const std::vector<std::string>& arguments);

// Same rules for a whole "chmod ..." sub-command.
protocol::Decision validate_chmod_command(const std::string& sub_command);

bool is_execute_only_mode(const std::string& mode);

}  // namespace bashgate::policy
