#pragma once

#include <set>
#include <string>
#include <vector>
#include "protocol/hook_contract.hpp"

namespace bashgate::policy {

// pkill/killall may only target development processes. Options, including
// -f, are ignored; exactly one target pattern must remain and its first
// word must name a process in dev_process_names. Patterns with regex
// operators other than . are refused.
protocol::Decision validate_pkill(const std::vector<std::string>& arguments,
                                  const std::set<std::string>& dev_process_names);

}  // namespace bashgate::policy
