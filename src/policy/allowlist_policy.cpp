#include "policy/allowlist_policy.hpp"

#include <utility>

namespace bashgate::policy {

using protocol::Decision;

AllowlistPolicy::AllowlistPolicy(std::set<std::string> allowed_commands)
    : allowed_commands_(std::move(allowed_commands)) {}

bool AllowlistPolicy::is_allowed(const std::string& base_name) const {
    return allowed_commands_.count(base_name) > 0;
}

Decision AllowlistPolicy::check(const parsing::Invocation& invocation) const {
    if (is_allowed(invocation.program)) {
        return Decision::allow();
    }
    return Decision::block("Command '" + invocation.program +
                           "' is not in the allowed commands list");
}

}  // namespace bashgate::policy
