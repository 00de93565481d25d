#pragma once

#include <set>
#include <string>
#include "parsing/invocation_extractor.hpp"
#include "protocol/hook_contract.hpp"

namespace bashgate::policy {

class AllowlistPolicy {
public:
    explicit AllowlistPolicy(std::set<std::string> allowed_commands);

    // Exact match on the base name; arguments are never inspected.
    bool is_allowed(const std::string& base_name) const;

    protocol::Decision check(const parsing::Invocation& invocation) const;

private:
    std::set<std::string> allowed_commands_;
};

}  // namespace bashgate::policy
