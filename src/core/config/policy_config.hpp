#pragma once

#include <filesystem>
#include <set>
#include <string>
#include "core/errors/gate_errors.hpp"

namespace bashgate::core::config {

// Process-wide policy tables. Built once at startup, then only read.
struct PolicyConfig {
    // Base names of programs an agent may run.
    std::set<std::string> allowed_commands;
    // Process names pkill/killall may target.
    std::set<std::string> dev_process_names;
    // The one script that may be executed directly by path.
    std::string init_script_name;
    // Programs that run a script handed to them as an argument.
    std::set<std::string> script_interpreters;
    // Tool names whose requests carry a shell command.
    std::set<std::string> shell_tool_names;
};

PolicyConfig default_policy_config();

// Missing keys keep their default values.
core::errors::Result<PolicyConfig> load_policy_config(
    const std::filesystem::path& path);

core::errors::Result<PolicyConfig> parse_policy_config(const std::string& text);

std::string policy_config_to_json(const PolicyConfig& config);

}  // namespace bashgate::core::config
