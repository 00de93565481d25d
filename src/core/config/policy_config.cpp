#include "core/config/policy_config.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace bashgate::core::config {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;

namespace {

core::errors::Result<std::set<std::string>> read_name_set(const json& document,
                                                          const std::string& key) {
    const json& node = document.at(key);
    if (!node.is_array()) {
        return GateError{ErrorCategory::Config,
                         "Policy key '" + key + "' must be an array of strings.",
                         "invalid_policy"};
    }

    std::set<std::string> names;
    for (const auto& entry : node) {
        if (!entry.is_string() || entry.get<std::string>().empty()) {
            return GateError{ErrorCategory::Config,
                             "Policy key '" + key +
                                 "' must only contain non-empty strings.",
                             "invalid_policy"};
        }
        names.insert(entry.get<std::string>());
    }
    return names;
}

json name_set_to_json(const std::set<std::string>& names) {
    json array = json::array();
    for (const auto& name : names) {
        array.push_back(name);
    }
    return array;
}

}  // namespace

PolicyConfig default_policy_config() {
    PolicyConfig config;
    config.allowed_commands = {
        // File inspection
        "ls", "cat", "head", "tail", "wc", "grep",
        // File operations
        "cp", "mkdir", "chmod",
        // Directory
        "pwd",
        // Node.js development
        "npm", "node",
        // Version control
        "git",
        // Process management
        "ps", "lsof", "sleep", "pkill",
        // Project bootstrap script
        "init.sh"};
    config.dev_process_names = {"node", "npm", "npx", "vite", "next"};
    config.init_script_name = "init.sh";
    config.script_interpreters = {"bash", "sh", "zsh", "dash", "source", "."};
    config.shell_tool_names = {"Bash"};
    return config;
}

core::errors::Result<PolicyConfig> parse_policy_config(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        return GateError{ErrorCategory::Config,
                         std::string("Policy file is not valid JSON: ") + e.what(),
                         "invalid_json"};
    }

    if (!document.is_object()) {
        return GateError{ErrorCategory::Config,
                         "Policy document must be a JSON object.",
                         "invalid_policy"};
    }

    PolicyConfig config = default_policy_config();

    const std::pair<const char*, std::set<std::string>*> set_keys[] = {
        {"allowed_commands", &config.allowed_commands},
        {"dev_process_names", &config.dev_process_names},
        {"script_interpreters", &config.script_interpreters},
        {"shell_tool_names", &config.shell_tool_names}};
    for (const auto& [key, target] : set_keys) {
        if (!document.contains(key)) {
            continue;
        }
        auto names = read_name_set(document, key);
        if (core::errors::is_error(names)) {
            return core::errors::get_error(names);
        }
        *target = core::errors::get_value(names);
    }

    if (document.contains("init_script_name")) {
        const json& node = document.at("init_script_name");
        if (!node.is_string() || node.get<std::string>().empty() ||
            node.get<std::string>().find('/') != std::string::npos) {
            return GateError{ErrorCategory::Config,
                             "Policy key 'init_script_name' must be a bare file name.",
                             "invalid_policy"};
        }
        config.init_script_name = node.get<std::string>();
    }

    return config;
}

core::errors::Result<PolicyConfig> load_policy_config(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return GateError{ErrorCategory::Config,
                         "Unable to open policy file: " + path.string(),
                         "policy_unreadable",
                         "Check the --policy path and its permissions."};
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_policy_config(buffer.str());
}

std::string policy_config_to_json(const PolicyConfig& config) {
    json document;
    document["allowed_commands"] = name_set_to_json(config.allowed_commands);
    document["dev_process_names"] = name_set_to_json(config.dev_process_names);
    document["init_script_name"] = config.init_script_name;
    document["script_interpreters"] = name_set_to_json(config.script_interpreters);
    document["shell_tool_names"] = name_set_to_json(config.shell_tool_names);
    return document.dump(2);
}

}  // namespace bashgate::core::config
