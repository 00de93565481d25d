#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/policy_config.hpp"
#include "core/errors/gate_errors.hpp"

namespace {

using bashgate::core::config::default_policy_config;
using bashgate::core::config::load_policy_config;
using bashgate::core::config::parse_policy_config;
using bashgate::core::config::policy_config_to_json;
using bashgate::core::errors::ErrorCategory;
using bashgate::core::errors::get_error;
using bashgate::core::errors::get_value;
using bashgate::core::errors::is_error;
using nlohmann::json;

class TempPolicyFile {
public:
    TempPolicyFile(const std::string& name, const std::string& content) {
        path_ = std::filesystem::temp_directory_path() /
                (".tmp_policy_config_" + name + ".json");
        std::ofstream out(path_);
        out << content;
    }

    ~TempPolicyFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

TEST(PolicyConfigTest, DefaultsMatchDevelopmentWorkflow) {
    const auto config = default_policy_config();
    for (const char* name : {"ls", "cat", "head", "tail", "wc", "grep", "cp", "mkdir",
                             "chmod", "pwd", "npm", "node", "git", "ps", "lsof",
                             "sleep", "pkill", "init.sh"}) {
        EXPECT_EQ(config.allowed_commands.count(name), 1u) << name;
    }
    for (const char* name : {"rm", "kill", "killall", "curl", "bash", "echo", "touch"}) {
        EXPECT_EQ(config.allowed_commands.count(name), 0u) << name;
    }
    EXPECT_EQ(config.dev_process_names.count("node"), 1u);
    EXPECT_EQ(config.dev_process_names.count("vite"), 1u);
    EXPECT_EQ(config.dev_process_names.count("bash"), 0u);
    EXPECT_EQ(config.init_script_name, "init.sh");
    EXPECT_EQ(config.script_interpreters.count("bash"), 1u);
    EXPECT_EQ(config.shell_tool_names.count("Bash"), 1u);
}

TEST(PolicyConfigTest, OverridesOnlyGivenKeys) {
    auto result = parse_policy_config(R"({"allowed_commands": ["ls", "make"]})");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.allowed_commands.size(), 2u);
    EXPECT_EQ(config.allowed_commands.count("make"), 1u);
    EXPECT_EQ(config.dev_process_names, default_policy_config().dev_process_names);
    EXPECT_EQ(config.init_script_name, "init.sh");
}

TEST(PolicyConfigTest, RejectsInvalidJson) {
    auto result = parse_policy_config("{not json");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Config);
    EXPECT_EQ(get_error(result).code, "invalid_json");
}

TEST(PolicyConfigTest, RejectsNonObjectDocument) {
    auto result = parse_policy_config(R"(["ls"])");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_policy");
}

TEST(PolicyConfigTest, RejectsWrongTypes) {
    auto not_array = parse_policy_config(R"({"dev_process_names": "node"})");
    ASSERT_TRUE(is_error(not_array));
    EXPECT_EQ(get_error(not_array).code, "invalid_policy");

    auto empty_name = parse_policy_config(R"({"allowed_commands": ["ls", ""]})");
    ASSERT_TRUE(is_error(empty_name));
    EXPECT_EQ(get_error(empty_name).code, "invalid_policy");

    auto number = parse_policy_config(R"({"shell_tool_names": [1]})");
    ASSERT_TRUE(is_error(number));
    EXPECT_EQ(get_error(number).code, "invalid_policy");
}

TEST(PolicyConfigTest, RejectsInitScriptNameWithPath) {
    auto result = parse_policy_config(R"({"init_script_name": "bin/init.sh"})");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_policy");
}

TEST(PolicyConfigTest, LoadsFromFile) {
    TempPolicyFile file("loads_from_file", R"({"init_script_name": "bootstrap.sh", "shell_tool_names": ["Bash", "Shell"]})");
    auto result = load_policy_config(file.path());
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.init_script_name, "bootstrap.sh");
    EXPECT_EQ(config.shell_tool_names.count("Shell"), 1u);
}

TEST(PolicyConfigTest, ReportsMissingFile) {
    const auto missing = std::filesystem::temp_directory_path() /
                         "__definitely_missing_bashgate_policy__.json";
    auto result = load_policy_config(missing);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "policy_unreadable");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(PolicyConfigTest, SerializedPolicyParsesBackToSameTables) {
    const auto config = default_policy_config();
    const json document = json::parse(policy_config_to_json(config));
    EXPECT_EQ(document.at("init_script_name"), "init.sh");
    EXPECT_EQ(document.at("allowed_commands").size(), config.allowed_commands.size());

    auto reparsed = parse_policy_config(policy_config_to_json(config));
    ASSERT_FALSE(is_error(reparsed));
    EXPECT_EQ(get_value(reparsed).allowed_commands, config.allowed_commands);
}

}  // namespace
