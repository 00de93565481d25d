#include "policy/init_script_validator.hpp"

#include "parsing/command_splitter.hpp"

namespace bashgate::policy {

using protocol::Decision;

bool is_interpreted_init_script(const parsing::Invocation& invocation,
                                const core::config::PolicyConfig& config) {
    if (config.script_interpreters.count(invocation.program) == 0) {
        return false;
    }
    for (const auto& argument : invocation.arguments) {
        if (parsing::base_name(argument) == config.init_script_name) {
            return true;
        }
    }
    return false;
}

Decision validate_init_script(const parsing::Invocation& invocation,
                              const core::config::PolicyConfig& config) {
    const std::string& script = config.init_script_name;

    if (is_interpreted_init_script(invocation, config)) {
        return Decision::block(script +
                               " must be executed directly, not via an interpreter");
    }
    if (invocation.program != script) {
        return Decision::block("script not " + script + ": '" +
                               invocation.program_token + "'");
    }
    if (invocation.program_token.find('/') == std::string::npos) {
        return Decision::block(script + " must be executed via its path, e.g. ./" +
                               script);
    }
    return Decision::allow();
}

Decision validate_init_script(const std::string& command,
                              const core::config::PolicyConfig& config) {
    const auto sub_commands = parsing::split_command(command);
    if (sub_commands.empty()) {
        return Decision::block("no command found");
    }

    for (const auto& sub_command : sub_commands) {
        auto extracted = parsing::extract_invocation(sub_command);
        if (core::errors::is_error(extracted)) {
            return Decision::block(core::errors::get_error(extracted).message);
        }
        Decision decision =
            validate_init_script(core::errors::get_value(extracted), config);
        if (!decision.allowed()) {
            return decision;
        }
    }
    return Decision::allow();
}

}  // namespace bashgate::policy
