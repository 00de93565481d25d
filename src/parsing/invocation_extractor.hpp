#pragma once

#include <string>
#include <vector>
#include "core/errors/gate_errors.hpp"

namespace bashgate::parsing {

// One program invocation inside a sub-command.
struct Invocation {
    // First token after environment assignments, as written ("./init.sh").
    std::string program_token;
    // Final path segment of program_token ("init.sh").
    std::string program;
    std::vector<std::string> arguments;
};

// Whitespace tokenizer with minimal POSIX quoting: quotes are removed,
// backslash escapes are honored and a # starting a token ends the line.
// An unterminated quote or $'...' quoting is an error.
core::errors::Result<std::vector<std::string>> tokenize(const std::string& sub_command);

bool is_env_assignment(const std::string& token);

std::string base_name(const std::string& token);

core::errors::Result<Invocation> extract_invocation(const std::string& sub_command);

// Program base names of every sub-command of raw_command, in order.
// Sub-commands without a program contribute nothing.
std::vector<std::string> extract_commands(const std::string& raw_command);

}  // namespace bashgate::parsing
