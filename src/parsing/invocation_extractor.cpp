#include "parsing/invocation_extractor.hpp"

#include <cctype>
#include <cstddef>
#include <utility>
#include "parsing/command_splitter.hpp"

namespace bashgate::parsing {

using core::errors::ErrorCategory;
using core::errors::GateError;

core::errors::Result<std::vector<std::string>> tokenize(const std::string& sub_command) {
    std::vector<std::string> tokens;
    std::string current;
    // Distinguishes an empty quoted token ('') from no token at all.
    bool in_token = false;
    bool in_single = false;
    bool in_double = false;

    const std::size_t n = sub_command.size();
    for (std::size_t i = 0; i < n; ++i) {
        const char c = sub_command[i];

        if (in_single) {
            if (c == '\'') {
                in_single = false;
            } else {
                current.push_back(c);
            }
            continue;
        }

        if (in_double) {
            if (c == '"') {
                in_double = false;
            } else if (c == '\\' && i + 1 < n &&
                       (sub_command[i + 1] == '"' || sub_command[i + 1] == '\\' ||
                        sub_command[i + 1] == '$' || sub_command[i + 1] == '`')) {
                current.push_back(sub_command[++i]);
            } else {
                current.push_back(c);
            }
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_token) {
                tokens.push_back(std::move(current));
                current.clear();
                in_token = false;
            }
            continue;
        }

        if (!in_token && c == '#') {
            while (i + 1 < n && sub_command[i + 1] != '\n') {
                ++i;
            }
            continue;
        }
        if (c == '$' && i + 1 < n && sub_command[i + 1] == '\'') {
            // Escape sequences in $'...' would have to be decoded exactly as
            // bash does before any token could be trusted.
            return GateError{ErrorCategory::Parse,
                             "ANSI-C quoting ($'...') is not supported: " + sub_command,
                             "unparseable_command"};
        }

        in_token = true;
        if (c == '\'') {
            in_single = true;
        } else if (c == '"') {
            in_double = true;
        } else if (c == '\\') {
            if (i + 1 >= n) {
                return GateError{ErrorCategory::Parse,
                                 "Command ends with a dangling escape: " + sub_command,
                                 "unparseable_command"};
            }
            current.push_back(sub_command[++i]);
        } else {
            current.push_back(c);
        }
    }

    if (in_single || in_double) {
        return GateError{ErrorCategory::Parse,
                         "Command has an unterminated quote: " + sub_command,
                         "unparseable_command"};
    }
    if (in_token) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

bool is_env_assignment(const std::string& token) {
    const auto equals = token.find('=');
    if (equals == std::string::npos || equals == 0) {
        return false;
    }
    const unsigned char first = static_cast<unsigned char>(token[0]);
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (std::size_t i = 1; i < equals; ++i) {
        const unsigned char c = static_cast<unsigned char>(token[i]);
        if (!std::isalnum(c) && c != '_') {
            return false;
        }
    }
    return true;
}

std::string base_name(const std::string& token) {
    const auto slash = token.find_last_of('/');
    if (slash == std::string::npos) {
        return token;
    }
    return token.substr(slash + 1);
}

core::errors::Result<Invocation> extract_invocation(const std::string& sub_command) {
    auto tokenized = tokenize(sub_command);
    if (core::errors::is_error(tokenized)) {
        return core::errors::get_error(tokenized);
    }
    const auto& tokens = core::errors::get_value(tokenized);

    std::size_t index = 0;
    while (index < tokens.size() && is_env_assignment(tokens[index])) {
        ++index;
    }
    if (index == tokens.size()) {
        return GateError{ErrorCategory::Parse, "no command found", "no_command"};
    }

    Invocation invocation;
    invocation.program_token = tokens[index];
    invocation.program = base_name(invocation.program_token);
    if (invocation.program.empty()) {
        return GateError{ErrorCategory::Parse,
                         "no command found in '" + invocation.program_token + "'",
                         "no_command"};
    }
    invocation.arguments.assign(tokens.begin() + static_cast<std::ptrdiff_t>(index) + 1,
                                tokens.end());
    return invocation;
}

std::vector<std::string> extract_commands(const std::string& raw_command) {
    std::vector<std::string> programs;
    for (const auto& sub_command : split_command(raw_command)) {
        auto invocation = extract_invocation(sub_command);
        if (core::errors::is_error(invocation)) {
            continue;
        }
        programs.push_back(core::errors::get_value(invocation).program);
    }
    return programs;
}

}  // namespace bashgate::parsing
