#include "policy/chmod_validator.hpp"

#include <cstddef>
#include "parsing/invocation_extractor.hpp"

namespace bashgate::policy {

using protocol::Decision;

namespace {

bool is_recursive_flag(const std::string& token) {
    if (token == "--recursive") {
        return true;
    }
    // Short clusters such as -R or -vR
    return token.size() > 1 && token[0] == '-' && token[1] != '-' &&
           token.find('R') != std::string::npos;
}

bool looks_like_revoke_mode(const std::string& token) {
    if (token.size() < 2 || token[0] != '-') {
        return false;
    }
    return token.find_first_not_of("rwxXstugoa", 1) == std::string::npos;
}

}  // namespace

bool is_execute_only_mode(const std::string& mode) {
    const auto op = mode.find_first_not_of("ugoa");
    if (op == std::string::npos) {
        return false;
    }
    return mode.compare(op, std::string::npos, "+x") == 0;
}

Decision validate_chmod(const std::vector<std::string>& arguments) {
    const std::string* mode = nullptr;
    std::size_t targets = 0;

    for (const auto& token : arguments) {
        if (is_recursive_flag(token)) {
            return Decision::block("recursive chmod not allowed");
        }
        if (!token.empty() && token[0] == '-') {
            if (looks_like_revoke_mode(token)) {
                return Decision::block("disallowed chmod mode '" + token +
                                       "': only +x is allowed");
            }
            return Decision::block("unsupported chmod option '" + token + "'");
        }

        if (mode == nullptr) {
            if (!is_execute_only_mode(token)) {
                return Decision::block("disallowed chmod mode '" + token +
                                       "': only +x is allowed");
            }
            mode = &token;
            continue;
        }

        if (!token.empty() && (token[0] == '+' || token[0] == '=')) {
            return Decision::block("only one chmod mode is allowed, got '" +
                                   *mode + "' and '" + token + "'");
        }
        ++targets;
    }

    if (mode == nullptr) {
        return Decision::block("missing chmod mode");
    }
    if (targets == 0) {
        return Decision::block("missing target file");
    }
    return Decision::allow();
}

Decision validate_chmod_command(const std::string& sub_command) {
    auto extracted = parsing::extract_invocation(sub_command);
    if (core::errors::is_error(extracted)) {
        return Decision::block(core::errors::get_error(extracted).message);
    }

    const auto& invocation = core::errors::get_value(extracted);
    if (invocation.program != "chmod") {
        return Decision::block("not a chmod command: " + invocation.program);
    }
    return validate_chmod(invocation.arguments);
}

}  // namespace bashgate::policy
