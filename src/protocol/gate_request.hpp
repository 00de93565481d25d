#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace bashgate::protocol {

    enum class GateMode {
        Hook,        // Decide a JSON request read from stdin
        Check,       // Decide a single command given on the command line
        ShowPolicy   // Print the effective policy
    };

    // Validated command-line input for one bashgate invocation
    struct GateRequest {
        GateMode mode = GateMode::Hook;
        std::optional<std::string> command;
        std::string tool_name = "Bash";
        std::optional<std::filesystem::path> policy_file;
        bool verbose = false;
    };

} // namespace bashgate::protocol
