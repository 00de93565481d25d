#include "cli_parser.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bashgate::app::cli {

    using namespace bashgate::core::errors;
    using bashgate::protocol::GateMode;
    using bashgate::protocol::GateRequest;

    namespace {

    constexpr const char* kUsage =
        "Usage: bashgate hook|check|show-policy [--command \"...\"] [--tool NAME] "
        "[--policy FILE] [--verbose]";

    // Flags as given, before per-mode rules are applied.
    struct RawCliOptions {
        std::optional<std::string> command;
        std::optional<std::string> tool;
        std::optional<std::string> policy_file;
        bool verbose = false;
    };

    } // namespace

    Result<GateRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return GateError{ErrorCategory::Input, "No mode provided.", "missing_mode", kUsage};
        }

        GateRequest req;
        const std::string mode = argv[1];
        if (mode == "hook") {
            req.mode = GateMode::Hook;
        } else if (mode == "check") {
            req.mode = GateMode::Check;
        } else if (mode == "show-policy") {
            req.mode = GateMode::ShowPolicy;
        } else {
            return GateError{ErrorCategory::Input, "Unknown mode: " + mode, "unknown_mode", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Skip program name and mode
            args.push_back(argv[i]);
        }

        // Collect flags without interpreting them.
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--command") {
                if (i + 1 < args.size()) raw.command = args[++i];
                else return GateError{ErrorCategory::Input, "Missing value for --command", "missing_value"};
            } else if (args[i] == "--tool") {
                if (i + 1 < args.size()) raw.tool = args[++i];
                else return GateError{ErrorCategory::Input, "Missing value for --tool", "missing_value"};
            } else if (args[i] == "--policy") {
                if (i + 1 < args.size()) raw.policy_file = args[++i];
                else return GateError{ErrorCategory::Input, "Missing value for --policy", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return GateError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // Each mode accepts only some of the flags.
        req.verbose = raw.verbose;

        if (req.mode == GateMode::Check) {
            if (!raw.command.has_value()) {
                return GateError{ErrorCategory::Input, "check requires --command", "missing_required_flag"};
            }
            req.command = raw.command.value();
        } else if (raw.command.has_value()) {
            return GateError{ErrorCategory::Input, "--command is only valid with check", "conflicting_flags",
                             "In hook mode the command is read from the request on stdin."};
        }

        if (raw.tool.has_value()) {
            if (req.mode != GateMode::Check) {
                return GateError{ErrorCategory::Input, "--tool is only valid with check", "conflicting_flags"};
            }
            if (raw.tool->empty()) {
                return GateError{ErrorCategory::Input, "--tool cannot be empty", "invalid_value"};
            }
            req.tool_name = raw.tool.value();
        }

        if (raw.policy_file) {
            if (raw.policy_file->empty()) {
                return GateError{ErrorCategory::Input, "--policy cannot be empty", "invalid_value"};
            }
            req.policy_file = std::filesystem::path(raw.policy_file.value());
        }

        return req;
    }

} // namespace bashgate::app::cli
