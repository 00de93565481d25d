#pragma once
#include <optional>
#include <string>
#include <utility>

namespace bashgate::protocol {

    // What the agent harness asks about: one tool invocation.
    struct HookRequest {
        std::string tool_name;
        // Absent when tool_input has no string "command" field.
        std::optional<std::string> command;
    };

    enum class Verdict {
        Allow,
        Block
    };

    // Block decisions always carry a reason. Allow decisions usually do not.
    struct Decision {
        Verdict verdict = Verdict::Allow;
        std::string reason;

        bool allowed() const { return verdict == Verdict::Allow; }

        static Decision allow() { return Decision{Verdict::Allow, ""}; }
        static Decision block(std::string reason) {
            return Decision{Verdict::Block, std::move(reason)};
        }
    };

    inline bool operator==(const Decision& lhs, const Decision& rhs) {
        return lhs.verdict == rhs.verdict && lhs.reason == rhs.reason;
    }

    inline std::string to_string(const Verdict verdict) {
        switch (verdict) {
            case Verdict::Allow:
                return "allow";
            case Verdict::Block:
                return "block";
            default:
                return "block";
        }
    }

} // namespace bashgate::protocol
