#include "protocol/hook_codec.hpp"

#include <nlohmann/json.hpp>

namespace bashgate::protocol {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;

core::errors::Result<HookRequest> parse_hook_request(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        return GateError{ErrorCategory::Input,
                         std::string("Hook request is not valid JSON: ") + e.what(),
                         "invalid_json"};
    }

    if (!document.is_object()) {
        return GateError{ErrorCategory::Input,
                         "Hook request must be a JSON object.", "invalid_request"};
    }

    const auto tool_name = document.find("tool_name");
    if (tool_name == document.end() || !tool_name->is_string()) {
        return GateError{ErrorCategory::Input,
                         "Hook request has no string 'tool_name' field.",
                         "invalid_request"};
    }

    HookRequest request;
    request.tool_name = tool_name->get<std::string>();

    // A malformed tool_input is left for the engine to judge, so tools outside
    // its jurisdiction still pass through.
    const auto tool_input = document.find("tool_input");
    if (tool_input != document.end() && tool_input->is_object()) {
        const auto command = tool_input->find("command");
        if (command != tool_input->end() && command->is_string()) {
            request.command = command->get<std::string>();
        }
    }

    return request;
}

std::string to_json(const Decision& decision) {
    json document;
    document["decision"] = to_string(decision.verdict);
    document["reason"] = decision.reason;
    // Reasons quote raw command text, which need not be valid UTF-8.
    return document.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace bashgate::protocol
