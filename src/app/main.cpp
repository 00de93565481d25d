#include <iostream>
#include <iterator>
#include <string>
#include <utility>
#include "app/cli_parser.hpp"
#include "core/config/policy_config.hpp"
#include "core/errors/gate_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/hook_decision_engine.hpp"
#include "protocol/hook_codec.hpp"
#include "protocol/hook_contract.hpp"

namespace {

using bashgate::protocol::Decision;

void emit(const Decision& decision) {
    std::cout << bashgate::protocol::to_json(decision) << std::endl;
}

void log_decision(const std::string& what, const Decision& decision) {
    if (decision.allowed()) {
        LOG_INFO("Allowed " + what);
    } else {
        LOG_WARN("Blocked " + what + ": " + decision.reason);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    bashgate::core::logging::Logger::get().set_context("bashgate");

    auto parsed = bashgate::app::cli::parse_and_validate(argc, argv);
    if (bashgate::core::errors::is_error(parsed)) {
        const auto& err = bashgate::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_ERROR("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = bashgate::core::errors::get_value(parsed);
    if (req.verbose) {
        bashgate::core::logging::Logger::get().set_min_level(
            bashgate::core::logging::LogLevel::DEBUG);
    }

    // The policy is loaded once and never changed afterwards.
    bashgate::core::config::PolicyConfig config =
        bashgate::core::config::default_policy_config();
    if (req.policy_file) {
        auto loaded = bashgate::core::config::load_policy_config(*req.policy_file);
        if (bashgate::core::errors::is_error(loaded)) {
            const auto& err = bashgate::core::errors::get_error(loaded);
            LOG_ERROR("Policy error [" + err.code + "]: " + err.message);
            if (req.mode == bashgate::protocol::GateMode::Hook) {
                emit(Decision::block("policy configuration unavailable: " + err.message));
            }
            return 3;
        }
        config = bashgate::core::errors::get_value(loaded);
        LOG_INFO("Loaded policy from " + req.policy_file->string());
    }

    if (req.mode == bashgate::protocol::GateMode::ShowPolicy) {
        std::cout << bashgate::core::config::policy_config_to_json(config) << std::endl;
        return 0;
    }

    const bashgate::policy::HookDecisionEngine engine(std::move(config));

    if (req.mode == bashgate::protocol::GateMode::Check) {
        bashgate::protocol::HookRequest request{req.tool_name, req.command};
        const Decision decision = engine.decide(request);
        log_decision("'" + req.command.value_or("") + "'", decision);
        emit(decision);
        return decision.allowed() ? 0 : 1;
    }

    const std::string input{std::istreambuf_iterator<char>(std::cin),
                            std::istreambuf_iterator<char>()};
    auto request = bashgate::protocol::parse_hook_request(input);
    if (bashgate::core::errors::is_error(request)) {
        const auto& err = bashgate::core::errors::get_error(request);
        LOG_WARN("Malformed hook request [" + err.code + "]: " + err.message);
        emit(Decision::block("malformed hook request: " + err.message));
        return 0;
    }

    const auto& hook_request = bashgate::core::errors::get_value(request);
    const Decision decision = engine.decide(hook_request);
    log_decision(hook_request.tool_name + " request", decision);
    emit(decision);
    return 0;
}
