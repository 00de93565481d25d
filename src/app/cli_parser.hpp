#pragma once
#include "protocol/gate_request.hpp"
#include "core/errors/gate_errors.hpp"

namespace bashgate::app::cli {
    bashgate::core::errors::Result<bashgate::protocol::GateRequest> parse_and_validate(int argc, char* argv[]);
}
