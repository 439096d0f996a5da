#pragma once
#include "core/errors/flow_errors.hpp"
#include "protocol/replay_request.hpp"

namespace chatflow::app::cli {
    chatflow::core::errors::Result<chatflow::protocol::ReplayRequest> parse_and_validate(int argc, char* argv[]);
}
