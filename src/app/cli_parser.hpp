#pragma once
#include <string>
#include "protocol/run_request.hpp"
#include "core/errors/errors.hpp"

namespace waypoint::app::cli {
    std::string usage();
    waypoint::core::errors::Result<waypoint::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);
}
