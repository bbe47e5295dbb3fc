#include <iostream>
#include "app/cli_parser.hpp"
#include "app/runners.hpp"
#include "core/errors/errors.hpp"
#include "core/logging/logger.hpp"

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = waypoint::app::cli::parse_and_validate(argc, argv);
    if (waypoint::core::errors::is_error(parsed)) {
        const auto& err = waypoint::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return waypoint::app::kExitUsage;
    }

    // 2. Hand the validated request to the runner for its mode
    const auto& req = waypoint::core::errors::get_value(parsed);
    return waypoint::app::run(req, std::cin, std::cout);
}
