#pragma once

#include <iosfwd>
#include "core/config/app_config.hpp"
#include "core/errors/errors.hpp"
#include "protocol/run_request.hpp"

namespace waypoint::app {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitNoSession = 3;
inline constexpr int kExitBusy = 4;

int exit_code_for(const core::errors::Error& error);

// Defaults, then the config file, then the environment, then CLI flags.
core::errors::Result<core::config::AppConfig> load_config(
    const protocol::RunRequest& request, const core::config::EnvLookup& env);

// Runs the request to completion and returns the process exit code. Run
// output goes to `out`; interactive input is read from `in`.
int run(const protocol::RunRequest& request, std::istream& in, std::ostream& out,
        const core::config::EnvLookup& env = core::config::process_environment());

}  // namespace waypoint::app
