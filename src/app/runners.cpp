#include "app/runners.hpp"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>
#include "core/logging/logger.hpp"
#include "runtime/echo_turn_processor.hpp"
#include "session/mode_adapter.hpp"
#include "session/resume_resolver.hpp"
#include "session/session_lock.hpp"
#include "session/session_store.hpp"
#include "session/transcript_logger.hpp"

namespace waypoint::app {

using core::config::AppConfig;
using core::errors::Error;
using core::errors::ErrorCategory;
using protocol::RunMode;
using protocol::RunRequest;

namespace {

// Everything one run needs, wired to a single store root.
struct Components {
    Components(const std::filesystem::path& store_root, const AppConfig& config,
               RunMode mode)
        : store(store_root, session::StoreOptions{config.sync_writes}),
          locks(store.locks_dir(),
                session::LockOptions{config.lock_staleness_ms,
                                     core::config::system_clock(),
                                     core::config::generate_holder_token(),
                                     config.sync_writes}),
          resolver(store),
          adapter(store, locks, resolver, mode,
                  session::TranscriptOptions{config.sync_writes},
                  config.guard_staleness_ms) {}

    session::SessionStore store;
    session::SessionLock locks;
    session::ResumeResolver resolver;
    session::ModeAdapter adapter;
};

std::string format_utc(const std::int64_t unix_ms) {
    const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

int report(const Error& err, const std::string& context) {
    LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    return exit_code_for(err);
}

session::OpenRequest make_open_request(const RunRequest& request) {
    session::OpenRequest open;
    open.project_path = request.project_path;
    open.policy = request.resume_policy;
    open.session_id = request.resume_session_id;
    open.transcript_log = request.transcript_log;
    return open;
}

int close_session(const Components& components, session::ActiveSession& active) {
    auto closed = components.adapter.close(active);
    if (core::errors::is_error(closed)) {
        return report(core::errors::get_error(closed), "Failed to close session");
    }
    const auto& saved = core::errors::get_value(closed);
    LOG_INFO("Session " + saved.session_id + " saved at revision " +
             std::to_string(saved.revision) + "; transcript: " +
             saved.transcript_path.string());
    return kExitOk;
}

int run_exec(const Components& components, const RunRequest& request,
             const AppConfig& config, std::ostream& out) {
    auto opened = components.adapter.open(make_open_request(request));
    if (core::errors::is_error(opened)) {
        return report(core::errors::get_error(opened), "Failed to open session");
    }
    auto active = core::errors::take_value(opened);

    runtime::EchoTurnProcessor processor(config.history_limit);
    auto turn = components.adapter.run_turn(*active, processor, request.prompt.value());
    if (core::errors::is_error(turn)) {
        const int code = report(core::errors::get_error(turn), "Turn failed");
        // The session stays at its last checkpoint.
        const int closed = close_session(components, *active);
        return code != kExitOk ? code : closed;
    }
    out << core::errors::get_value(turn).reply << "\n";
    return close_session(components, *active);
}

int run_interactive(const Components& components, const RunRequest& request,
                    const AppConfig& config, std::istream& in, std::ostream& out) {
    auto opened = components.adapter.open(make_open_request(request));
    if (core::errors::is_error(opened)) {
        return report(core::errors::get_error(opened), "Failed to open session");
    }
    auto active = core::errors::take_value(opened);
    out << (active->resumed() ? "Resumed session " : "Started session ")
        << active->session().session_id << "\n";

    runtime::EchoTurnProcessor processor(config.history_limit);
    auto handle_turn = [&](const std::string& prompt) -> int {
        auto turn = components.adapter.run_turn(*active, processor, prompt);
        if (core::errors::is_error(turn)) {
            const auto& err = core::errors::get_error(turn);
            if (err.category == ErrorCategory::Input) {
                out << "error: " << err.message << "\n";
                return kExitOk;
            }
            return report(err, "Turn failed");
        }
        out << core::errors::get_value(turn).reply << "\n";
        return kExitOk;
    };

    if (request.prompt.has_value()) {
        const int code = handle_turn(request.prompt.value());
        if (code != kExitOk) {
            return code;
        }
    }

    std::string line;
    while (true) {
        out << "> " << std::flush;
        if (!std::getline(in, line)) {
            break;
        }
        const std::string prompt = trim(line);
        if (prompt.empty()) {
            continue;
        }
        if (prompt == "/exit" || prompt == "/quit") {
            break;
        }
        if (prompt == "/session") {
            const auto& current = active->session();
            out << current.session_id << " revision " << current.revision
                << " transcript " << current.transcript_path.string() << "\n";
            continue;
        }
        const int code = handle_turn(prompt);
        if (code != kExitOk) {
            return code;
        }
    }
    out << "\n";
    return close_session(components, *active);
}

int run_list(const Components& components, const RunRequest& request, std::ostream& out) {
    std::vector<Error> skipped;
    auto listed = components.store.list_for(request.project_path, &skipped);
    if (core::errors::is_error(listed)) {
        return report(core::errors::get_error(listed), "Failed to list sessions");
    }
    for (const auto& warning : skipped) {
        LOG_WARN("Skipping unreadable session: " + warning.message);
    }

    for (const auto& record : core::errors::get_value(listed)) {
        std::string status = "idle";
        auto inspection = components.locks.inspect(record.session_id);
        if (core::errors::is_error(inspection)) {
            status = "unknown";
        } else if (core::errors::get_value(inspection).status == session::LockStatus::Live) {
            status = "live";
        } else if (core::errors::get_value(inspection).status == session::LockStatus::Stale) {
            status = "abandoned";
        }

        std::uint64_t entries = 0;
        auto scan = session::scan_transcript(record.transcript_path);
        if (!core::errors::is_error(scan)) {
            entries = core::errors::get_value(scan).entries.size();
        }
        out << record.session_id << "\t" << format_utc(record.updated_at_ms)
            << "\trev " << record.revision << "\t" << entries << " entries\t"
            << status << "\n";
    }
    return kExitOk;
}

}  // namespace

int exit_code_for(const Error& error) {
    switch (error.category) {
        case ErrorCategory::Input:
            return kExitUsage;
        case ErrorCategory::NotFound:
            return kExitNoSession;
        case ErrorCategory::Busy:
            return kExitBusy;
        case ErrorCategory::Corrupt:
        case ErrorCategory::IOFailure:
        case ErrorCategory::Internal:
        default:
            return kExitFailure;
    }
}

core::errors::Result<AppConfig> load_config(const RunRequest& request,
                                            const core::config::EnvLookup& env) {
    AppConfig config;
    std::optional<std::filesystem::path> file = request.config_file;
    if (!file.has_value()) {
        if (const auto from_env = env("WAYPOINT_CONFIG")) {
            file = std::filesystem::path(from_env.value());
        }
    }
    if (!file.has_value()) {
        const auto store_root =
            core::config::resolve_store_root(request.project_path, request.session_store);
        const auto candidate = store_root / core::config::kConfigFileName;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            file = candidate;
        }
    }

    if (file.has_value()) {
        auto loaded = core::config::load_from_file(file.value(), config);
        if (core::errors::is_error(loaded)) {
            auto err = core::errors::get_error(loaded);
            if (err.category == ErrorCategory::NotFound) {
                err.category = ErrorCategory::Input;
                err.code = "config_not_found";
            }
            return err;
        }
        config = core::errors::get_value(loaded);
    }

    auto with_env = core::config::apply_environment(config, env);
    if (core::errors::is_error(with_env)) {
        return core::errors::get_error(with_env);
    }
    config = core::errors::get_value(with_env);

    if (request.lock_staleness_ms.has_value()) {
        config.lock_staleness_ms = request.lock_staleness_ms.value();
    }
    if (request.verbose) {
        config.log_level = core::logging::LogLevel::DEBUG;
    }
    return config;
}

int run(const RunRequest& request, std::istream& in, std::ostream& out,
        const core::config::EnvLookup& env) {
    auto config_result = load_config(request, env);
    if (core::errors::is_error(config_result)) {
        return report(core::errors::get_error(config_result), "Invalid configuration");
    }
    const auto& config = core::errors::get_value(config_result);
    core::logging::Logger::get().set_min_level(config.log_level);

    const auto store_root =
        core::config::resolve_store_root(request.project_path, request.session_store);
    LOG_DEBUG("Session store: " + store_root.string() + ", lock staleness " +
              std::to_string(config.lock_staleness_ms) + " ms, resume policy " +
              protocol::to_string(request.resume_policy));

    Components components(store_root, config, request.mode);
    switch (request.mode) {
        case RunMode::Exec:
            return run_exec(components, request, config, out);
        case RunMode::Interactive:
            return run_interactive(components, request, config, in, out);
        case RunMode::ListSessions:
            return run_list(components, request, out);
        default:
            return report(Error{ErrorCategory::Internal, "Unknown run mode",
                                "unknown_mode"},
                          "Dispatch failed");
    }
}

}  // namespace waypoint::app
