#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace waypoint::protocol {

    enum class RunMode {
        Interactive,
        Exec,
        ListSessions
    };

    // How a runner picks the session it works on.
    enum class ResumePolicy {
        Auto,   // Resume the latest session for the project, else create one
        Fresh,  // Always create a new session
        Last,   // Resume the latest session; fail if there is none
        ById    // Resume the session named by resume_session_id
    };

    // Validated user input required to start a runner
    struct RunRequest {
        RunMode mode = RunMode::Interactive;
        std::optional<std::string> prompt;
        std::filesystem::path project_path = std::filesystem::current_path();
        std::optional<std::filesystem::path> session_store;
        std::optional<std::filesystem::path> transcript_log;
        std::optional<std::filesystem::path> config_file;
        ResumePolicy resume_policy = ResumePolicy::Auto;
        std::optional<std::string> resume_session_id;
        std::optional<std::int64_t> lock_staleness_ms;
        bool verbose = false;
    };

    inline std::string to_string(const ResumePolicy policy) {
        switch (policy) {
            case ResumePolicy::Auto:  return "auto";
            case ResumePolicy::Fresh: return "fresh";
            case ResumePolicy::Last:  return "last";
            case ResumePolicy::ById:  return "by_id";
            default: return "unknown";
        }
    }

} // namespace waypoint::protocol
