#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace waypoint::app::cli {

    using namespace waypoint::core::errors;
    using waypoint::protocol::ResumePolicy;
    using waypoint::protocol::RunMode;
    using waypoint::protocol::RunRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::vector<std::string> positionals;
        std::optional<std::string> cwd;
        std::optional<std::string> session_store;
        std::optional<std::string> transcript_log;
        std::optional<std::string> config_file;
        std::optional<std::string> resume_id;
        std::optional<std::string> lock_staleness_ms;
        bool fresh = false;
        bool resume_last = false;
        bool verbose = false;
    };

    std::string usage() {
        return "Usage: waypoint [PROMPT] | waypoint exec PROMPT | waypoint sessions "
               "[--cwd DIR] [--session-store DIR] [--transcript-log PATH] [--new | "
               "--resume-last | --resume ID] [--lock-staleness-ms N] [--config PATH] "
               "[--verbose]";
    }

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        RunRequest req;
        int first = 1;
        if (argc >= 2) {
            const std::string command = argv[1];
            if (command == "exec") {
                req.mode = RunMode::Exec;
                first = 2;
            } else if (command == "sessions") {
                req.mode = RunMode::ListSessions;
                first = 2;
            }
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = first; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto read_value = [&args](size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) return false;
            slot = args[++i];
            return true;
        };
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--cwd") {
                if (!read_value(i, raw.cwd)) return Error{ErrorCategory::Input, "Missing value for --cwd", "missing_value"};
            } else if (arg == "--session-store") {
                if (!read_value(i, raw.session_store)) return Error{ErrorCategory::Input, "Missing value for --session-store", "missing_value"};
            } else if (arg == "--transcript-log") {
                if (!read_value(i, raw.transcript_log)) return Error{ErrorCategory::Input, "Missing value for --transcript-log", "missing_value"};
            } else if (arg == "--config") {
                if (!read_value(i, raw.config_file)) return Error{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (arg == "--resume") {
                if (!read_value(i, raw.resume_id)) return Error{ErrorCategory::Input, "Missing value for --resume", "missing_value"};
            } else if (arg == "--lock-staleness-ms") {
                if (!read_value(i, raw.lock_staleness_ms)) return Error{ErrorCategory::Input, "Missing value for --lock-staleness-ms", "missing_value"};
            } else if (arg == "--new") {
                raw.fresh = true;
            } else if (arg == "--resume-last") {
                raw.resume_last = true;
            } else if (arg == "--verbose") {
                raw.verbose = true;
            } else if (arg.size() > 1 && arg[0] == '-') {
                return Error{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument", usage()};
            } else {
                raw.positionals.push_back(arg);
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;

        if (raw.positionals.size() > 1) {
            return Error{ErrorCategory::Input, "Unexpected argument: " + raw.positionals[1], "unexpected_argument", "Quote the prompt to pass it as one argument."};
        }
        if (!raw.positionals.empty()) {
            if (req.mode == RunMode::ListSessions) {
                return Error{ErrorCategory::Input, "The sessions command takes no prompt", "unexpected_argument"};
            }
            req.prompt = raw.positionals.front();
        }
        if (req.mode == RunMode::Exec && !req.prompt.has_value()) {
            return Error{ErrorCategory::Input, "exec requires a prompt", "missing_prompt", usage()};
        }

        // Resume policy flags are mutually exclusive
        const int policy_flags = (raw.fresh ? 1 : 0) + (raw.resume_last ? 1 : 0) + (raw.resume_id ? 1 : 0);
        if (policy_flags > 1) {
            return Error{ErrorCategory::Input, "--new, --resume-last and --resume cannot be combined", "conflicting_flags"};
        }
        if (raw.fresh) req.resume_policy = ResumePolicy::Fresh;
        if (raw.resume_last) req.resume_policy = ResumePolicy::Last;
        if (raw.resume_id) {
            if (raw.resume_id->empty()) {
                return Error{ErrorCategory::Input, "--resume needs a session id", "missing_value"};
            }
            req.resume_policy = ResumePolicy::ById;
            req.resume_session_id = raw.resume_id.value();
        }

        // Exception-free integer parsing
        if (raw.lock_staleness_ms) {
            std::int64_t staleness = 0;
            const char* begin = raw.lock_staleness_ms->data();
            const char* end = raw.lock_staleness_ms->data() + raw.lock_staleness_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, staleness);
            if (ec != std::errc() || ptr != end) {
                return Error{ErrorCategory::Input, "Invalid number for --lock-staleness-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (staleness <= 0) {
                return Error{ErrorCategory::Input, "--lock-staleness-ms out of bounds", "bounds_error", "Must be a positive number of milliseconds."};
            }
            req.lock_staleness_ms = staleness;
        }

        if (raw.session_store) req.session_store = std::filesystem::path(raw.session_store.value());
        if (raw.transcript_log) req.transcript_log = std::filesystem::path(raw.transcript_log.value());
        if (raw.config_file) req.config_file = std::filesystem::path(raw.config_file.value());

        // Path validation
        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return Error{ErrorCategory::Input, "Project directory does not exist or is not a directory", "invalid_path"};
            }

            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return Error{ErrorCategory::Input, "Project directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return Error{ErrorCategory::Input, "Failed to canonicalize project directory", "invalid_path"};
            }
            req.project_path = std::move(canonical_path);
        }

        return req;
    }

} // namespace waypoint::app::cli
