#include "session/mode_adapter.hpp"

#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace waypoint::session {

using core::errors::Error;
using core::errors::ErrorCategory;
using protocol::EntryKind;
using protocol::ResumePolicy;
using protocol::RunMode;
using protocol::Session;

namespace {

std::string mode_name(const RunMode mode) {
    switch (mode) {
        case RunMode::Interactive:
            return "interactive";
        case RunMode::Exec:
            return "exec";
        case RunMode::ListSessions:
            return "sessions";
        default:
            return "unknown";
    }
}

LockOptions guard_options(LockOptions options, const std::int64_t staleness_ms) {
    options.staleness_ms = staleness_ms;
    return options;
}

// Resumption was requested but the session's files cannot be continued.
Error not_resumable(const std::string& session_id, const Error& cause) {
    return Error{ErrorCategory::NotFound,
                 "Session " + session_id + " cannot be resumed: " + cause.message,
                 "no_resumable_session",
                 "Start a fresh session with --new."};
}

}  // namespace

std::string to_string(const SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Unopened:
            return "unopened";
        case SessionPhase::Resolving:
            return "resolving";
        case SessionPhase::Fresh:
            return "fresh";
        case SessionPhase::Resuming:
            return "resuming";
        case SessionPhase::Active:
            return "active";
        case SessionPhase::Saved:
            return "saved";
        case SessionPhase::Abandoned:
            return "abandoned";
        default:
            return "unknown";
    }
}

ActiveSession::ActiveSession(const SessionLock& locks, Session session, LockHandle lock,
                             TranscriptLogger transcript, const bool resumed)
    : locks_(locks),
      session_(std::move(session)),
      lock_(std::move(lock)),
      transcript_(std::move(transcript)),
      resumed_(resumed) {}

ActiveSession::~ActiveSession() {
    if (phase_ != SessionPhase::Active) {
        return;
    }
    phase_ = SessionPhase::Abandoned;
    LOG_WARN("ModeAdapter: session " + session_.session_id +
             " dropped without close; last checkpoint is revision " +
             std::to_string(session_.revision));
    auto closed = transcript_.close();
    if (core::errors::is_error(closed)) {
        LOG_ERROR(core::errors::get_error(closed).message);
    }
    auto released = locks_.release(lock_);
    if (core::errors::is_error(released)) {
        LOG_ERROR(core::errors::get_error(released).message);
    }
}

ModeAdapter::ModeAdapter(const SessionStore& store, const SessionLock& locks,
                         const ResumeResolver& resolver, const RunMode mode,
                         TranscriptOptions transcript_options,
                         const std::int64_t guard_staleness_ms)
    : store_(store),
      locks_(locks),
      guards_(locks.lock_dir(), guard_options(locks.options(), guard_staleness_ms)),
      resolver_(resolver),
      mode_(mode),
      transcript_options_(std::move(transcript_options)) {}

void ModeAdapter::transition(const std::string& subject, SessionPhase& phase,
                             const SessionPhase next) const {
    LOG_INFO("ModeAdapter: " + subject + " transition " + to_string(phase) + " -> " +
             to_string(next));
    phase = next;
}

core::errors::Result<std::unique_ptr<ActiveSession>> ModeAdapter::open(
    const OpenRequest& request) const {
    if (request.policy == ResumePolicy::ById &&
        (!request.session_id.has_value() || request.session_id->empty())) {
        return Error{ErrorCategory::Input, "Resuming by id requires a session id.",
                     "missing_session_id"};
    }

    auto canonical = SessionStore::canonical_project_path(request.project_path);
    if (core::errors::is_error(canonical)) {
        return core::errors::get_error(canonical);
    }
    const auto project_path = core::errors::get_value(canonical);

    auto guard_result = guards_.acquire(SessionLock::project_key(project_path));
    if (core::errors::is_error(guard_result)) {
        auto err = core::errors::get_error(guard_result);
        if (err.category == ErrorCategory::Busy) {
            err.message = "Another process is opening a session for " +
                          project_path.string() + ": " + err.message;
        }
        return err;
    }
    auto guard = core::errors::get_value(guard_result);

    auto opened = open_guarded(request, project_path);

    auto released = guards_.release(guard);
    if (core::errors::is_error(released)) {
        LOG_WARN("ModeAdapter: unable to release project guard: " +
                 core::errors::get_error(released).message);
    }
    return opened;
}

core::errors::Result<std::unique_ptr<ActiveSession>> ModeAdapter::open_guarded(
    const OpenRequest& request, const std::filesystem::path& project_path) const {
    const std::string subject = "open(" + project_path.string() + ")";
    SessionPhase phase = SessionPhase::Unopened;
    transition(subject, phase, SessionPhase::Resolving);

    std::optional<Session> resumable;
    if (request.policy == ResumePolicy::ById) {
        auto by_id = resolver_.resolve_by_id(request.session_id.value(), project_path);
        if (core::errors::is_error(by_id)) {
            const auto& err = core::errors::get_error(by_id);
            if (err.category == ErrorCategory::Corrupt) {
                return not_resumable(request.session_id.value(), err);
            }
            return err;
        }
        resumable = core::errors::get_value(by_id);
    } else if (request.policy != ResumePolicy::Fresh) {
        auto resolution = resolver_.resolve(project_path);
        if (core::errors::is_error(resolution)) {
            return core::errors::get_error(resolution);
        }
        resumable = core::errors::get_value(resolution).session;
        if (!resumable.has_value() && request.policy == ResumePolicy::Last) {
            return Error{ErrorCategory::NotFound,
                         "No resumable session for " + project_path.string(),
                         "no_resumable_session",
                         "Run without --resume-last to start a fresh session."};
        }
    }

    Session session;
    if (resumable.has_value()) {
        transition(subject, phase, SessionPhase::Resuming);
        session = resumable.value();
    } else {
        transition(subject, phase, SessionPhase::Fresh);
        auto created = store_.create(project_path, &locks_, request.transcript_log);
        if (core::errors::is_error(created)) {
            return core::errors::get_error(created);
        }
        session = core::errors::get_value(created);
    }

    auto lock_result = locks_.acquire(session.session_id);
    if (core::errors::is_error(lock_result)) {
        return core::errors::get_error(lock_result);
    }
    auto lock = core::errors::get_value(lock_result);
    if (lock.reclaimed_from.has_value()) {
        LOG_WARN("ModeAdapter: session " + session.session_id +
                 " was abandoned by pid " + std::to_string(lock.reclaimed_from->pid) +
                 "; reclaimed its lock");
    }

    auto release_on_failure = [this, &lock, &resumable, &session](Error error) -> Error {
        auto released = locks_.release(lock);
        if (core::errors::is_error(released)) {
            LOG_WARN("ModeAdapter: " + core::errors::get_error(released).message);
        }
        if (resumable.has_value() && error.category == ErrorCategory::Corrupt) {
            return not_resumable(session.session_id, error);
        }
        return error;
    };

    // The record may have moved on between resolution and locking.
    auto latest = store_.load(session.session_id);
    if (core::errors::is_error(latest)) {
        return release_on_failure(core::errors::get_error(latest));
    }
    session = core::errors::get_value(latest);

    if (resumable.has_value() && request.transcript_log.has_value()) {
        std::error_code ec;
        const auto requested = std::filesystem::absolute(request.transcript_log.value(), ec);
        if (!ec && requested.lexically_normal() != session.transcript_path.lexically_normal()) {
            LOG_WARN("ModeAdapter: session " + session.session_id +
                     " keeps its transcript at " + session.transcript_path.string() +
                     "; ignoring --transcript-log " + requested.string());
        }
    }

    auto transcript_result = TranscriptLogger::open(
        session.session_id, session.transcript_path, transcript_options_);
    if (core::errors::is_error(transcript_result)) {
        return release_on_failure(core::errors::get_error(transcript_result));
    }

    const bool resumed = resumable.has_value();
    auto active = std::make_unique<ActiveSession>(
        locks_, session, lock, core::errors::take_value(transcript_result), resumed);
    transition(subject, phase, SessionPhase::Active);
    core::logging::Logger::get().set_session_id(session.session_id);

    auto opened_entry = record(
        *active, EntryKind::System,
        std::string(resumed ? "session resumed" : "session started") + " (" +
            mode_name(mode_) + ", " + session.project_path.string() + ")");
    if (core::errors::is_error(opened_entry)) {
        return core::errors::get_error(opened_entry);
    }
    return std::move(active);
}

core::errors::Result<bool> ModeAdapter::require_active(const ActiveSession& active) const {
    if (active.phase_ != SessionPhase::Active) {
        return Error{ErrorCategory::Input,
                     "Session " + active.session_.session_id + " is " +
                         to_string(active.phase_) + ", not active",
                     "session_not_active"};
    }
    return true;
}

core::errors::Result<bool> ModeAdapter::hold_lock(ActiveSession& active) const {
    auto refreshed = locks_.refresh(active.lock_);
    if (!core::errors::is_error(refreshed)) {
        return true;
    }
    const auto err = core::errors::get_error(refreshed);
    if (!active.lock_.held) {
        LOG_ERROR("ModeAdapter: " + err.message + "; abandoning session " +
                  active.session_.session_id + " at revision " +
                  std::to_string(active.session_.revision));
        auto closed = active.transcript_.close();
        if (core::errors::is_error(closed)) {
            LOG_ERROR(core::errors::get_error(closed).message);
        }
        transition("session " + active.session_.session_id, active.phase_,
                   SessionPhase::Abandoned);
    }
    return err;
}

core::errors::Result<protocol::TranscriptEntry> ModeAdapter::record(
    ActiveSession& active, const EntryKind kind, const std::string& payload) const {
    auto ready = require_active(active);
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }
    auto held = hold_lock(active);
    if (core::errors::is_error(held)) {
        return core::errors::get_error(held);
    }
    return active.transcript_.append(kind, payload);
}

core::errors::Result<runtime::TurnOutcome> ModeAdapter::run_turn(
    ActiveSession& active, runtime::TurnProcessor& processor,
    const std::string& prompt) const {
    auto input = record(active, EntryKind::Input, prompt);
    if (core::errors::is_error(input)) {
        return core::errors::get_error(input);
    }

    auto processed = processor.process(active.session_.state_snapshot, prompt);
    if (core::errors::is_error(processed)) {
        const auto& err = core::errors::get_error(processed);
        auto logged = record(active, EntryKind::Error, err.message);
        if (core::errors::is_error(logged)) {
            LOG_ERROR("ModeAdapter: unable to record turn failure: " +
                      core::errors::get_error(logged).message);
        }
        return err;
    }
    const auto& outcome = core::errors::get_value(processed);

    for (const auto& event : outcome.events) {
        auto appended = record(active, event.kind, event.payload);
        if (core::errors::is_error(appended)) {
            return core::errors::get_error(appended);
        }
    }

    auto saved = checkpoint(active, outcome.next_snapshot);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return outcome;
}

core::errors::Result<Session> ModeAdapter::checkpoint(ActiveSession& active,
                                                      const std::string& snapshot) const {
    auto ready = require_active(active);
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }

    auto held = hold_lock(active);
    if (core::errors::is_error(held)) {
        return core::errors::get_error(held);
    }

    auto saved = store_.save(active.session_, snapshot, active.lock_);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    active.session_ = core::errors::get_value(saved);
    return active.session_;
}

core::errors::Result<Session> ModeAdapter::close(
    ActiveSession& active, const std::optional<std::string>& final_snapshot) const {
    if (active.phase_ == SessionPhase::Saved) {
        return active.session_;
    }
    auto ready = require_active(active);
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }

    if (final_snapshot.has_value()) {
        auto saved = checkpoint(active, final_snapshot.value());
        if (core::errors::is_error(saved)) {
            return core::errors::get_error(saved);
        }
    }

    auto closed = active.transcript_.close();
    if (core::errors::is_error(closed)) {
        return core::errors::get_error(closed);
    }
    auto released = locks_.release(active.lock_);
    if (core::errors::is_error(released)) {
        return core::errors::get_error(released);
    }

    transition("session " + active.session_.session_id, active.phase_,
               SessionPhase::Saved);
    return active.session_;
}

}  // namespace waypoint::session
