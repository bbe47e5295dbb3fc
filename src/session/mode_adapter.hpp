#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "core/errors/errors.hpp"
#include "protocol/run_request.hpp"
#include "protocol/session_record.hpp"
#include "runtime/turn_processor.hpp"
#include "session/resume_resolver.hpp"
#include "session/session_lock.hpp"
#include "session/session_store.hpp"
#include "session/transcript_logger.hpp"

namespace waypoint::session {

inline constexpr std::int64_t kDefaultGuardStalenessMs = 30 * 1000;

enum class SessionPhase {
    Unopened,
    Resolving,
    Fresh,
    Resuming,
    Active,
    Saved,
    Abandoned
};

std::string to_string(SessionPhase phase);

struct OpenRequest {
    std::filesystem::path project_path;
    protocol::ResumePolicy policy = protocol::ResumePolicy::Auto;
    std::optional<std::string> session_id;
    std::optional<std::filesystem::path> transcript_log;
};

// A session held by this process: its lock, its open transcript and the
// latest saved record. Dropping it while Active releases the lock without
// saving and marks it Abandoned.
class ActiveSession {
public:
    ActiveSession(const SessionLock& locks, protocol::Session session, LockHandle lock,
                  TranscriptLogger transcript, bool resumed);
    ActiveSession(const ActiveSession&) = delete;
    ActiveSession& operator=(const ActiveSession&) = delete;
    ~ActiveSession();

    const protocol::Session& session() const { return session_; }
    const LockHandle& lock() const { return lock_; }
    const TranscriptLogger& transcript() const { return transcript_; }
    SessionPhase phase() const { return phase_; }
    bool resumed() const { return resumed_; }

private:
    friend class ModeAdapter;

    const SessionLock& locks_;
    protocol::Session session_;
    LockHandle lock_;
    TranscriptLogger transcript_;
    SessionPhase phase_ = SessionPhase::Active;
    bool resumed_ = false;
};

// Shared by the interactive and non-interactive runners to acquire, mutate
// and release a session.
//
// The project guard lives in the same lock directory as the session locks
// but goes stale after `guard_staleness_ms`, so a crash during open blocks
// the project only briefly.
class ModeAdapter {
public:
    ModeAdapter(const SessionStore& store, const SessionLock& locks,
                const ResumeResolver& resolver, protocol::RunMode mode,
                TranscriptOptions transcript_options = {},
                std::int64_t guard_staleness_ms = kDefaultGuardStalenessMs);

    // Resolves or creates a session under a short per-project guard lock,
    // acquires the session lock and opens its transcript.
    core::errors::Result<std::unique_ptr<ActiveSession>> open(
        const OpenRequest& request) const;

    // Appends one entry after confirming the lock is still ours. Losing the
    // lock abandons the session: Busy/lock_lost, nothing written.
    core::errors::Result<protocol::TranscriptEntry> record(
        ActiveSession& active, protocol::EntryKind kind,
        const std::string& payload) const;

    // One turn: input entry, processor events, then a snapshot checkpoint.
    core::errors::Result<runtime::TurnOutcome> run_turn(
        ActiveSession& active, runtime::TurnProcessor& processor,
        const std::string& prompt) const;

    // Refreshes the lock heartbeat, then saves the snapshot.
    core::errors::Result<protocol::Session> checkpoint(ActiveSession& active,
                                                       const std::string& snapshot) const;

    // Saves `final_snapshot` when given, closes the transcript and releases
    // the lock. Closing a Saved session again is a no-op.
    core::errors::Result<protocol::Session> close(
        ActiveSession& active,
        const std::optional<std::string>& final_snapshot = std::nullopt) const;

    protocol::RunMode mode() const { return mode_; }

private:
    core::errors::Result<std::unique_ptr<ActiveSession>> open_guarded(
        const OpenRequest& request, const std::filesystem::path& project_path) const;
    core::errors::Result<bool> require_active(const ActiveSession& active) const;
    core::errors::Result<bool> hold_lock(ActiveSession& active) const;
    void transition(const std::string& subject, SessionPhase& phase,
                    SessionPhase next) const;

    const SessionStore& store_;
    const SessionLock& locks_;
    SessionLock guards_;
    const ResumeResolver& resolver_;
    protocol::RunMode mode_;
    TranscriptOptions transcript_options_;
};

}  // namespace waypoint::session
