#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/clock.hpp"
#include "core/errors/errors.hpp"
#include "protocol/session_record.hpp"
#include "session/session_lock.hpp"

namespace waypoint::session {

struct StoreOptions {
    bool sync_writes = true;
    core::config::Clock clock = core::config::system_clock();
};

// Durable session records under `root`:
//
//   <root>/sessions/<session_id>/session.json
//   <root>/sessions/<session_id>/transcript.jsonl   (default transcript)
//   <root>/locks/<key>.lock                         (owned by SessionLock)
//
// Every record write is a temp file + rename, so a crash leaves either the
// previous record or the new one.
class SessionStore {
public:
    explicit SessionStore(std::filesystem::path root, StoreOptions options = {});

    // With `live_guard` set, fails Busy/session_already_locked while another
    // session for the same project holds a live lock.
    core::errors::Result<protocol::Session> create(
        const std::filesystem::path& project_path,
        const SessionLock* live_guard = nullptr,
        const std::optional<std::filesystem::path>& transcript_path =
            std::nullopt) const;

    core::errors::Result<protocol::Session> load(const std::string& session_id) const;

    // Replaces the snapshot wholesale and advances updated_at_ms. `lock` must
    // be held on the session id, and `session` must be the latest revision.
    core::errors::Result<protocol::Session> save(
        const protocol::Session& session, const std::string& new_snapshot,
        const LockHandle& lock) const;

    // Valid sessions for the project, most recently updated first. Records
    // that fail validation are reported through `skipped`.
    core::errors::Result<std::vector<protocol::Session>> list_for(
        const std::filesystem::path& project_path,
        std::vector<core::errors::Error>* skipped = nullptr) const;

    core::errors::Result<std::vector<std::string>> list_ids() const;

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path sessions_dir() const { return root_ / "sessions"; }
    std::filesystem::path locks_dir() const { return root_ / "locks"; }
    std::filesystem::path session_dir(const std::string& session_id) const;
    std::filesystem::path record_path(const std::string& session_id) const;
    std::filesystem::path default_transcript_path(const std::string& session_id) const;

    static core::errors::Result<std::filesystem::path> canonical_project_path(
        const std::filesystem::path& project_path);

private:
    core::errors::Result<std::filesystem::path> write_record(
        const protocol::Session& session) const;
    static core::errors::Result<bool> validate_session_id(const std::string& session_id);

    std::filesystem::path root_;
    StoreOptions options_;
};

core::errors::Result<std::string> encode_session_record(const protocol::Session& session);

// Corrupt unless the record parses, carries every field, has a supported
// format and a matching checksum, and names `expected_id`.
core::errors::Result<protocol::Session> decode_session_record(
    const std::string& text, const std::string& expected_id);

}  // namespace waypoint::session
