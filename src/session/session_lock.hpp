#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/config/clock.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/errors.hpp"

namespace waypoint::session {

// Contents of a lock file: who holds it and when it last proved liveness.
struct LockRecord {
    std::string key;
    std::string holder_token;
    std::int64_t pid = 0;
    std::int64_t acquired_at_ms = 0;
    std::int64_t heartbeat_ms = 0;
};

// Exclusive access to one key, as returned by SessionLock::acquire.
struct LockHandle {
    std::string key;
    std::string holder_token;
    std::filesystem::path path;
    std::int64_t acquired_at_ms = 0;
    std::int64_t heartbeat_ms = 0;
    bool held = false;
    // Set when the lock was taken over from a holder presumed dead.
    std::optional<LockRecord> reclaimed_from;
};

enum class LockStatus {
    Free,
    Live,
    Stale
};

struct LockInspection {
    LockStatus status = LockStatus::Free;
    std::optional<LockRecord> record;
    std::int64_t age_ms = 0;
};

struct LockOptions {
    std::int64_t staleness_ms = 15 * 60 * 1000;
    core::config::Clock clock = core::config::system_clock();
    std::string holder_token = core::config::generate_holder_token();
    bool sync_writes = true;
};

// Advisory cross-process lock built on lock files under `lock_dir`.
//
// A lock file is published with link(), so it either exists complete or not
// at all. Holders refresh a heartbeat; a lock whose heartbeat is older than
// the staleness threshold belongs to a dead holder and may be reclaimed.
// Every instance carries its own holder token, so one process can host
// several independent holders.
class SessionLock {
public:
    explicit SessionLock(std::filesystem::path lock_dir, LockOptions options = {});

    // Non-blocking. Busy when a live holder owns the key.
    core::errors::Result<LockHandle> acquire(const std::string& key) const;

    // Republishes the lock with a new heartbeat without ever replacing a
    // successor's file. Busy/lock_lost when another holder took over.
    core::errors::Result<std::int64_t> refresh(LockHandle& handle) const;

    // Idempotent. Returns true only when this call removed the lock file.
    core::errors::Result<bool> release(LockHandle& handle) const;

    core::errors::Result<LockInspection> inspect(const std::string& key) const;

    core::errors::Result<bool> is_live(const std::string& key) const;

    const LockOptions& options() const { return options_; }
    const std::string& holder_token() const { return options_.holder_token; }
    std::int64_t staleness_ms() const { return options_.staleness_ms; }
    const std::filesystem::path& lock_dir() const { return lock_dir_; }
    std::filesystem::path lock_path(const std::string& key) const;

    // Key used to serialize session selection for one project directory.
    static std::string project_key(const std::filesystem::path& project_path);

private:
    enum class ReclaimOutcome {
        Reclaimed,
        Vanished,
        LostRace
    };

    core::errors::Result<ReclaimOutcome> reclaim(
        const std::filesystem::path& path,
        const std::string& observed_content) const;
    // Renames the lock file to `aside` and decodes what was moved.
    // NotFound when no lock file was published.
    core::errors::Result<std::optional<LockRecord>> take_aside(
        const std::filesystem::path& path,
        const std::filesystem::path& aside) const;
    LockInspection classify(const std::optional<LockRecord>& record,
                            std::int64_t reference_ms) const;
    static core::errors::Result<bool> validate_key(const std::string& key);

    std::filesystem::path lock_dir_;
    LockOptions options_;
};

std::string encode_lock_record(const LockRecord& record);
std::optional<LockRecord> decode_lock_record(const std::string& text);

}  // namespace waypoint::session
