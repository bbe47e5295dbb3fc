#include "session/session_lock.hpp"

#include <cerrno>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/encoding/checksum.hpp"
#include "core/fs/atomic_file.hpp"
#include "core/logging/logger.hpp"

namespace waypoint::session {

using core::errors::Error;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr int kMaxAcquireAttempts = 8;

std::optional<std::int64_t> file_mtime_ms(const std::filesystem::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000 +
           static_cast<std::int64_t>(st.st_mtim.tv_nsec / 1000000);
}

std::string describe_holder(const LockInspection& inspection) {
    if (!inspection.record.has_value()) {
        return "an unreadable lock file";
    }
    const auto& record = inspection.record.value();
    return "pid " + std::to_string(record.pid) + " (" + record.holder_token +
           "), last heartbeat " + std::to_string(inspection.age_ms) + " ms ago";
}

std::filesystem::path aside_path(const std::filesystem::path& path,
                                 const std::string& tag) {
    return path.parent_path() /
           (path.filename().string() + tag + core::config::random_hex(8));
}

// Puts a lock file that was moved aside back in place.
void restore_lock(const std::filesystem::path& aside, const std::filesystem::path& path) {
    if (::link(aside.c_str(), path.c_str()) != 0) {
        LOG_WARN("SessionLock: could not restore lock " + path.string() + " (" +
                 core::fs::errno_message(errno) + ")");
    }
    static_cast<void>(::unlink(aside.c_str()));
}

Error lock_lost(const std::string& key) {
    return Error{ErrorCategory::Busy,
                 "Lock '" + key + "' was taken over by another holder", "lock_lost",
                 "The lock went stale and another process reclaimed it."};
}

}  // namespace

std::string encode_lock_record(const LockRecord& record) {
    json doc;
    doc["key"] = record.key;
    doc["holder_token"] = record.holder_token;
    doc["pid"] = record.pid;
    doc["acquired_at_ms"] = record.acquired_at_ms;
    doc["heartbeat_ms"] = record.heartbeat_ms;
    return doc.dump() + "\n";
}

std::optional<LockRecord> decode_lock_record(const std::string& text) {
    try {
        const auto doc = json::parse(text);
        LockRecord record;
        record.key = doc.at("key").get<std::string>();
        record.holder_token = doc.at("holder_token").get<std::string>();
        record.pid = doc.at("pid").get<std::int64_t>();
        record.acquired_at_ms = doc.at("acquired_at_ms").get<std::int64_t>();
        record.heartbeat_ms = doc.at("heartbeat_ms").get<std::int64_t>();
        return record;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

SessionLock::SessionLock(std::filesystem::path lock_dir, LockOptions options)
    : lock_dir_(std::move(lock_dir)), options_(std::move(options)) {}

std::filesystem::path SessionLock::lock_path(const std::string& key) const {
    return lock_dir_ / (key + ".lock");
}

std::string SessionLock::project_key(const std::filesystem::path& project_path) {
    return "project-" +
           core::encoding::checksum_hex(project_path.lexically_normal().string());
}

core::errors::Result<bool> SessionLock::validate_key(const std::string& key) {
    if (key.empty() || key.front() == '.') {
        return Error{ErrorCategory::Input, "Invalid lock key: '" + key + "'",
                     "invalid_lock_key"};
    }
    for (const char c : key) {
        const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                             (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                             c == '.';
        if (!allowed) {
            return Error{ErrorCategory::Input,
                         "Invalid lock key: '" + key + "'", "invalid_lock_key"};
        }
    }
    return true;
}

LockInspection SessionLock::classify(const std::optional<LockRecord>& record,
                                     const std::int64_t reference_ms) const {
    LockInspection inspection;
    inspection.record = record;
    inspection.age_ms = options_.clock() - reference_ms;
    inspection.status = inspection.age_ms > options_.staleness_ms
                            ? LockStatus::Stale
                            : LockStatus::Live;
    return inspection;
}

core::errors::Result<LockInspection> SessionLock::inspect(
    const std::string& key) const {
    auto valid = validate_key(key);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    const auto path = lock_path(key);
    auto content = core::fs::read_file(path);
    if (core::errors::is_error(content)) {
        const auto& err = core::errors::get_error(content);
        if (err.category == ErrorCategory::NotFound) {
            return LockInspection{};
        }
        return err;
    }

    const auto record = decode_lock_record(core::errors::get_value(content));
    if (record.has_value()) {
        return classify(record, record->heartbeat_ms);
    }
    // Unreadable lock files age by modification time.
    const auto mtime = file_mtime_ms(path);
    return classify(std::nullopt, mtime.value_or(options_.clock()));
}

core::errors::Result<bool> SessionLock::is_live(const std::string& key) const {
    auto inspection = inspect(key);
    if (core::errors::is_error(inspection)) {
        return core::errors::get_error(inspection);
    }
    return core::errors::get_value(inspection).status == LockStatus::Live;
}

core::errors::Result<LockHandle> SessionLock::acquire(const std::string& key) const {
    auto valid = validate_key(key);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    std::error_code ec;
    std::filesystem::create_directories(lock_dir_, ec);
    if (ec) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to create lock directory: " + lock_dir_.string() +
                         " (" + ec.message() + ")",
                     "lock_dir_create_failed"};
    }

    const auto path = lock_path(key);
    std::optional<LockRecord> reclaimed_from;

    for (int attempt = 0; attempt < kMaxAcquireAttempts; ++attempt) {
        const std::int64_t now = options_.clock();
        LockRecord record;
        record.key = key;
        record.holder_token = options_.holder_token;
        record.pid = static_cast<std::int64_t>(::getpid());
        record.acquired_at_ms = now;
        record.heartbeat_ms = now;

        auto temp = core::fs::write_temp_file(path, encode_lock_record(record),
                                              options_.sync_writes);
        if (core::errors::is_error(temp)) {
            return core::errors::get_error(temp);
        }
        const auto temp_path = core::errors::get_value(temp);
        const int rc = ::link(temp_path.c_str(), path.c_str());
        const int link_errno = errno;
        static_cast<void>(::unlink(temp_path.c_str()));

        if (rc == 0) {
            if (options_.sync_writes) {
                auto synced = core::fs::sync_directory(lock_dir_);
                if (core::errors::is_error(synced)) {
                    LOG_WARN("SessionLock: " +
                             core::errors::get_error(synced).message);
                }
            }
            LockHandle handle;
            handle.key = key;
            handle.holder_token = options_.holder_token;
            handle.path = path;
            handle.acquired_at_ms = now;
            handle.heartbeat_ms = now;
            handle.held = true;
            handle.reclaimed_from = reclaimed_from;
            LOG_DEBUG("SessionLock: acquired " + key);
            return handle;
        }
        if (link_errno != EEXIST) {
            return Error{ErrorCategory::IOFailure,
                         "Unable to create lock file: " + path.string() + " (" +
                             core::fs::errno_message(link_errno) + ")",
                         "lock_create_failed"};
        }

        auto existing = core::fs::read_file(path);
        if (core::errors::is_error(existing)) {
            if (core::errors::get_error(existing).category ==
                ErrorCategory::NotFound) {
                continue;
            }
            return core::errors::get_error(existing);
        }
        const std::string observed = core::errors::get_value(existing);
        const auto existing_record = decode_lock_record(observed);
        const auto inspection =
            existing_record.has_value()
                ? classify(existing_record, existing_record->heartbeat_ms)
                : classify(std::nullopt,
                           file_mtime_ms(path).value_or(options_.clock()));

        if (inspection.status == LockStatus::Live) {
            return Error{ErrorCategory::Busy,
                         "Lock '" + key + "' is held by " +
                             describe_holder(inspection),
                         "session_locked",
                         "Another waypoint process is using this session. Retry "
                         "after it exits, or start a fresh one with --new."};
        }

        LOG_WARN("SessionLock: reclaiming stale lock '" + key + "' held by " +
                 describe_holder(inspection));
        auto outcome = reclaim(path, observed);
        if (core::errors::is_error(outcome)) {
            return core::errors::get_error(outcome);
        }
        switch (core::errors::get_value(outcome)) {
            case ReclaimOutcome::Reclaimed:
                reclaimed_from = existing_record.has_value()
                                     ? existing_record
                                     : std::optional<LockRecord>(LockRecord{key});
                break;
            case ReclaimOutcome::Vanished:
                break;
            case ReclaimOutcome::LostRace:
                return Error{ErrorCategory::Busy,
                             "Lock '" + key +
                                 "' was reclaimed concurrently by another process",
                             "session_locked",
                             "Another waypoint process is using this session."};
        }
    }

    return Error{ErrorCategory::Busy,
                 "Lock '" + key + "' is contended; gave up after " +
                     std::to_string(kMaxAcquireAttempts) + " attempts",
                 "lock_contended"};
}

core::errors::Result<SessionLock::ReclaimOutcome> SessionLock::reclaim(
    const std::filesystem::path& path, const std::string& observed_content) const {
    const auto tomb = aside_path(path, ".stale-");
    if (::rename(path.c_str(), tomb.c_str()) != 0) {
        if (errno == ENOENT) {
            return ReclaimOutcome::Vanished;
        }
        return Error{ErrorCategory::IOFailure,
                     "Unable to move stale lock aside: " + path.string() + " (" +
                         core::fs::errno_message(errno) + ")",
                     "lock_reclaim_failed"};
    }

    auto moved = core::fs::read_file(tomb);
    if (!core::errors::is_error(moved) &&
        core::errors::get_value(moved) == observed_content) {
        static_cast<void>(::unlink(tomb.c_str()));
        return ReclaimOutcome::Reclaimed;
    }

    // Another process replaced the stale lock between our read and rename;
    // put its lock back.
    restore_lock(tomb, path);
    return ReclaimOutcome::LostRace;
}

core::errors::Result<std::optional<LockRecord>> SessionLock::take_aside(
    const std::filesystem::path& path, const std::filesystem::path& aside) const {
    if (::rename(path.c_str(), aside.c_str()) != 0) {
        const int rename_errno = errno;
        if (rename_errno == ENOENT) {
            return Error{ErrorCategory::NotFound,
                         "Lock file is gone: " + path.string(), "lock_missing"};
        }
        return Error{ErrorCategory::IOFailure,
                     "Unable to move lock file aside: " + path.string() + " (" +
                         core::fs::errno_message(rename_errno) + ")",
                     "lock_move_failed"};
    }
    auto content = core::fs::read_file(aside);
    if (core::errors::is_error(content)) {
        LOG_WARN("SessionLock: " + core::errors::get_error(content).message);
        return std::optional<LockRecord>{};
    }
    return decode_lock_record(core::errors::get_value(content));
}

core::errors::Result<std::int64_t> SessionLock::refresh(LockHandle& handle) const {
    if (!handle.held) {
        return Error{ErrorCategory::Input,
                     "Lock '" + handle.key + "' is not held", "lock_not_held"};
    }

    LockRecord updated;
    updated.key = handle.key;
    updated.holder_token = handle.holder_token;
    updated.pid = static_cast<std::int64_t>(::getpid());
    updated.acquired_at_ms = handle.acquired_at_ms;
    updated.heartbeat_ms = options_.clock();

    auto temp = core::fs::write_temp_file(handle.path, encode_lock_record(updated),
                                          options_.sync_writes);
    if (core::errors::is_error(temp)) {
        return core::errors::get_error(temp);
    }
    const auto temp_path = core::errors::get_value(temp);

    // The published file is moved aside before the new record is linked in,
    // so a successor's lock is never overwritten.
    const auto aside = aside_path(handle.path, ".refresh-");
    auto taken = take_aside(handle.path, aside);
    if (core::errors::is_error(taken)) {
        static_cast<void>(::unlink(temp_path.c_str()));
        const auto& err = core::errors::get_error(taken);
        if (err.category != ErrorCategory::NotFound) {
            return err;
        }
        handle.held = false;
        return lock_lost(handle.key);
    }
    const auto& current = core::errors::get_value(taken);
    if (!current.has_value() || current->holder_token != handle.holder_token) {
        restore_lock(aside, handle.path);
        static_cast<void>(::unlink(temp_path.c_str()));
        handle.held = false;
        return lock_lost(handle.key);
    }

    const int rc = ::link(temp_path.c_str(), handle.path.c_str());
    const int link_errno = errno;
    static_cast<void>(::unlink(temp_path.c_str()));
    static_cast<void>(::unlink(aside.c_str()));
    if (rc != 0) {
        handle.held = false;
        if (link_errno == EEXIST) {
            return lock_lost(handle.key);
        }
        return Error{ErrorCategory::IOFailure,
                     "Unable to republish lock file: " + handle.path.string() +
                         " (" + core::fs::errno_message(link_errno) + ")",
                     "lock_refresh_failed"};
    }
    if (options_.sync_writes) {
        auto synced = core::fs::sync_directory(lock_dir_);
        if (core::errors::is_error(synced)) {
            LOG_WARN("SessionLock: " + core::errors::get_error(synced).message);
        }
    }
    handle.heartbeat_ms = updated.heartbeat_ms;
    return updated.heartbeat_ms;
}

core::errors::Result<bool> SessionLock::release(LockHandle& handle) const {
    if (!handle.held) {
        return false;
    }
    handle.held = false;

    const auto aside = aside_path(handle.path, ".release-");
    auto taken = take_aside(handle.path, aside);
    if (core::errors::is_error(taken)) {
        const auto& err = core::errors::get_error(taken);
        if (err.category == ErrorCategory::NotFound) {
            return false;
        }
        return err;
    }
    const auto& current = core::errors::get_value(taken);
    if (!current.has_value() || current->holder_token != handle.holder_token) {
        restore_lock(aside, handle.path);
        LOG_DEBUG("SessionLock: '" + handle.key +
                  "' already belongs to another holder; nothing to release");
        return false;
    }

    if (::unlink(aside.c_str()) != 0 && errno != ENOENT) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to remove lock file: " + aside.string() + " (" +
                         core::fs::errno_message(errno) + ")",
                     "lock_release_failed"};
    }
    LOG_DEBUG("SessionLock: released " + handle.key);
    return true;
}

}  // namespace waypoint::session
