#include "session/session_store.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/encoding/checksum.hpp"
#include "core/fs/atomic_file.hpp"
#include "core/logging/logger.hpp"

namespace waypoint::session {

using core::errors::Error;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::Session;

namespace {

constexpr int kRecordFormat = 1;
constexpr int kMaxIdAttempts = 16;
constexpr const char* kRecordFileName = "session.json";
constexpr const char* kTranscriptFileName = "transcript.jsonl";

json record_body(const Session& session) {
    json doc;
    doc["format"] = kRecordFormat;
    doc["session_id"] = session.session_id;
    doc["project_path"] = session.project_path.string();
    doc["created_at_ms"] = session.created_at_ms;
    doc["updated_at_ms"] = session.updated_at_ms;
    doc["revision"] = session.revision;
    doc["transcript_path"] = session.transcript_path.string();
    doc["state_snapshot_hex"] = core::encoding::to_hex(session.state_snapshot);
    return doc;
}

Error corrupt(const std::string& session_id, const std::string& reason) {
    return Error{ErrorCategory::Corrupt,
                 "Session record " + session_id + " is corrupt: " + reason,
                 "session_corrupt",
                 "Start a fresh session with --new; the damaged record is left "
                 "in place for inspection."};
}

}  // namespace

core::errors::Result<std::string> encode_session_record(const Session& session) {
    try {
        json doc = record_body(session);
        const std::string checksum = core::encoding::checksum_hex(doc.dump());
        doc["checksum"] = checksum;
        return doc.dump(2) + "\n";
    } catch (const json::type_error& e) {
        return Error{ErrorCategory::Input,
                     "Session " + session.session_id +
                         " cannot be encoded: " + e.what(),
                     "session_encode_failed"};
    }
}

core::errors::Result<Session> decode_session_record(const std::string& text,
                                                    const std::string& expected_id) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return corrupt(expected_id, std::string("unparsable record (") +
                                        e.what() + ")");
    }
    if (!doc.is_object()) {
        return corrupt(expected_id, "record is not an object");
    }

    Session session;
    std::string stored_checksum;
    std::string snapshot_hex;
    try {
        if (doc.at("format").get<int>() != kRecordFormat) {
            return corrupt(expected_id, "unsupported format " +
                                            doc.at("format").dump());
        }
        session.session_id = doc.at("session_id").get<std::string>();
        session.project_path = doc.at("project_path").get<std::string>();
        session.created_at_ms = doc.at("created_at_ms").get<std::int64_t>();
        session.updated_at_ms = doc.at("updated_at_ms").get<std::int64_t>();
        session.revision = doc.at("revision").get<std::uint64_t>();
        session.transcript_path = doc.at("transcript_path").get<std::string>();
        snapshot_hex = doc.at("state_snapshot_hex").get<std::string>();
        stored_checksum = doc.at("checksum").get<std::string>();
    } catch (const json::exception& e) {
        return corrupt(expected_id, std::string("missing or mistyped field (") +
                                        e.what() + ")");
    }

    doc.erase("checksum");
    if (core::encoding::checksum_hex(doc.dump()) != stored_checksum) {
        return corrupt(expected_id, "checksum mismatch");
    }
    if (session.session_id != expected_id) {
        return corrupt(expected_id, "record names session " + session.session_id);
    }
    auto snapshot = core::encoding::from_hex(snapshot_hex);
    if (!snapshot.has_value()) {
        return corrupt(expected_id, "snapshot is not valid hex");
    }
    session.state_snapshot = std::move(snapshot.value());
    return session;
}

SessionStore::SessionStore(std::filesystem::path root, StoreOptions options)
    : root_(std::move(root)), options_(std::move(options)) {}

std::filesystem::path SessionStore::session_dir(const std::string& session_id) const {
    return sessions_dir() / session_id;
}

std::filesystem::path SessionStore::record_path(const std::string& session_id) const {
    return session_dir(session_id) / kRecordFileName;
}

std::filesystem::path SessionStore::default_transcript_path(
    const std::string& session_id) const {
    return session_dir(session_id) / kTranscriptFileName;
}

core::errors::Result<std::filesystem::path> SessionStore::canonical_project_path(
    const std::filesystem::path& project_path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(project_path, ec);
    if (ec) {
        return Error{ErrorCategory::Input,
                     "Unable to resolve project path: " + project_path.string(),
                     "invalid_project_path"};
    }
    auto canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return Error{ErrorCategory::Input,
                     "Unable to canonicalize project path: " +
                         project_path.string(),
                     "invalid_project_path"};
    }
    return canonical;
}

core::errors::Result<bool> SessionStore::validate_session_id(
    const std::string& session_id) {
    if (session_id.empty() || session_id.front() == '.' ||
        session_id.find_first_of("/\\") != std::string::npos) {
        return Error{ErrorCategory::Input, "Invalid session id: '" + session_id + "'",
                     "invalid_session_id"};
    }
    return true;
}

core::errors::Result<std::filesystem::path> SessionStore::write_record(
    const Session& session) const {
    auto encoded = encode_session_record(session);
    if (core::errors::is_error(encoded)) {
        return core::errors::get_error(encoded);
    }
    return core::fs::write_file_atomically(record_path(session.session_id),
                                           core::errors::get_value(encoded),
                                           options_.sync_writes);
}

core::errors::Result<Session> SessionStore::create(
    const std::filesystem::path& project_path, const SessionLock* live_guard,
    const std::optional<std::filesystem::path>& transcript_path) const {
    auto canonical_result = canonical_project_path(project_path);
    if (core::errors::is_error(canonical_result)) {
        return core::errors::get_error(canonical_result);
    }
    const auto canonical = core::errors::get_value(canonical_result);

    if (live_guard != nullptr) {
        auto existing = list_for(canonical);
        if (core::errors::is_error(existing)) {
            return core::errors::get_error(existing);
        }
        for (const auto& other : core::errors::get_value(existing)) {
            auto live = live_guard->is_live(other.session_id);
            if (core::errors::is_error(live)) {
                return core::errors::get_error(live);
            }
            if (core::errors::get_value(live)) {
                return Error{ErrorCategory::Busy,
                             "Session " + other.session_id + " for " +
                                 canonical.string() + " is live in another process",
                             "session_already_locked",
                             "Only one live session per project is allowed. Wait "
                             "for the other process to exit."};
            }
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(sessions_dir(), ec);
    if (ec) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to create session store: " + sessions_dir().string() +
                         " (" + ec.message() + ")",
                     "store_create_failed"};
    }

    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        const std::string session_id = core::config::generate_session_id();
        const bool created = std::filesystem::create_directory(session_dir(session_id), ec);
        if (ec) {
            return Error{ErrorCategory::IOFailure,
                         "Unable to create session directory: " +
                             session_dir(session_id).string() + " (" +
                             ec.message() + ")",
                         "store_create_failed"};
        }
        if (!created) {
            continue;
        }

        Session session;
        session.session_id = session_id;
        session.project_path = canonical;
        session.created_at_ms = options_.clock();
        session.updated_at_ms = session.created_at_ms;
        session.revision = 1;
        session.transcript_path = default_transcript_path(session_id);
        if (transcript_path.has_value()) {
            session.transcript_path =
                std::filesystem::absolute(transcript_path.value(), ec);
            if (ec) {
                std::filesystem::remove_all(session_dir(session_id), ec);
                return Error{ErrorCategory::Input,
                             "Unable to resolve transcript path: " +
                                 transcript_path->string(),
                             "invalid_transcript_path"};
            }
        }

        auto written = write_record(session);
        if (core::errors::is_error(written)) {
            std::filesystem::remove_all(session_dir(session_id), ec);
            return core::errors::get_error(written);
        }
        LOG_INFO("SessionStore: created session " + session_id + " for " +
                 canonical.string());
        return session;
    }

    return Error{ErrorCategory::Internal, "Unable to allocate unique session ID.",
                 "session_id_generation_failed"};
}

core::errors::Result<Session> SessionStore::load(const std::string& session_id) const {
    auto valid = validate_session_id(session_id);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }

    auto text = core::fs::read_file(record_path(session_id));
    if (core::errors::is_error(text)) {
        const auto& err = core::errors::get_error(text);
        if (err.category == ErrorCategory::NotFound) {
            return Error{ErrorCategory::NotFound,
                         "Session not found: " + session_id, "session_not_found"};
        }
        return err;
    }
    return decode_session_record(core::errors::get_value(text), session_id);
}

core::errors::Result<Session> SessionStore::save(const Session& session,
                                                 const std::string& new_snapshot,
                                                 const LockHandle& lock) const {
    if (!lock.held || lock.key != session.session_id) {
        return Error{ErrorCategory::Busy,
                     "Session " + session.session_id +
                         " cannot be saved without holding its lock",
                     "lock_not_held"};
    }

    auto current_result = load(session.session_id);
    if (core::errors::is_error(current_result)) {
        return core::errors::get_error(current_result);
    }
    const auto& current = core::errors::get_value(current_result);
    if (current.revision != session.revision) {
        return Error{ErrorCategory::Busy,
                     "Session " + session.session_id + " was modified elsewhere (revision " +
                         std::to_string(current.revision) + ", expected " +
                         std::to_string(session.revision) + ")",
                     "session_modified"};
    }

    Session updated = current;
    updated.state_snapshot = new_snapshot;
    updated.revision = current.revision + 1;
    updated.updated_at_ms = std::max(options_.clock(), current.updated_at_ms + 1);

    auto written = write_record(updated);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    LOG_DEBUG("SessionStore: saved " + updated.session_id + " revision " +
              std::to_string(updated.revision));
    return updated;
}

core::errors::Result<std::vector<std::string>> SessionStore::list_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!std::filesystem::exists(sessions_dir(), ec)) {
        if (ec) {
            return Error{ErrorCategory::IOFailure,
                         "Unable to read session store: " + sessions_dir().string(),
                         "store_read_failed"};
        }
        return ids;
    }

    std::filesystem::directory_iterator it(sessions_dir(), ec);
    if (ec) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to list session store: " + sessions_dir().string() +
                         " (" + ec.message() + ")",
                     "store_read_failed"};
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec) || entry_ec) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }
        ids.push_back(name);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

core::errors::Result<std::vector<Session>> SessionStore::list_for(
    const std::filesystem::path& project_path,
    std::vector<core::errors::Error>* skipped) const {
    auto canonical_result = canonical_project_path(project_path);
    if (core::errors::is_error(canonical_result)) {
        return core::errors::get_error(canonical_result);
    }
    const auto canonical = core::errors::get_value(canonical_result);

    auto ids = list_ids();
    if (core::errors::is_error(ids)) {
        return core::errors::get_error(ids);
    }

    std::vector<Session> sessions;
    for (const auto& session_id : core::errors::get_value(ids)) {
        auto loaded = load(session_id);
        if (core::errors::is_error(loaded)) {
            if (skipped != nullptr) {
                skipped->push_back(core::errors::get_error(loaded));
            }
            continue;
        }
        const auto& session = core::errors::get_value(loaded);
        if (session.project_path == canonical) {
            sessions.push_back(session);
        }
    }

    std::sort(sessions.begin(), sessions.end(), [](const Session& a, const Session& b) {
        if (a.updated_at_ms != b.updated_at_ms) {
            return a.updated_at_ms > b.updated_at_ms;
        }
        return a.session_id > b.session_id;
    });
    return sessions;
}

}  // namespace waypoint::session
