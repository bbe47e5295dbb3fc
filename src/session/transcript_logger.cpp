#include "session/transcript_logger.hpp"

#include <cerrno>
#include <fcntl.h>
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
using protocol::EntryKind;
using protocol::TranscriptEntry;

std::string encode_transcript_entry(const TranscriptEntry& entry) {
    json record;
    record["seq"] = entry.sequence;
    record["ts_unix_ms"] = entry.timestamp_ms;
    record["session_id"] = entry.session_id;
    record["kind"] = protocol::to_string(entry.kind);
    if (core::encoding::is_valid_utf8(entry.payload)) {
        record["payload"] = entry.payload;
    } else {
        record["payload_hex"] = core::encoding::to_hex(entry.payload);
    }
    return record.dump() + "\n";
}

std::optional<TranscriptEntry> decode_transcript_entry(const std::string& line) {
    try {
        const auto record = json::parse(line);
        TranscriptEntry entry;
        entry.sequence = record.at("seq").get<std::uint64_t>();
        entry.timestamp_ms = record.at("ts_unix_ms").get<std::int64_t>();
        entry.session_id = record.at("session_id").get<std::string>();
        const auto kind = protocol::entry_kind_from_string(
            record.at("kind").get<std::string>());
        if (!kind.has_value()) {
            return std::nullopt;
        }
        entry.kind = kind.value();
        if (record.contains("payload")) {
            entry.payload = record.at("payload").get<std::string>();
        } else {
            auto bytes = core::encoding::from_hex(
                record.at("payload_hex").get<std::string>());
            if (!bytes.has_value()) {
                return std::nullopt;
            }
            entry.payload = std::move(bytes.value());
        }
        return entry;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

core::errors::Result<TranscriptScan> parse_transcript(const std::string& content,
                                                      const std::string& source) {
    TranscriptScan scan;
    std::size_t offset = 0;
    std::optional<std::size_t> damaged_at;

    while (offset < content.size()) {
        const std::size_t newline = content.find('\n', offset);
        const bool terminated = newline != std::string::npos;
        const std::size_t end = terminated ? newline + 1 : content.size();
        const std::string line =
            content.substr(offset, (terminated ? newline : content.size()) - offset);

        std::optional<TranscriptEntry> entry;
        if (terminated) {
            entry = decode_transcript_entry(line);
        }
        if (!damaged_at.has_value()) {
            if (!entry.has_value()) {
                damaged_at = offset;
                offset = end;
                continue;
            }
            const std::uint64_t expected = scan.entries.size() + 1;
            const bool same_session = scan.entries.empty() ||
                                      entry->session_id == scan.entries.front().session_id;
            if (entry->sequence != expected || !same_session) {
                return Error{ErrorCategory::Corrupt,
                             "Transcript " + source + " has record " +
                                 std::to_string(entry->sequence) + " of session " +
                                 entry->session_id + " where record " +
                                 std::to_string(expected) + " was expected",
                             "transcript_corrupt",
                             "Inspect or move the transcript aside; complete records are "
                             "never discarded automatically."};
            }
            scan.entries.push_back(entry.value());
            scan.valid_bytes = end;
        } else if (entry.has_value()) {
            return Error{ErrorCategory::Corrupt,
                         "Transcript " + source + " has a damaged record at byte " +
                             std::to_string(damaged_at.value()) +
                             " followed by complete records",
                         "transcript_corrupt",
                         "Inspect or move the transcript aside; complete records are "
                         "never discarded automatically."};
        }
        offset = end;
    }

    scan.tail_bytes = content.size() - scan.valid_bytes;
    return scan;
}

core::errors::Result<TranscriptScan> scan_transcript(const std::filesystem::path& path) {
    auto content = core::fs::read_file(path);
    if (core::errors::is_error(content)) {
        const auto& err = core::errors::get_error(content);
        if (err.category == ErrorCategory::NotFound) {
            return TranscriptScan{};
        }
        return err;
    }
    return parse_transcript(core::errors::get_value(content), path.string());
}

TranscriptLogger::TranscriptLogger(std::string session_id,
                                   std::filesystem::path destination,
                                   TranscriptOptions options, const int fd,
                                   const std::uint64_t size,
                                   const std::uint64_t last_sequence,
                                   const std::uint64_t repaired_bytes)
    : session_id_(std::move(session_id)),
      destination_(std::move(destination)),
      options_(std::move(options)),
      fd_(fd),
      size_(size),
      last_sequence_(last_sequence),
      repaired_bytes_(repaired_bytes) {}

TranscriptLogger::TranscriptLogger(TranscriptLogger&& other) noexcept
    : session_id_(std::move(other.session_id_)),
      destination_(std::move(other.destination_)),
      options_(std::move(other.options_)),
      fd_(other.fd_),
      size_(other.size_),
      last_sequence_(other.last_sequence_),
      repaired_bytes_(other.repaired_bytes_) {
    other.fd_ = -1;
}

TranscriptLogger& TranscriptLogger::operator=(TranscriptLogger&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            static_cast<void>(::close(fd_));
        }
        session_id_ = std::move(other.session_id_);
        destination_ = std::move(other.destination_);
        options_ = std::move(other.options_);
        fd_ = other.fd_;
        size_ = other.size_;
        last_sequence_ = other.last_sequence_;
        repaired_bytes_ = other.repaired_bytes_;
        other.fd_ = -1;
    }
    return *this;
}

TranscriptLogger::~TranscriptLogger() {
    if (fd_ >= 0) {
        static_cast<void>(::close(fd_));
    }
}

core::errors::Result<TranscriptLogger> TranscriptLogger::open(
    const std::string& session_id, const std::filesystem::path& destination,
    TranscriptOptions options) {
    if (session_id.empty()) {
        return Error{ErrorCategory::Input, "Session ID cannot be empty.",
                     "invalid_session_id"};
    }

    std::error_code ec;
    const auto parent = destination.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCategory::IOFailure,
                         "Unable to create transcript directory: " +
                             parent.string() + " (" + ec.message() + ")",
                         "transcript_dir_create_failed"};
        }
    }

    const bool existed = std::filesystem::exists(destination, ec);
    const int fd = ::open(destination.c_str(),
                          O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to open transcript: " + destination.string() + " (" +
                         core::fs::errno_message(errno) + ")",
                     "transcript_open_failed"};
    }

    auto fail = [fd](Error error) -> core::errors::Result<TranscriptLogger> {
        static_cast<void>(::close(fd));
        return error;
    };

    auto content = core::fs::read_file(destination);
    if (core::errors::is_error(content)) {
        return fail(core::errors::get_error(content));
    }
    auto scan_result =
        parse_transcript(core::errors::get_value(content), destination.string());
    if (core::errors::is_error(scan_result)) {
        return fail(core::errors::get_error(scan_result));
    }
    const auto& scan = core::errors::get_value(scan_result);

    if (!scan.entries.empty() && scan.entries.front().session_id != session_id) {
        return fail(Error{ErrorCategory::Input,
                          "Transcript " + destination.string() +
                              " belongs to session " +
                              scan.entries.front().session_id,
                          "transcript_session_mismatch",
                          "Choose another --transcript-log path for this session."});
    }

    if (scan.tail_bytes > 0) {
        if (::ftruncate(fd, static_cast<off_t>(scan.valid_bytes)) != 0 ||
            (options.sync_writes && ::fsync(fd) != 0)) {
            return fail(Error{ErrorCategory::IOFailure,
                              "Unable to discard malformed transcript tail: " +
                                  destination.string() + " (" +
                                  core::fs::errno_message(errno) + ")",
                              "transcript_repair_failed"});
        }
        LOG_WARN("TranscriptLogger: discarded " + std::to_string(scan.tail_bytes) +
                 " bytes of malformed tail in " + destination.string() +
                 "; continuing after sequence " +
                 std::to_string(scan.entries.size()));
    }

    if (!existed && options.sync_writes && !parent.empty()) {
        auto synced = core::fs::sync_directory(parent);
        if (core::errors::is_error(synced)) {
            return fail(core::errors::get_error(synced));
        }
    }

    const std::uint64_t last_sequence =
        scan.entries.empty() ? 0 : scan.entries.back().sequence;
    LOG_DEBUG("TranscriptLogger: opened " + destination.string() + " at sequence " +
              std::to_string(last_sequence));
    return TranscriptLogger(session_id, destination, std::move(options), fd,
                            scan.valid_bytes, last_sequence, scan.tail_bytes);
}

core::errors::Result<TranscriptEntry> TranscriptLogger::append(
    const EntryKind kind, const std::string& payload) {
    if (fd_ < 0) {
        return Error{ErrorCategory::Input,
                     "Transcript is closed: " + destination_.string(),
                     "transcript_closed"};
    }

    TranscriptEntry entry;
    entry.sequence = last_sequence_ + 1;
    entry.timestamp_ms = options_.clock();
    entry.kind = kind;
    entry.session_id = session_id_;
    entry.payload = payload;
    const std::string line = encode_transcript_entry(entry);

    bool ok = core::fs::write_all(fd_, line);
    if (ok && options_.sync_writes && ::fsync(fd_) != 0) {
        ok = false;
    }
    if (!ok) {
        const int saved_errno = errno;
        // Drop whatever part of the record reached the file.
        static_cast<void>(::ftruncate(fd_, static_cast<off_t>(size_)));
        return Error{ErrorCategory::IOFailure,
                     "Unable to append to transcript: " + destination_.string() +
                         " (" + core::fs::errno_message(saved_errno) + ")",
                     "transcript_write_failed"};
    }

    size_ += line.size();
    last_sequence_ = entry.sequence;
    return entry;
}

core::errors::Result<bool> TranscriptLogger::close() {
    if (fd_ < 0) {
        return false;
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to close transcript: " + destination_.string() + " (" +
                         core::fs::errno_message(errno) + ")",
                     "transcript_close_failed"};
    }
    return true;
}

}  // namespace waypoint::session
