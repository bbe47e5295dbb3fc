#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/clock.hpp"
#include "core/errors/errors.hpp"
#include "protocol/session_record.hpp"

namespace waypoint::session {

struct TranscriptOptions {
    bool sync_writes = true;
    core::config::Clock clock = core::config::system_clock();
};

// Result of reading a transcript without modifying it.
struct TranscriptScan {
    std::vector<protocol::TranscriptEntry> entries;
    std::uint64_t valid_bytes = 0;
    // Bytes after the last complete record (a write torn by a crash).
    std::uint64_t tail_bytes = 0;
};

// One newline-terminated JSON object per entry. Payloads that are not valid
// UTF-8 are stored hex encoded under "payload_hex".
std::string encode_transcript_entry(const protocol::TranscriptEntry& entry);
std::optional<protocol::TranscriptEntry> decode_transcript_entry(const std::string& line);

// Splits `content` into complete records and a malformed tail. A damaged
// record followed by intact ones is Corrupt: only a trailing torn write may
// be discarded.
core::errors::Result<TranscriptScan> parse_transcript(const std::string& content,
                                                      const std::string& source);

// Read-only; a missing file scans as empty.
core::errors::Result<TranscriptScan> scan_transcript(const std::filesystem::path& path);

// Append-only writer for one session's transcript. Each append is flushed
// with fsync before it returns.
class TranscriptLogger {
public:
    static core::errors::Result<TranscriptLogger> open(
        const std::string& session_id, const std::filesystem::path& destination,
        TranscriptOptions options = {});

    TranscriptLogger(TranscriptLogger&& other) noexcept;
    TranscriptLogger& operator=(TranscriptLogger&& other) noexcept;
    TranscriptLogger(const TranscriptLogger&) = delete;
    TranscriptLogger& operator=(const TranscriptLogger&) = delete;
    ~TranscriptLogger();

    core::errors::Result<protocol::TranscriptEntry> append(protocol::EntryKind kind,
                                                           const std::string& payload);

    // Idempotent; never removes content.
    core::errors::Result<bool> close();

    bool is_open() const { return fd_ >= 0; }
    std::uint64_t last_sequence() const { return last_sequence_; }
    std::uint64_t repaired_bytes() const { return repaired_bytes_; }
    const std::string& session_id() const { return session_id_; }
    const std::filesystem::path& destination() const { return destination_; }

private:
    TranscriptLogger(std::string session_id, std::filesystem::path destination,
                     TranscriptOptions options, int fd, std::uint64_t size,
                     std::uint64_t last_sequence, std::uint64_t repaired_bytes);

    std::string session_id_;
    std::filesystem::path destination_;
    TranscriptOptions options_;
    int fd_ = -1;
    std::uint64_t size_ = 0;
    std::uint64_t last_sequence_ = 0;
    std::uint64_t repaired_bytes_ = 0;
};

}  // namespace waypoint::session
