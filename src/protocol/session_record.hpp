#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace waypoint::protocol {

enum class EntryKind {
    Input,
    Output,
    System,
    Error
};

// One persisted, resumable unit of conversational state.
struct Session {
    std::string session_id;
    std::filesystem::path project_path;
    std::int64_t created_at_ms = 0;
    std::int64_t updated_at_ms = 0;
    std::uint64_t revision = 0;
    std::filesystem::path transcript_path;
    std::string state_snapshot;
};

// One immutable transcript record.
struct TranscriptEntry {
    std::uint64_t sequence = 0;
    std::int64_t timestamp_ms = 0;
    EntryKind kind = EntryKind::System;
    std::string session_id;
    std::string payload;
};

inline std::string to_string(const EntryKind kind) {
    switch (kind) {
        case EntryKind::Input:
            return "input";
        case EntryKind::Output:
            return "output";
        case EntryKind::System:
            return "system";
        case EntryKind::Error:
            return "error";
        default:
            return "unknown";
    }
}

inline std::optional<EntryKind> entry_kind_from_string(const std::string& text) {
    if (text == "input") {
        return EntryKind::Input;
    }
    if (text == "output") {
        return EntryKind::Output;
    }
    if (text == "system") {
        return EntryKind::System;
    }
    if (text == "error") {
        return EntryKind::Error;
    }
    return std::nullopt;
}

}  // namespace waypoint::protocol
