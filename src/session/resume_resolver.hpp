#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/errors.hpp"
#include "protocol/session_record.hpp"
#include "session/session_store.hpp"

namespace waypoint::session {

struct Resolution {
    std::optional<protocol::Session> session;
    // Transcript entry count of the chosen session.
    std::uint64_t transcript_entries = 0;
    // Candidates skipped because their record or transcript failed validation.
    std::vector<core::errors::Error> warnings;
};

// Picks the session a runner should continue. Holds no state of its own.
class ResumeResolver {
public:
    explicit ResumeResolver(const SessionStore& store);

    // Most recently updated valid session for the project, or none. Ties on
    // updated_at_ms go to the longer transcript.
    core::errors::Result<Resolution> resolve(const std::filesystem::path& project_path) const;

    // Explicit resumption: NotFound and Corrupt surface to the caller.
    core::errors::Result<protocol::Session> resolve_by_id(
        const std::string& session_id,
        const std::filesystem::path& project_path) const;

private:
    const SessionStore& store_;
};

}  // namespace waypoint::session
