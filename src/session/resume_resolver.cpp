#include "session/resume_resolver.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"
#include "session/transcript_logger.hpp"

namespace waypoint::session {

using core::errors::Error;
using protocol::Session;

namespace {

struct Candidate {
    Session session;
    std::uint64_t entries = 0;
};

}  // namespace

ResumeResolver::ResumeResolver(const SessionStore& store) : store_(store) {}

core::errors::Result<Resolution> ResumeResolver::resolve(
    const std::filesystem::path& project_path) const {
    Resolution resolution;
    std::vector<Error> skipped;
    auto listed = store_.list_for(project_path, &skipped);
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    for (auto& warning : skipped) {
        LOG_WARN("ResumeResolver: skipping candidate: " + warning.message);
        resolution.warnings.push_back(std::move(warning));
    }

    std::vector<Candidate> candidates;
    for (const auto& session : core::errors::get_value(listed)) {
        auto scan = scan_transcript(session.transcript_path);
        if (core::errors::is_error(scan)) {
            const auto& err = core::errors::get_error(scan);
            LOG_WARN("ResumeResolver: skipping session " + session.session_id + ": " +
                     err.message);
            resolution.warnings.push_back(err);
            continue;
        }
        candidates.push_back(
            Candidate{session, core::errors::get_value(scan).entries.size()});
    }

    if (candidates.empty()) {
        LOG_DEBUG("ResumeResolver: no resumable session for " + project_path.string());
        return resolution;
    }

    const auto best = std::min_element(
        candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) {
            if (a.session.updated_at_ms != b.session.updated_at_ms) {
                return a.session.updated_at_ms > b.session.updated_at_ms;
            }
            if (a.entries != b.entries) {
                return a.entries > b.entries;
            }
            return a.session.session_id > b.session.session_id;
        });
    resolution.session = best->session;
    resolution.transcript_entries = best->entries;
    LOG_DEBUG("ResumeResolver: resolved " + best->session.session_id + " out of " +
              std::to_string(candidates.size()) + " candidate(s)");
    return resolution;
}

core::errors::Result<Session> ResumeResolver::resolve_by_id(
    const std::string& session_id, const std::filesystem::path& project_path) const {
    auto loaded = store_.load(session_id);
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const auto& session = core::errors::get_value(loaded);

    auto canonical = SessionStore::canonical_project_path(project_path);
    if (!core::errors::is_error(canonical) &&
        core::errors::get_value(canonical) != session.project_path) {
        LOG_WARN("ResumeResolver: session " + session_id + " belongs to " +
                 session.project_path.string() + ", not " +
                 core::errors::get_value(canonical).string());
    }
    return session;
}

}  // namespace waypoint::session
