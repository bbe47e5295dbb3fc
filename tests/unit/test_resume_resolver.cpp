#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/errors.hpp"
#include "session/resume_resolver.hpp"
#include "session/session_store.hpp"
#include "session/transcript_logger.hpp"

namespace {

using waypoint::core::errors::ErrorCategory;
using waypoint::core::errors::get_error;
using waypoint::core::errors::get_value;
using waypoint::core::errors::is_error;
using waypoint::core::errors::take_value;
using waypoint::protocol::EntryKind;
using waypoint::protocol::Session;
using waypoint::session::ResumeResolver;
using waypoint::session::SessionStore;
using waypoint::session::StoreOptions;
using waypoint::session::TranscriptLogger;
using waypoint::session::TranscriptOptions;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_resume_resolver_" + waypoint::core::config::random_hex(8));
        std::filesystem::create_directories(root_ / "project");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path project() const { return root_ / "project"; }

private:
    std::filesystem::path root_;
};

struct Fixture {
    explicit Fixture(const TempWorkspace& ws)
        : store(ws.root() / "store", StoreOptions{false, [this]() { return now; }}),
          resolver(store) {}

    Session create(const std::filesystem::path& project) {
        auto created = store.create(project);
        EXPECT_FALSE(is_error(created));
        return get_value(created);
    }

    void write_entries(const Session& session, int count) {
        auto opened = TranscriptLogger::open(session.session_id, session.transcript_path,
                                             TranscriptOptions{false});
        ASSERT_FALSE(is_error(opened));
        auto logger = take_value(opened);
        for (int i = 0; i < count; ++i) {
            ASSERT_FALSE(is_error(logger.append(EntryKind::Input, "turn")));
        }
    }

    std::int64_t now = 1000;
    SessionStore store;
    ResumeResolver resolver;
};

TEST(ResumeResolverTest, EmptyStoreResolvesToNothingRepeatedly) {
    TempWorkspace ws;
    Fixture fx(ws);

    for (int i = 0; i < 2; ++i) {
        auto resolution = fx.resolver.resolve(ws.project());
        ASSERT_FALSE(is_error(resolution));
        EXPECT_FALSE(get_value(resolution).session.has_value());
        EXPECT_TRUE(get_value(resolution).warnings.empty());
    }
    EXPECT_FALSE(std::filesystem::exists(ws.root() / "store" / "sessions"));
}

TEST(ResumeResolverTest, PicksMostRecentlyUpdatedSession) {
    TempWorkspace ws;
    Fixture fx(ws);
    fx.now = 1000;
    const auto older = fx.create(ws.project());
    fx.now = 2000;
    const auto newer = fx.create(ws.project());
    fx.write_entries(older, 5);

    auto resolution = fx.resolver.resolve(ws.project());
    ASSERT_FALSE(is_error(resolution));
    ASSERT_TRUE(get_value(resolution).session.has_value());
    EXPECT_EQ(get_value(resolution).session->session_id, newer.session_id);
    EXPECT_EQ(get_value(resolution).transcript_entries, 0u);
}

TEST(ResumeResolverTest, TiesGoToTheLongerTranscript) {
    TempWorkspace ws;
    Fixture fx(ws);
    const auto first = fx.create(ws.project());
    const auto second = fx.create(ws.project());
    const auto& longer = first.session_id < second.session_id ? first : second;
    fx.write_entries(first, 1);
    fx.write_entries(second, 1);
    fx.write_entries(longer, 2);

    auto resolution = fx.resolver.resolve(ws.project());
    ASSERT_FALSE(is_error(resolution));
    ASSERT_TRUE(get_value(resolution).session.has_value());
    EXPECT_EQ(get_value(resolution).session->session_id, longer.session_id);
    EXPECT_EQ(get_value(resolution).transcript_entries, 3u);
}

TEST(ResumeResolverTest, SkipsCorruptCandidatesWithWarnings) {
    TempWorkspace ws;
    Fixture fx(ws);
    fx.now = 1000;
    const auto healthy = fx.create(ws.project());
    fx.now = 2000;
    const auto bad_record = fx.create(ws.project());
    fx.now = 3000;
    const auto bad_transcript = fx.create(ws.project());

    {
        std::ofstream out(fx.store.record_path(bad_record.session_id), std::ios::trunc);
        out << "{\"format\": 1, \"session_id\": ";
    }
    {
        std::filesystem::create_directories(bad_transcript.transcript_path.parent_path());
        std::ofstream out(bad_transcript.transcript_path, std::ios::trunc);
        out << "not json\n"
            << "{\"seq\":1,\"ts_unix_ms\":1,\"session_id\":\"" << bad_transcript.session_id
            << "\",\"kind\":\"input\",\"payload\":\"x\"}\n";
    }

    auto resolution = fx.resolver.resolve(ws.project());
    ASSERT_FALSE(is_error(resolution));
    ASSERT_TRUE(get_value(resolution).session.has_value());
    EXPECT_EQ(get_value(resolution).session->session_id, healthy.session_id);
    ASSERT_EQ(get_value(resolution).warnings.size(), 2u);
    for (const auto& warning : get_value(resolution).warnings) {
        EXPECT_EQ(warning.category, ErrorCategory::Corrupt);
    }
}

TEST(ResumeResolverTest, IgnoresSessionsOfOtherProjects) {
    TempWorkspace ws;
    Fixture fx(ws);
    std::filesystem::create_directories(ws.root() / "other");
    fx.create(ws.root() / "other");

    auto resolution = fx.resolver.resolve(ws.project());
    ASSERT_FALSE(is_error(resolution));
    EXPECT_FALSE(get_value(resolution).session.has_value());
}

TEST(ResumeResolverTest, ResolveByIdSurfacesNotFound) {
    TempWorkspace ws;
    Fixture fx(ws);
    auto missing = fx.resolver.resolve_by_id("sess-ffffffffffffffff", ws.project());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).category, ErrorCategory::NotFound);

    const auto session = fx.create(ws.project());
    auto found = fx.resolver.resolve_by_id(session.session_id, ws.project());
    ASSERT_FALSE(is_error(found));
    EXPECT_EQ(get_value(found).session_id, session.session_id);
}

}  // namespace
