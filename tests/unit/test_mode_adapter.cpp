#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/errors.hpp"
#include "runtime/echo_turn_processor.hpp"
#include "session/mode_adapter.hpp"

namespace {

using waypoint::core::errors::ErrorCategory;
using waypoint::core::errors::get_error;
using waypoint::core::errors::get_value;
using waypoint::core::errors::is_error;
using waypoint::core::errors::take_value;
using waypoint::protocol::EntryKind;
using waypoint::protocol::ResumePolicy;
using waypoint::protocol::RunMode;
using waypoint::runtime::EchoTurnProcessor;
using waypoint::session::ActiveSession;
using waypoint::session::LockOptions;
using waypoint::session::ModeAdapter;
using waypoint::session::OpenRequest;
using waypoint::session::ResumeResolver;
using waypoint::session::scan_transcript;
using waypoint::session::SessionLock;
using waypoint::session::SessionPhase;
using waypoint::session::SessionStore;
using waypoint::session::StoreOptions;
using waypoint::session::TranscriptOptions;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_mode_adapter_" + waypoint::core::config::random_hex(8));
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

// One simulated process: its own lock holder over a shared store directory.
struct Process {
    Process(const TempWorkspace& ws, RunMode mode, LockOptions options = lock_options())
        : store(ws.root() / "store", StoreOptions{false}),
          locks(store.locks_dir(), std::move(options)),
          resolver(store),
          adapter(store, locks, resolver, mode, TranscriptOptions{false}, 2000) {}

    static LockOptions lock_options() {
        LockOptions options;
        options.sync_writes = false;
        return options;
    }

    // Lock timing driven by a shared fake clock.
    static LockOptions clocked(std::int64_t& now, std::int64_t staleness_ms) {
        LockOptions options = lock_options();
        options.staleness_ms = staleness_ms;
        options.clock = [&now]() { return now; };
        return options;
    }

    SessionStore store;
    SessionLock locks;
    ResumeResolver resolver;
    ModeAdapter adapter;
};

OpenRequest request_for(const TempWorkspace& ws, ResumePolicy policy) {
    OpenRequest request;
    request.project_path = ws.project();
    request.policy = policy;
    return request;
}

std::unique_ptr<ActiveSession> open_or_fail(const Process& process, const OpenRequest& request) {
    auto opened = process.adapter.open(request);
    EXPECT_FALSE(is_error(opened)) << (is_error(opened) ? get_error(opened).message : "");
    if (is_error(opened)) {
        return nullptr;
    }
    return take_value(opened);
}

TEST(ModeAdapterTest, FreshSessionRecordsTurnAndSaves) {
    TempWorkspace ws;
    Process process(ws, RunMode::Exec);
    auto active = open_or_fail(process, request_for(ws, ResumePolicy::Auto));
    ASSERT_TRUE(active != nullptr);
    EXPECT_FALSE(active->resumed());
    EXPECT_EQ(active->phase(), SessionPhase::Active);
    EXPECT_EQ(active->transcript().last_sequence(), 1u);

    EchoTurnProcessor processor;
    auto turn = process.adapter.run_turn(*active, processor, "echo ping");
    ASSERT_FALSE(is_error(turn));
    EXPECT_EQ(get_value(turn).reply, "ping");
    EXPECT_EQ(active->session().revision, 2u);

    auto closed = process.adapter.close(*active);
    ASSERT_FALSE(is_error(closed));
    EXPECT_EQ(active->phase(), SessionPhase::Saved);

    const auto id = active->session().session_id;
    auto loaded = process.store.load(id);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).state_snapshot, get_value(turn).next_snapshot);

    auto scan = scan_transcript(get_value(loaded).transcript_path);
    ASSERT_FALSE(is_error(scan));
    const auto& entries = get_value(scan).entries;
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].kind, EntryKind::System);
    EXPECT_EQ(entries[1].kind, EntryKind::Input);
    EXPECT_EQ(entries[1].payload, "echo ping");
    EXPECT_EQ(entries[2].kind, EntryKind::Output);

    auto live = process.locks.is_live(id);
    ASSERT_FALSE(is_error(live));
    EXPECT_FALSE(get_value(live));
}

TEST(ModeAdapterTest, SecondRunResumesAndContinuesSequence) {
    TempWorkspace ws;
    std::string first_id;
    {
        Process process(ws, RunMode::Exec);
        auto active = open_or_fail(process, request_for(ws, ResumePolicy::Auto));
        ASSERT_TRUE(active != nullptr);
        EchoTurnProcessor processor;
        ASSERT_FALSE(is_error(process.adapter.run_turn(*active, processor, "first")));
        ASSERT_FALSE(is_error(process.adapter.close(*active)));
        first_id = active->session().session_id;
    }

    Process process(ws, RunMode::Interactive);
    auto active = open_or_fail(process, request_for(ws, ResumePolicy::Last));
    ASSERT_TRUE(active != nullptr);
    EXPECT_TRUE(active->resumed());
    EXPECT_EQ(active->session().session_id, first_id);
    EXPECT_EQ(active->transcript().last_sequence(), 5u);

    EchoTurnProcessor processor;
    auto turn = process.adapter.run_turn(*active, processor, "second");
    ASSERT_FALSE(is_error(turn));
    EXPECT_EQ(get_value(turn).reply, "Received: second (turn 2, 2 message(s) in context)");
    ASSERT_FALSE(is_error(process.adapter.close(*active)));
    EXPECT_EQ(active->session().revision, 3u);
}

TEST(ModeAdapterTest, ConcurrentOpenOfSameProjectIsBusy) {
    TempWorkspace ws;
    Process first(ws, RunMode::Interactive);
    Process second(ws, RunMode::Exec);

    auto held = open_or_fail(first, request_for(ws, ResumePolicy::Auto));
    ASSERT_TRUE(held != nullptr);

    auto resumed = second.adapter.open(request_for(ws, ResumePolicy::Auto));
    ASSERT_TRUE(is_error(resumed));
    EXPECT_EQ(get_error(resumed).category, ErrorCategory::Busy);
    EXPECT_EQ(get_error(resumed).code, "session_locked");

    auto fresh = second.adapter.open(request_for(ws, ResumePolicy::Fresh));
    ASSERT_TRUE(is_error(fresh));
    EXPECT_EQ(get_error(fresh).code, "session_already_locked");
}

TEST(ModeAdapterTest, ResumeLastWithoutSessionsIsNotFound) {
    TempWorkspace ws;
    Process process(ws, RunMode::Exec);
    auto opened = process.adapter.open(request_for(ws, ResumePolicy::Last));
    ASSERT_TRUE(is_error(opened));
    EXPECT_EQ(get_error(opened).category, ErrorCategory::NotFound);
    EXPECT_EQ(get_error(opened).code, "no_resumable_session");
}

TEST(ModeAdapterTest, ResumeByIdRequiresAnId) {
    TempWorkspace ws;
    Process process(ws, RunMode::Exec);
    auto opened = process.adapter.open(request_for(ws, ResumePolicy::ById));
    ASSERT_TRUE(is_error(opened));
    EXPECT_EQ(get_error(opened).code, "missing_session_id");

    auto request = request_for(ws, ResumePolicy::ById);
    request.session_id = "sess-0000000000000000";
    auto unknown = process.adapter.open(request);
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "session_not_found");
}

TEST(ModeAdapterTest, FreshPolicyStartsNewSessionBesideIdleOne) {
    TempWorkspace ws;
    Process process(ws, RunMode::Exec);
    auto first = open_or_fail(process, request_for(ws, ResumePolicy::Auto));
    ASSERT_TRUE(first != nullptr);
    ASSERT_FALSE(is_error(process.adapter.close(*first)));

    auto second = open_or_fail(process, request_for(ws, ResumePolicy::Fresh));
    ASSERT_TRUE(second != nullptr);
    EXPECT_FALSE(second->resumed());
    EXPECT_NE(second->session().session_id, first->session().session_id);
}

TEST(ModeAdapterTest, DroppedSessionReleasesLockWithoutSaving) {
    TempWorkspace ws;
    Process process(ws, RunMode::Interactive);
    auto active = open_or_fail(process, request_for(ws, ResumePolicy::Auto));
    ASSERT_TRUE(active != nullptr);
    const auto id = active->session().session_id;
    const auto revision = active->session().revision;

    active.reset();

    auto live = process.locks.is_live(id);
    ASSERT_FALSE(is_error(live));
    EXPECT_FALSE(get_value(live));
    auto loaded = process.store.load(id);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).revision, revision);
}

TEST(ModeAdapterTest, FailedTurnIsRecordedAndLeavesCheckpoint) {
    TempWorkspace ws;
    Process process(ws, RunMode::Interactive);
    auto active = open_or_fail(process, request_for(ws, ResumePolicy::Auto));
    ASSERT_TRUE(active != nullptr);

    EchoTurnProcessor processor;
    auto turn = process.adapter.run_turn(*active, processor, "   ");
    ASSERT_TRUE(is_error(turn));
    EXPECT_EQ(get_error(turn).code, "empty_prompt");
    EXPECT_EQ(active->session().revision, 1u);
    EXPECT_EQ(active->transcript().last_sequence(), 3u);
    ASSERT_FALSE(is_error(process.adapter.close(*active)));

    auto scan = scan_transcript(active->session().transcript_path);
    ASSERT_FALSE(is_error(scan));
    ASSERT_EQ(get_value(scan).entries.size(), 3u);
    EXPECT_EQ(get_value(scan).entries[2].kind, EntryKind::Error);
}

TEST(ModeAdapterTest, CloseIsIdempotentAndEndsRecording) {
    TempWorkspace ws;
    Process process(ws, RunMode::Exec);
    auto active = open_or_fail(process, request_for(ws, ResumePolicy::Auto));
    ASSERT_TRUE(active != nullptr);

    auto first = process.adapter.close(*active, std::string("{\"turns\":0,\"history\":[]}"));
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first).revision, 2u);
    auto second = process.adapter.close(*active);
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).revision, 2u);

    auto late = process.adapter.record(*active, EntryKind::System, "late");
    ASSERT_TRUE(is_error(late));
    EXPECT_EQ(get_error(late).code, "session_not_active");
}

TEST(ModeAdapterTest, HolderThatLostItsLockStopsWriting) {
    TempWorkspace ws;
    std::int64_t now = 10000;
    Process idle(ws, RunMode::Interactive, Process::clocked(now, 1000));
    Process takeover(ws, RunMode::Exec, Process::clocked(now, 1000));
    EchoTurnProcessor processor;

    auto stale = open_or_fail(idle, request_for(ws, ResumePolicy::Auto));
    ASSERT_TRUE(stale != nullptr);
    ASSERT_FALSE(is_error(idle.adapter.run_turn(*stale, processor, "first")));
    const auto id = stale->session().session_id;
    ASSERT_EQ(stale->transcript().last_sequence(), 4u);

    now += 5000;
    {
        auto resumed = open_or_fail(takeover, request_for(ws, ResumePolicy::Auto));
        ASSERT_TRUE(resumed != nullptr);
        EXPECT_TRUE(resumed->resumed());
        EXPECT_EQ(resumed->session().session_id, id);
        ASSERT_FALSE(is_error(takeover.adapter.run_turn(*resumed, processor, "second")));
        ASSERT_FALSE(is_error(takeover.adapter.close(*resumed)));
    }

    auto late = idle.adapter.run_turn(*stale, processor, "third");
    ASSERT_TRUE(is_error(late));
    EXPECT_EQ(get_error(late).category, ErrorCategory::Busy);
    EXPECT_EQ(get_error(late).code, "lock_lost");
    EXPECT_EQ(stale->phase(), SessionPhase::Abandoned);
    EXPECT_EQ(stale->transcript().last_sequence(), 4u);

    auto scan = scan_transcript(stale->session().transcript_path);
    ASSERT_FALSE(is_error(scan));
    const auto& entries = get_value(scan).entries;
    ASSERT_EQ(entries.size(), 8u);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(entries[i].sequence, i + 1);
    }

    Process later(ws, RunMode::Exec, Process::clocked(now, 1000));
    auto again = open_or_fail(later, request_for(ws, ResumePolicy::Auto));
    ASSERT_TRUE(again != nullptr);
    EXPECT_TRUE(again->resumed());
    EXPECT_EQ(again->session().session_id, id);
    EXPECT_EQ(again->transcript().last_sequence(), 9u);
}

TEST(ModeAdapterTest, CrashedProjectGuardExpiresBeforeSessionLocks) {
    TempWorkspace ws;
    std::int64_t now = 10000;
    Process process(ws, RunMode::Exec, Process::clocked(now, 15 * 60 * 1000));

    auto canonical = SessionStore::canonical_project_path(ws.project());
    ASSERT_FALSE(is_error(canonical));
    SessionLock crashed(process.store.locks_dir(), Process::clocked(now, 15 * 60 * 1000));
    auto guard = crashed.acquire(SessionLock::project_key(get_value(canonical)));
    ASSERT_FALSE(is_error(guard));

    auto blocked = process.adapter.open(request_for(ws, ResumePolicy::Auto));
    ASSERT_TRUE(is_error(blocked));
    EXPECT_EQ(get_error(blocked).category, ErrorCategory::Busy);

    now += 2001;
    auto active = open_or_fail(process, request_for(ws, ResumePolicy::Auto));
    ASSERT_TRUE(active != nullptr);
    ASSERT_FALSE(is_error(process.adapter.close(*active)));
}

TEST(ModeAdapterTest, CustomTranscriptLogIsUsedForNewSessions) {
    TempWorkspace ws;
    Process process(ws, RunMode::Exec);
    auto request = request_for(ws, ResumePolicy::Fresh);
    request.transcript_log = ws.root() / "logs" / "custom.jsonl";

    auto active = open_or_fail(process, request);
    ASSERT_TRUE(active != nullptr);
    EXPECT_EQ(active->session().transcript_path, ws.root() / "logs" / "custom.jsonl");
    ASSERT_FALSE(is_error(process.adapter.close(*active)));
    EXPECT_TRUE(std::filesystem::exists(ws.root() / "logs" / "custom.jsonl"));
}

}  // namespace
