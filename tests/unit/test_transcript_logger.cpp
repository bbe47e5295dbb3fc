#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/errors.hpp"
#include "session/transcript_logger.hpp"

namespace {

using waypoint::core::errors::ErrorCategory;
using waypoint::core::errors::get_error;
using waypoint::core::errors::get_value;
using waypoint::core::errors::is_error;
using waypoint::core::errors::take_value;
using waypoint::protocol::EntryKind;
using waypoint::protocol::TranscriptEntry;
using waypoint::session::encode_transcript_entry;
using waypoint::session::parse_transcript;
using waypoint::session::scan_transcript;
using waypoint::session::TranscriptLogger;
using waypoint::session::TranscriptOptions;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_transcript_logger_" + waypoint::core::config::random_hex(8));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void append_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    out << text;
}

TranscriptEntry make_entry(std::uint64_t sequence, const std::string& session_id) {
    TranscriptEntry entry;
    entry.sequence = sequence;
    entry.timestamp_ms = 1000 + static_cast<std::int64_t>(sequence);
    entry.kind = EntryKind::Input;
    entry.session_id = session_id;
    entry.payload = "entry " + std::to_string(sequence);
    return entry;
}

TranscriptLogger open_logger(const std::string& session_id,
                             const std::filesystem::path& path) {
    auto opened = TranscriptLogger::open(session_id, path, TranscriptOptions{false});
    EXPECT_FALSE(is_error(opened));
    return take_value(opened);
}

TEST(TranscriptLoggerTest, SequencesContinueAcrossReopen) {
    TempWorkspace ws;
    const auto path = ws.root() / "nested" / "transcript.jsonl";
    {
        auto logger = open_logger("sess-a", path);
        EXPECT_EQ(logger.last_sequence(), 0u);
        for (int i = 0; i < 3; ++i) {
            auto appended = logger.append(EntryKind::Input, "prompt");
            ASSERT_FALSE(is_error(appended));
            EXPECT_EQ(get_value(appended).sequence, static_cast<std::uint64_t>(i + 1));
        }
        ASSERT_FALSE(is_error(logger.close()));
    }

    auto logger = open_logger("sess-a", path);
    EXPECT_EQ(logger.last_sequence(), 3u);
    auto next = logger.append(EntryKind::Output, "reply");
    ASSERT_FALSE(is_error(next));
    EXPECT_EQ(get_value(next).sequence, 4u);

    auto scan = scan_transcript(path);
    ASSERT_FALSE(is_error(scan));
    const auto& entries = get_value(scan).entries;
    ASSERT_EQ(entries.size(), 4u);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(entries[i].sequence, i + 1);
        EXPECT_EQ(entries[i].session_id, "sess-a");
    }
    EXPECT_EQ(entries[3].kind, EntryKind::Output);
    EXPECT_EQ(entries[3].payload, "reply");
}

TEST(TranscriptLoggerTest, TornTailIsTruncatedOnOpen) {
    TempWorkspace ws;
    const auto path = ws.root() / "transcript.jsonl";
    {
        auto logger = open_logger("sess-a", path);
        ASSERT_FALSE(is_error(logger.append(EntryKind::Input, "one")));
        ASSERT_FALSE(is_error(logger.append(EntryKind::Output, "two")));
    }
    const auto intact_size = std::filesystem::file_size(path);
    append_text(path, "{\"seq\":3,\"ts_unix_ms\":12");

    auto logger = open_logger("sess-a", path);
    EXPECT_EQ(logger.last_sequence(), 2u);
    EXPECT_GT(logger.repaired_bytes(), 0u);
    EXPECT_EQ(std::filesystem::file_size(path), intact_size);

    auto appended = logger.append(EntryKind::Input, "three");
    ASSERT_FALSE(is_error(appended));
    EXPECT_EQ(get_value(appended).sequence, 3u);

    auto scan = scan_transcript(path);
    ASSERT_FALSE(is_error(scan));
    EXPECT_EQ(get_value(scan).entries.size(), 3u);
    EXPECT_EQ(get_value(scan).tail_bytes, 0u);
}

TEST(TranscriptLoggerTest, DamagedRecordBeforeValidOnesIsCorrupt) {
    const std::string content = encode_transcript_entry(make_entry(1, "sess-a")) +
                                "{\"seq\": garbage}\n" +
                                encode_transcript_entry(make_entry(3, "sess-a"));
    auto parsed = parse_transcript(content, "test");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).category, ErrorCategory::Corrupt);
    EXPECT_EQ(get_error(parsed).code, "transcript_corrupt");

    TempWorkspace ws;
    const auto path = ws.root() / "transcript.jsonl";
    append_text(path, content);
    auto opened = TranscriptLogger::open("sess-a", path, TranscriptOptions{false});
    ASSERT_TRUE(is_error(opened));
    EXPECT_EQ(get_error(opened).code, "transcript_corrupt");
    // Nothing is discarded when the file cannot be repaired safely.
    EXPECT_EQ(read_text(path), content);
}

TEST(TranscriptLoggerTest, SequenceGapIsCorrupt) {
    const std::string content = encode_transcript_entry(make_entry(1, "sess-a")) +
                                encode_transcript_entry(make_entry(3, "sess-a"));
    auto parsed = parse_transcript(content, "test");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "transcript_corrupt");
}

TEST(TranscriptLoggerTest, UnterminatedFinalRecordCountsAsTail) {
    std::string last = encode_transcript_entry(make_entry(2, "sess-a"));
    last.pop_back();
    const std::string content = encode_transcript_entry(make_entry(1, "sess-a")) + last;

    auto parsed = parse_transcript(content, "test");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).entries.size(), 1u);
    EXPECT_EQ(get_value(parsed).tail_bytes, last.size());
}

TEST(TranscriptLoggerTest, NonUtf8PayloadSurvivesByteForByte) {
    TempWorkspace ws;
    const auto path = ws.root() / "transcript.jsonl";
    const std::string payload("bin\xff\xfe\x00tail", 10);
    {
        auto logger = open_logger("sess-a", path);
        ASSERT_FALSE(is_error(logger.append(EntryKind::Output, payload)));
        ASSERT_FALSE(is_error(logger.append(EntryKind::Output, "caf\xc3\xa9")));
    }

    const std::string text = read_text(path);
    EXPECT_NE(text.find("\"payload_hex\""), std::string::npos);

    auto scan = scan_transcript(path);
    ASSERT_FALSE(is_error(scan));
    ASSERT_EQ(get_value(scan).entries.size(), 2u);
    EXPECT_EQ(get_value(scan).entries[0].payload, payload);
    EXPECT_EQ(get_value(scan).entries[1].payload, "caf\xc3\xa9");
}

TEST(TranscriptLoggerTest, RefusesTranscriptOfAnotherSession) {
    TempWorkspace ws;
    const auto path = ws.root() / "transcript.jsonl";
    {
        auto logger = open_logger("sess-a", path);
        ASSERT_FALSE(is_error(logger.append(EntryKind::Input, "hello")));
    }

    auto opened = TranscriptLogger::open("sess-b", path, TranscriptOptions{false});
    ASSERT_TRUE(is_error(opened));
    EXPECT_EQ(get_error(opened).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(opened).code, "transcript_session_mismatch");
}

TEST(TranscriptLoggerTest, CloseIsIdempotentAndBlocksAppends) {
    TempWorkspace ws;
    auto logger = open_logger("sess-a", ws.root() / "transcript.jsonl");

    auto first = logger.close();
    ASSERT_FALSE(is_error(first));
    EXPECT_TRUE(get_value(first));
    auto second = logger.close();
    ASSERT_FALSE(is_error(second));
    EXPECT_FALSE(get_value(second));
    EXPECT_FALSE(logger.is_open());

    auto appended = logger.append(EntryKind::Input, "late");
    ASSERT_TRUE(is_error(appended));
    EXPECT_EQ(get_error(appended).code, "transcript_closed");
}

TEST(TranscriptLoggerTest, MissingTranscriptScansEmpty) {
    TempWorkspace ws;
    auto scan = scan_transcript(ws.root() / "absent.jsonl");
    ASSERT_FALSE(is_error(scan));
    EXPECT_TRUE(get_value(scan).entries.empty());
    EXPECT_EQ(get_value(scan).tail_bytes, 0u);
}

TEST(TranscriptLoggerTest, TimestampsComeFromInjectedClock) {
    TempWorkspace ws;
    TranscriptOptions options{false, []() { return std::int64_t{424242}; }};
    auto opened = TranscriptLogger::open("sess-a", ws.root() / "t.jsonl", options);
    ASSERT_FALSE(is_error(opened));
    auto logger = take_value(opened);
    auto appended = logger.append(EntryKind::System, "started");
    ASSERT_FALSE(is_error(appended));
    EXPECT_EQ(get_value(appended).timestamp_ms, 424242);
}

}  // namespace
