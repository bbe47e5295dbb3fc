#include "runtime/echo_turn_processor.hpp"

#include <cctype>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/encoding/checksum.hpp"

namespace waypoint::runtime {

using core::errors::Error;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::EntryKind;

namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string compose_reply(const std::string& prompt, const std::uint64_t turn,
                          const std::size_t context_messages) {
    constexpr const char* kEchoPrefix = "echo ";
    if (prompt.rfind(kEchoPrefix, 0) == 0) {
        return prompt.substr(5);
    }
    return "Received: " + prompt + " (turn " + std::to_string(turn) + ", " +
           std::to_string(context_messages) + " message(s) in context)";
}

}  // namespace

EchoTurnProcessor::EchoTurnProcessor(const std::size_t history_limit)
    : history_limit_(history_limit == 0 ? 1 : history_limit) {}

core::errors::Result<TurnOutcome> EchoTurnProcessor::process(
    const std::string& snapshot, const std::string& prompt) {
    const std::string text = trim(prompt);
    if (text.empty()) {
        return Error{ErrorCategory::Input, "Prompt cannot be empty.", "empty_prompt"};
    }
    // The snapshot is JSON text, which only carries UTF-8.
    if (!core::encoding::is_valid_utf8(text)) {
        return Error{ErrorCategory::Input, "Prompt is not valid UTF-8 text.",
                     "invalid_prompt_encoding"};
    }

    json state = {{"turns", 0}, {"history", json::array()}};
    if (!snapshot.empty()) {
        std::string problem;
        try {
            state = json::parse(snapshot);
        } catch (const json::parse_error& e) {
            problem = e.what();
        }
        if (problem.empty() &&
            (!state.is_object() || !state.contains("turns") ||
             !state["turns"].is_number_unsigned() || !state.contains("history") ||
             !state["history"].is_array())) {
            problem = "unexpected snapshot shape";
        }
        if (!problem.empty()) {
            return Error{ErrorCategory::Corrupt,
                         "Session snapshot is unreadable: " + problem,
                         "snapshot_unreadable", "Start a fresh session with --new."};
        }
    }

    const std::uint64_t turn = state.at("turns").get<std::uint64_t>() + 1;
    auto& history = state["history"];
    const std::string reply = compose_reply(text, turn, history.size());

    history.push_back({{"role", "user"}, {"content", text}});
    history.push_back({{"role", "assistant"}, {"content", reply}});
    while (history.size() > history_limit_) {
        history.erase(history.begin());
    }
    state["turns"] = turn;

    TurnOutcome outcome;
    outcome.reply = reply;
    outcome.events.push_back(TurnEvent{EntryKind::Output, reply});
    outcome.events.push_back(
        TurnEvent{EntryKind::System, "turn " + std::to_string(turn) + " complete"});
    try {
        outcome.next_snapshot = state.dump();
    } catch (const json::type_error& e) {
        return Error{ErrorCategory::Internal,
                     std::string("Unable to encode session snapshot: ") + e.what(),
                     "snapshot_encode_failed"};
    }
    return outcome;
}

}  // namespace waypoint::runtime
