#pragma once

#include <string>
#include <vector>
#include "core/errors/errors.hpp"
#include "protocol/session_record.hpp"

namespace waypoint::runtime {

struct TurnEvent {
    protocol::EntryKind kind = protocol::EntryKind::Output;
    std::string payload;
};

struct TurnOutcome {
    std::vector<TurnEvent> events;
    std::string reply;
    std::string next_snapshot;
};

// Produces the observable events and next snapshot for one unit of work.
// The snapshot format belongs to the processor; the session core stores it
// as opaque bytes.
class TurnProcessor {
public:
    virtual ~TurnProcessor() = default;

    virtual core::errors::Result<TurnOutcome> process(const std::string& snapshot,
                                                      const std::string& prompt) = 0;
};

}  // namespace waypoint::runtime
