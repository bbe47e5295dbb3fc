#pragma once

#include <cstddef>
#include <string>
#include "runtime/turn_processor.hpp"

namespace waypoint::runtime {

// Deterministic stand-in for a model backend. Keeps a bounded message history
// in a JSON snapshot and answers each prompt without external calls.
class EchoTurnProcessor : public TurnProcessor {
public:
    explicit EchoTurnProcessor(std::size_t history_limit = 20);

    core::errors::Result<TurnOutcome> process(const std::string& snapshot,
                                              const std::string& prompt) override;

private:
    std::size_t history_limit_;
};

}  // namespace waypoint::runtime
