#pragma once
#include <random>
#include <sstream>
#include <string>

namespace waypoint::core::config {

    // Random lowercase hex string of the given length.
    inline std::string random_hex(int digits) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < digits; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Generates a 16-digit hex ID prefixed with "sess-"
    inline std::string generate_session_id() {
        return "sess-" + random_hex(16);
    }

    // Identifies one lock holder (one process, or one simulated process in tests).
    inline std::string generate_holder_token() {
        return "holder-" + random_hex(16);
    }

} // namespace waypoint::core::config
