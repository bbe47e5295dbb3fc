#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace waypoint::core::config {

    using Clock = std::function<std::int64_t()>;

    inline std::int64_t now_unix_ms() {
        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                            .count();
        return static_cast<std::int64_t>(ms);
    }

    inline Clock system_clock() {
        return []() { return now_unix_ms(); };
    }

} // namespace waypoint::core::config
