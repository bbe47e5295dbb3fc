#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/errors.hpp"
#include "core/logging/logger.hpp"

namespace waypoint::core::config {

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

struct AppConfig {
    std::int64_t lock_staleness_ms = 15 * 60 * 1000;
    // The per-project guard is only held while a session is being opened.
    std::int64_t guard_staleness_ms = 30 * 1000;
    bool sync_writes = true;
    logging::LogLevel log_level = logging::LogLevel::INFO;
    std::size_t history_limit = 20;
};

inline constexpr const char* kStoreDirName = ".waypoint";
inline constexpr const char* kConfigFileName = "config.json";

// Overlays the keys present in a JSON document on `base`. Unknown keys are
// ignored; a wrongly typed or out-of-range value is an Input error.
core::errors::Result<AppConfig> apply_json(AppConfig base,
                                           const std::string& json_text,
                                           const std::string& source);

core::errors::Result<AppConfig> load_from_file(
    const std::filesystem::path& path, AppConfig base = {});

// WAYPOINT_LOCK_STALENESS_MS and WAYPOINT_LOG_LEVEL.
core::errors::Result<AppConfig> apply_environment(AppConfig base,
                                                  const EnvLookup& lookup);

EnvLookup process_environment();

// <project>/.waypoint unless an explicit store root was given.
std::filesystem::path resolve_store_root(
    const std::filesystem::path& project_path,
    const std::optional<std::filesystem::path>& explicit_root);

}  // namespace waypoint::core::config
