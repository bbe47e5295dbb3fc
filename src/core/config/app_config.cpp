#include "core/config/app_config.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>
#include <nlohmann/json.hpp>
#include "core/fs/atomic_file.hpp"

namespace waypoint::core::config {

using core::errors::Error;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

Error invalid_value(const std::string& source, const std::string& key,
                    const std::string& expected) {
    return Error{ErrorCategory::Input,
                 "Invalid value for '" + key + "' in " + source,
                 "invalid_config_value", "Expected " + expected + "."};
}

}  // namespace

core::errors::Result<AppConfig> apply_json(AppConfig base,
                                           const std::string& json_text,
                                           const std::string& source) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Error{ErrorCategory::Input,
                     "Config is not valid JSON: " + source + " (" + e.what() +
                         ")",
                     "invalid_config"};
    }
    if (!doc.is_object()) {
        return Error{ErrorCategory::Input,
                     "Config must be a JSON object: " + source,
                     "invalid_config"};
    }

    if (doc.contains("lock_staleness_ms")) {
        const auto& value = doc.at("lock_staleness_ms");
        if (!value.is_number_integer() || value.get<std::int64_t>() <= 0) {
            return invalid_value(source, "lock_staleness_ms",
                                 "a positive integer");
        }
        base.lock_staleness_ms = value.get<std::int64_t>();
    }
    if (doc.contains("guard_staleness_ms")) {
        const auto& value = doc.at("guard_staleness_ms");
        if (!value.is_number_integer() || value.get<std::int64_t>() <= 0) {
            return invalid_value(source, "guard_staleness_ms",
                                 "a positive integer");
        }
        base.guard_staleness_ms = value.get<std::int64_t>();
    }
    if (doc.contains("sync_writes")) {
        const auto& value = doc.at("sync_writes");
        if (!value.is_boolean()) {
            return invalid_value(source, "sync_writes", "true or false");
        }
        base.sync_writes = value.get<bool>();
    }
    if (doc.contains("log_level")) {
        const auto& value = doc.at("log_level");
        const auto level = value.is_string()
                               ? logging::parse_level(value.get<std::string>())
                               : std::nullopt;
        if (!level.has_value()) {
            return invalid_value(source, "log_level",
                                 "one of debug, info, warn, error");
        }
        base.log_level = level.value();
    }
    if (doc.contains("history_limit")) {
        const auto& value = doc.at("history_limit");
        if (!value.is_number_unsigned() || value.get<std::size_t>() == 0) {
            return invalid_value(source, "history_limit", "a positive integer");
        }
        base.history_limit = value.get<std::size_t>();
    }
    return base;
}

core::errors::Result<AppConfig> load_from_file(const std::filesystem::path& path,
                                               AppConfig base) {
    auto text = core::fs::read_file(path);
    if (core::errors::is_error(text)) {
        return core::errors::get_error(text);
    }
    return apply_json(std::move(base), core::errors::get_value(text),
                      path.string());
}

core::errors::Result<AppConfig> apply_environment(AppConfig base,
                                                  const EnvLookup& lookup) {
    if (const auto staleness = lookup("WAYPOINT_LOCK_STALENESS_MS")) {
        std::int64_t value = 0;
        const char* begin = staleness->data();
        const char* end = staleness->data() + staleness->size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end || value <= 0) {
            return invalid_value("environment", "WAYPOINT_LOCK_STALENESS_MS",
                                 "a positive integer");
        }
        base.lock_staleness_ms = value;
    }
    if (const auto level_text = lookup("WAYPOINT_LOG_LEVEL")) {
        const auto level = logging::parse_level(level_text.value());
        if (!level.has_value()) {
            return invalid_value("environment", "WAYPOINT_LOG_LEVEL",
                                 "one of debug, info, warn, error");
        }
        base.log_level = level.value();
    }
    return base;
}

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::filesystem::path resolve_store_root(
    const std::filesystem::path& project_path,
    const std::optional<std::filesystem::path>& explicit_root) {
    std::error_code ec;
    if (explicit_root.has_value()) {
        auto absolute = std::filesystem::absolute(explicit_root.value(), ec);
        if (ec) {
            return explicit_root.value();
        }
        return absolute.lexically_normal();
    }
    return project_path / kStoreDirName;
}

}  // namespace waypoint::core::config
