#pragma once

#include <filesystem>
#include <string>
#include "core/errors/errors.hpp"

namespace waypoint::core::fs {

// Writes `content` to a temp file beside `target`, fsyncs it, renames it over
// `target` and fsyncs the directory. Readers see the old or the new file,
// never a mix. With `sync` false the fsync calls are skipped.
core::errors::Result<std::filesystem::path> write_file_atomically(
    const std::filesystem::path& target, const std::string& content,
    bool sync = true);

// Writes `content` to a new temp file beside `target` and returns its path
// without publishing it. Used where publication must be link()/rename() by
// the caller.
core::errors::Result<std::filesystem::path> write_temp_file(
    const std::filesystem::path& target, const std::string& content,
    bool sync = true);

core::errors::Result<std::filesystem::path> sync_directory(
    const std::filesystem::path& dir);

// NotFound when the file does not exist, IOFailure on any other error.
core::errors::Result<std::string> read_file(const std::filesystem::path& path);

// Loops over partial writes; returns false and leaves errno set on failure.
bool write_all(int fd, const std::string& data);

std::string errno_message(int err);

}  // namespace waypoint::core::fs
