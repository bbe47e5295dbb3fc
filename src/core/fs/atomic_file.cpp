#include "core/fs/atomic_file.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include "core/config/session_id.hpp"

namespace waypoint::core::fs {

using core::errors::Error;
using core::errors::ErrorCategory;

std::string errno_message(const int err) {
    return std::strerror(err);
}

bool write_all(const int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n =
            ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

core::errors::Result<std::filesystem::path> write_temp_file(
    const std::filesystem::path& target, const std::string& content,
    const bool sync) {
    const auto dir = target.parent_path();
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to create directory: " + dir.string() + " (" +
                         ec.message() + ")",
                     "dir_create_failed"};
    }

    const auto temp_path =
        dir / ("." + target.filename().string() + ".tmp-" +
               core::config::random_hex(8));
    const int fd = ::open(temp_path.c_str(),
                          O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to create temp file: " + temp_path.string() +
                         " (" + errno_message(errno) + ")",
                     "temp_create_failed"};
    }

    bool ok = write_all(fd, content);
    int saved_errno = errno;
    if (ok && sync && ::fsync(fd) != 0) {
        ok = false;
        saved_errno = errno;
    }
    if (::close(fd) != 0 && ok) {
        ok = false;
        saved_errno = errno;
    }
    if (!ok) {
        static_cast<void>(::unlink(temp_path.c_str()));
        return Error{ErrorCategory::IOFailure,
                     "Unable to write temp file: " + temp_path.string() +
                         " (" + errno_message(saved_errno) + ")",
                     "temp_write_failed"};
    }
    return temp_path;
}

core::errors::Result<std::filesystem::path> sync_directory(
    const std::filesystem::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to open directory for sync: " + dir.string() +
                         " (" + errno_message(errno) + ")",
                     "dir_sync_failed"};
    }
    const int rc = ::fsync(fd);
    const int saved_errno = errno;
    static_cast<void>(::close(fd));
    if (rc != 0) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to sync directory: " + dir.string() + " (" +
                         errno_message(saved_errno) + ")",
                     "dir_sync_failed"};
    }
    return dir;
}

core::errors::Result<std::filesystem::path> write_file_atomically(
    const std::filesystem::path& target, const std::string& content,
    const bool sync) {
    auto temp_result = write_temp_file(target, content, sync);
    if (core::errors::is_error(temp_result)) {
        return core::errors::get_error(temp_result);
    }
    const auto temp_path = core::errors::get_value(temp_result);

    if (::rename(temp_path.c_str(), target.c_str()) != 0) {
        const int saved_errno = errno;
        static_cast<void>(::unlink(temp_path.c_str()));
        return Error{ErrorCategory::IOFailure,
                     "Unable to replace file: " + target.string() + " (" +
                         errno_message(saved_errno) + ")",
                     "atomic_rename_failed"};
    }

    if (sync) {
        auto dir_sync = sync_directory(target.parent_path());
        if (core::errors::is_error(dir_sync)) {
            return core::errors::get_error(dir_sync);
        }
    }
    return target;
}

core::errors::Result<std::string> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to stat file: " + path.string() + " (" +
                         ec.message() + ")",
                     "stat_failed"};
    }
    if (!exists) {
        return Error{ErrorCategory::NotFound,
                     "File does not exist: " + path.string(), "file_not_found"};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to open file: " + path.string(), "open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCategory::IOFailure,
                     "Unable to read file: " + path.string(), "read_failed"};
    }
    return buffer.str();
}

}  // namespace waypoint::core::fs
