#pragma once
#include <string>
#include <utility>
#include <variant>

namespace waypoint::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., invalid CLI flag or a request the store cannot honour
        NotFound,   // E.g., no such session record; caller may start fresh
        Corrupt,    // E.g., truncated record or checksum mismatch
        Busy,       // E.g., lock held by another process
        IOFailure,  // E.g., the store directory is not writable
        Internal    // E.g., logic bug or id allocation failure
    };

    // The standardized error payload
    struct Error {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";  // Actionable tip shown to the user
    };

    // 2. Propagation strategy: a Result holds either a T or an Error.
    template <typename T>
    using Result = std::variant<T, Error>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<Error>(result);
    }

    template <typename T>
    const Error& get_error(const Result<T>& result) {
        return std::get<Error>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Moves the value out; used for move-only values such as open file handles.
    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::NotFound:  return "not_found";
            case ErrorCategory::Corrupt:   return "corrupt";
            case ErrorCategory::Busy:      return "busy";
            case ErrorCategory::IOFailure: return "io_failure";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace waypoint::core::errors
