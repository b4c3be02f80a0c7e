#pragma once
#include <stdexcept>
#include <string>
#include <system_error>

namespace teamfs {

enum class ErrorCode {
    NotFound,
    AlreadyExists,
    InvalidName,
    InvalidArgument,
    LockTimeout,
    CycleDetected,
    UnknownTask,
    InvalidTransition,
    TeammatesActive,
    IOError,
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:          return "NotFound";
        case ErrorCode::AlreadyExists:     return "AlreadyExists";
        case ErrorCode::InvalidName:       return "InvalidName";
        case ErrorCode::InvalidArgument:   return "InvalidArgument";
        case ErrorCode::LockTimeout:       return "LockTimeout";
        case ErrorCode::CycleDetected:     return "CycleDetected";
        case ErrorCode::UnknownTask:       return "UnknownTask";
        case ErrorCode::InvalidTransition: return "InvalidTransition";
        case ErrorCode::TeammatesActive:   return "TeammatesActive";
        case ErrorCode::IOError:           return "IOError";
    }
    return "Unknown";
}

// Every failure the store reports. what() is the human-readable detail,
// code() the category the boundary layer maps to its own conventions.
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }
    const char* code_name() const { return error_code_name(code_); }

    // Lock timeouts leave no side effects, so the caller may simply retry.
    bool retryable() const { return code_ == ErrorCode::LockTimeout; }

private:
    ErrorCode code_;
};

// Wraps a failed system call; the OS error text is passed through as-is.
inline StoreError io_error(const std::string& what, const std::error_code& ec) {
    return StoreError(ErrorCode::IOError, what + ": " + ec.message());
}

inline StoreError io_error_errno(const std::string& what, int err) {
    return io_error(what, std::error_code(err, std::generic_category()));
}

} // namespace teamfs
