#pragma once

// ============================================================
// errors.hpp -- Error taxonomy shared by the store and the wire
// ============================================================

#include "platform.hpp"
#include <stdexcept>
#include <string>

// Numeric values travel in ErrorMsg.error_code; keep them stable.
enum class ErrorKind : u32 {
    INVALID_ARGUMENT = 1,  // missing or malformed input
    NOT_FOUND        = 2,  // unknown session/stream, or a chunk absent during merge
    IO_FAILURE       = 3,  // storage read/write error
};

inline const char* error_kind_str(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorKind::NOT_FOUND:        return "NotFound";
        case ErrorKind::IO_FAILURE:       return "IOFailure";
    }
    return "Unknown";
}

class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

inline StoreError invalid_argument(const std::string& msg) {
    return StoreError(ErrorKind::INVALID_ARGUMENT, msg);
}

inline StoreError not_found(const std::string& msg) {
    return StoreError(ErrorKind::NOT_FOUND, msg);
}

inline StoreError io_failure(const std::string& msg) {
    return StoreError(ErrorKind::IO_FAILURE, msg);
}
