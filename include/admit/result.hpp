#pragma once

#include <string>
#include <utility>

namespace admit {

// Failure taxonomy. Expected rejections are carried by ValidationVerdict;
// a failed Result always means the operation itself did not complete.
enum class ErrorKind {
    None,
    PolicyViolation,
    StructuralViolation,
    ResourceExceeded,
    HeuristicFlag,
    ConcurrencyConflict,
    StorageFailure,
    NotFound,
    InvalidArgument,
    ConfigError,
};

const char* ToString(ErrorKind kind);

struct Result {
    bool ok = true;
    int code = 0;
    std::string msg;
    ErrorKind kind = ErrorKind::None;

    static Result Ok() { return {}; }

    static Result Fail(int code, std::string msg, ErrorKind kind = ErrorKind::StorageFailure) {
        Result r;
        r.ok = false;
        r.code = code;
        r.msg = std::move(msg);
        r.kind = kind;
        return r;
    }

    bool is_ok() const { return ok; }

    // StorageFailure is the only kind a caller may retry blindly.
    bool retryable() const { return !ok && kind == ErrorKind::StorageFailure; }
};

} // namespace admit
