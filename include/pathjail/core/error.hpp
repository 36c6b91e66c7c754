/*
 * pathjail C++17 - Error taxonomy and result types
 *
 * Every fallible operation returns a Result<T> (or Status). Failures carry
 * an ErrorKind plus an internal detail string. The detail may name absolute
 * paths and is meant for the server log only; untrusted callers get the
 * redacted view from public_message() / to_public_json().
 */
#ifndef pathjail_CORE_ERROR_HPP
#define pathjail_CORE_ERROR_HPP

#include "json.hpp"
#include <string>
#include <utility>

namespace pathjail {

enum class ErrorKind {
    InvalidPath,
    AbsolutePathRejected,
    TraversalRejected,
    SymbolicLinkRejected,
    NotFound,
    AlreadyExists,
    NotEmpty,
    IoError,
    OperationForbidden
};

const char* to_string(ErrorKind kind);

// InvalidPath, AbsolutePathRejected, TraversalRejected, SymbolicLinkRejected
bool is_security_violation(ErrorKind kind);

struct SandboxError {
    ErrorKind kind;
    std::string detail;

    SandboxError() : kind(ErrorKind::IoError) {}
    SandboxError(ErrorKind k, const std::string& d) : kind(k), detail(d) {}

    // Safe for display to untrusted callers
    std::string public_message() const;
    int status_code() const;
    Json to_public_json() const;

    // "TraversalRejected: <detail>" for logs
    std::string describe() const;
};

// Map an errno from a failed syscall. ELOOP means a link was refused by
// O_NOFOLLOW and becomes SymbolicLinkRejected.
SandboxError error_from_errno(int err, const std::string& what);

template <typename T>
struct Result {
    bool success;
    T value;
    SandboxError error;

    Result() : success(false), value() {}

    static Result ok(T v) {
        Result r;
        r.success = true;
        r.value = std::move(v);
        return r;
    }

    static Result fail(const SandboxError& e) {
        Result r;
        r.success = false;
        r.error = e;
        return r;
    }

    static Result fail(ErrorKind kind, const std::string& detail) {
        return fail(SandboxError(kind, detail));
    }
};

struct Status {
    bool success;
    SandboxError error;

    Status() : success(false) {}

    static Status ok() {
        Status s;
        s.success = true;
        return s;
    }

    static Status fail(const SandboxError& e) {
        Status s;
        s.error = e;
        return s;
    }

    static Status fail(ErrorKind kind, const std::string& detail) {
        return fail(SandboxError(kind, detail));
    }
};

} // namespace pathjail

#endif // pathjail_CORE_ERROR_HPP
