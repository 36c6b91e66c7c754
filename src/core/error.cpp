#include <pathjail/core/error.hpp>

#include <cerrno>
#include <cstring>

namespace pathjail {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPath: return "InvalidPath";
        case ErrorKind::AbsolutePathRejected: return "AbsolutePathRejected";
        case ErrorKind::TraversalRejected: return "TraversalRejected";
        case ErrorKind::SymbolicLinkRejected: return "SymbolicLinkRejected";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::AlreadyExists: return "AlreadyExists";
        case ErrorKind::NotEmpty: return "NotEmpty";
        case ErrorKind::IoError: return "IoError";
        case ErrorKind::OperationForbidden: return "OperationForbidden";
    }
    return "IoError";
}

bool is_security_violation(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPath:
        case ErrorKind::AbsolutePathRejected:
        case ErrorKind::TraversalRejected:
        case ErrorKind::SymbolicLinkRejected:
            return true;
        default:
            return false;
    }
}

std::string SandboxError::public_message() const {
    if (is_security_violation(kind)) {
        return "access denied";
    }
    switch (kind) {
        case ErrorKind::NotFound: return "no such file or directory";
        case ErrorKind::AlreadyExists: return "already exists";
        case ErrorKind::NotEmpty: return "directory not empty";
        case ErrorKind::OperationForbidden: return "operation not permitted";
        default: return "i/o error, please retry";
    }
}

int SandboxError::status_code() const {
    switch (kind) {
        case ErrorKind::InvalidPath:
        case ErrorKind::AbsolutePathRejected:
        case ErrorKind::TraversalRejected:
        case ErrorKind::SymbolicLinkRejected:
        case ErrorKind::OperationForbidden:
            return 403;
        case ErrorKind::NotFound: return 404;
        case ErrorKind::AlreadyExists:
        case ErrorKind::NotEmpty:
            return 409;
        case ErrorKind::IoError: return 500;
    }
    return 500;
}

Json SandboxError::to_public_json() const {
    Json j;
    j["error"] = public_message();
    // Sandbox kinds collapse to one class so the reason is not revealed
    j["code"] = is_security_violation(kind) ? "AccessDenied" : to_string(kind);
    j["status"] = status_code();
    return j;
}

std::string SandboxError::describe() const {
    if (detail.empty()) return to_string(kind);
    return std::string(to_string(kind)) + ": " + detail;
}

SandboxError error_from_errno(int err, const std::string& what) {
    std::string detail = what + ": " + strerror(err);
    switch (err) {
        case ENOENT:
            return SandboxError(ErrorKind::NotFound, detail);
        case EEXIST:
            return SandboxError(ErrorKind::AlreadyExists, detail);
        case ENOTEMPTY:
            return SandboxError(ErrorKind::NotEmpty, detail);
        case ELOOP:
            return SandboxError(ErrorKind::SymbolicLinkRejected, detail);
        default:
            return SandboxError(ErrorKind::IoError, detail);
    }
}

} // namespace pathjail
