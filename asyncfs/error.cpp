#include "asyncfs/error.h"
#include <cerrno>
#include <cstring>

namespace asyncfs {

ErrorCode code_from_errno(int err) {
    switch (err) {
        case ENOENT: return ErrorCode::NotFound;
        case EEXIST: return ErrorCode::AlreadyExists;
        case EACCES:
        case EPERM: return ErrorCode::PermissionDenied;
        case ENOTDIR: return ErrorCode::NotADirectory;
        case EISDIR: return ErrorCode::IsADirectory;
        case EBADF: return ErrorCode::InvalidHandle;
        case EINVAL:
        case ENAMETOOLONG: return ErrorCode::InvalidArgument;
        case EINTR: return ErrorCode::Interrupted;
        default: return ErrorCode::IOError;
    }
}

const char *code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::NotADirectory: return "NotADirectory";
        case ErrorCode::IsADirectory: return "IsADirectory";
        case ErrorCode::InvalidHandle: return "InvalidHandle";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::Interrupted: return "Interrupted";
        case ErrorCode::IOError: return "IOError";
    }
    return "IOError";
}

Error Error::from_errno(int err, const std::string& syscall, const std::string& path, const std::string& dest) {
    Error e;
    e.code = code_from_errno(err);
    e.sys_errno = err;
    e.syscall = syscall;
    e.path = path;
    e.dest = dest;
    return e;
}

Error Error::make(ErrorCode code, const std::string& syscall, const std::string& path) {
    Error e;
    e.code = code;
    e.syscall = syscall;
    e.path = path;
    return e;
}

std::string Error::message() const {
    std::string msg = code_name(code);
    msg += ": ";
    if (sys_errno != 0) {
        msg += std::strerror(sys_errno);
    } else if (code == ErrorCode::InvalidHandle) {
        msg += "invalid handle";
    } else if (code == ErrorCode::InvalidArgument) {
        msg += "invalid argument";
    } else {
        msg += "operation failed";
    }
    if (!syscall.empty()) msg += ", " + syscall;
    if (!path.empty()) msg += " '" + path + "'";
    if (!dest.empty()) msg += " -> '" + dest + "'";
    return msg;
}

FsException::FsException(Error err)
    : std::runtime_error(err.message()), error_(std::move(err)) {}

} // namespace asyncfs
