#ifndef ASYNCFS_ERROR_H
#define ASYNCFS_ERROR_H

#include <stdexcept>
#include <string>

namespace asyncfs {

enum class ErrorCode {
    NotFound,
    AlreadyExists,
    PermissionDenied,
    NotADirectory,
    IsADirectory,
    InvalidHandle,
    InvalidArgument,
    Interrupted,
    IOError
};

ErrorCode code_from_errno(int err);
const char *code_name(ErrorCode code);

// Failure of one filesystem call. sys_errno is 0 when the error did not
// come from the OS (e.g. a stale handle caught by the handle table).
struct Error {
    ErrorCode code = ErrorCode::IOError;
    int sys_errno = 0;
    std::string syscall;
    std::string path;
    std::string dest;

    static Error from_errno(int err, const std::string& syscall, const std::string& path = "",
                            const std::string& dest = "");
    static Error make(ErrorCode code, const std::string& syscall, const std::string& path = "");

    std::string message() const;
};

class FsException : public std::runtime_error {
public:
    explicit FsException(Error err);
    const Error& error() const { return error_; }

private:
    Error error_;
};

} // namespace asyncfs

#endif
