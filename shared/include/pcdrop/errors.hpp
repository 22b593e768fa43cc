#pragma once

#include <stdexcept>
#include <string>

namespace pcdrop {

enum class ErrorKind {
    PathEscape,
    NotFound,
    IsADirectory,
    NotADirectory,
    IOError,
    DiskFull,
    PortUnavailable,
    NoInterface,
    AlreadyRunning,
    OversizeUpload,
    BadRequest,
    ConnectionClosed,
    InvalidConfig
};

// short snake_case code used as the prefix of what() and in JSON error bodies
const char *error_code(const ErrorKind &kind);

// HTTP status a per-request error maps to at the server boundary
int http_status(const ErrorKind &kind);

class TransferError : public std::runtime_error {
public:
    TransferError(const ErrorKind &kind, const std::string &message);

    ErrorKind kind() const noexcept { return this->error_kind; }
    const std::string &message() const noexcept { return this->text; }

private:
    ErrorKind error_kind;
    std::string text;
};

} // namespace pcdrop
