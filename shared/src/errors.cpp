#include "pcdrop/errors.hpp"

namespace pcdrop {

const char *error_code(const ErrorKind &kind) {
    switch (kind) {
        case ErrorKind::PathEscape:       return "path_escape";
        case ErrorKind::NotFound:         return "not_found";
        case ErrorKind::IsADirectory:     return "is_directory";
        case ErrorKind::NotADirectory:    return "not_directory";
        case ErrorKind::IOError:          return "io_error";
        case ErrorKind::DiskFull:         return "disk_full";
        case ErrorKind::PortUnavailable:  return "port_unavailable";
        case ErrorKind::NoInterface:      return "no_interface";
        case ErrorKind::AlreadyRunning:   return "already_running";
        case ErrorKind::OversizeUpload:   return "oversize_upload";
        case ErrorKind::BadRequest:       return "bad_request";
        case ErrorKind::ConnectionClosed: return "connection_closed";
        case ErrorKind::InvalidConfig:    return "invalid_config";
    }
    return "unknown";
}

int http_status(const ErrorKind &kind) {
    switch (kind) {
        case ErrorKind::PathEscape:
        case ErrorKind::BadRequest:
        case ErrorKind::IsADirectory:
        case ErrorKind::NotADirectory:
            return 400;
        case ErrorKind::NotFound:
            return 404;
        case ErrorKind::OversizeUpload:
            return 413;
        default:
            return 500;
    }
}

TransferError::TransferError(const ErrorKind &kind, const std::string &message)
    : std::runtime_error(std::string(error_code(kind)) + ": " + message), error_kind(kind), text(message) {}

} // namespace pcdrop
