#include "error/Error.hpp"

std::string cw::error::to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::PermissionDenied: return "permission_denied";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::StorageFailure: return "storage_failure";
        default: throw std::invalid_argument("Unknown ErrorKind enum value");
    }
}
