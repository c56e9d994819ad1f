#pragma once

#include <stdexcept>
#include <string>

namespace cw::error {

enum class ErrorKind {
    NotFound,
    PermissionDenied,
    InvalidArgument,
    Conflict,
    StorageFailure
};

std::string to_string(ErrorKind kind);

// Precise failure kinds surfaced to the service layer. Mapping PermissionDenied and
// NotFound onto a non-revealing response is the boundary's job, not ours.
class Error : public std::runtime_error {
public:
    Error(const ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class NotFound : public Error {
public:
    explicit NotFound(const std::string& what) : Error(ErrorKind::NotFound, what) {}
};

class PermissionDenied : public Error {
public:
    explicit PermissionDenied(const std::string& what) : Error(ErrorKind::PermissionDenied, what) {}
};

class InvalidArgument : public Error {
public:
    explicit InvalidArgument(const std::string& what) : Error(ErrorKind::InvalidArgument, what) {}
};

class Conflict : public Error {
public:
    explicit Conflict(const std::string& what) : Error(ErrorKind::Conflict, what) {}
};

class StorageFailure : public Error {
public:
    explicit StorageFailure(const std::string& what) : Error(ErrorKind::StorageFailure, what) {}
};

}
