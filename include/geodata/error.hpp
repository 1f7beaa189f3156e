#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace geodata {

enum class ErrorKind {
    NotAuthorized,
    NoSuchRecord,
    UnsupportedOperation,
    MalformedResponse,
    Transport,
    InvalidRequest,
    Service
};

std::string error_kind_to_string(ErrorKind kind);

class GeoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    [[nodiscard]] virtual ErrorKind kind() const noexcept = 0;
};

/// Error reported by the service (or raised on its behalf) with a status code.
class GeoApiError : public GeoError {
public:
    int code;
    GeoApiError(int code, const std::string& msg)
        : GeoError(msg), code(code) {}

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::Service; }
};

class GeoNotAuthorizedError : public GeoApiError {
public:
    explicit GeoNotAuthorizedError(const std::string& msg);

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::NotAuthorized; }
};

class GeoNoSuchRecordError : public GeoApiError {
public:
    explicit GeoNoSuchRecordError(const std::string& msg);

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::NoSuchRecord; }
};

/// Handler/operation combination rejected before any request is sent.
class GeoUnsupportedOperationError : public GeoApiError {
public:
    explicit GeoUnsupportedOperationError(const std::string& msg);

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::UnsupportedOperation; }
};

class GeoMalformedResponseError : public GeoError {
public:
    using GeoError::GeoError;

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::MalformedResponse; }
};

class GeoTransportError : public GeoError {
public:
    using GeoError::GeoError;

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::Transport; }
};

/// Request could not be built from the caller's input (missing layer or ids).
class GeoInvalidRequestError : public GeoError {
public:
    using GeoError::GeoError;

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::InvalidRequest; }
};

/// Thrown by request signers. The dispatcher turns it into GeoNotAuthorizedError.
class GeoSigningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace error {
    constexpr int BadRequest    = 400;
    constexpr int NotAuthorized = 401;
    constexpr int NoSuch        = 404;
} // namespace error

/// Build the typed error matching a service-declared status code.
[[nodiscard]] std::exception_ptr make_api_error(int code, const std::string& message);

/// Classify a stored failure. Exceptions outside the GeoError hierarchy are
/// rethrown.
[[nodiscard]] ErrorKind error_kind(std::exception_ptr error);

} // namespace geodata
