#include "geodata/error.hpp"

namespace geodata {

GeoNotAuthorizedError::GeoNotAuthorizedError(const std::string& msg)
    : GeoApiError(error::NotAuthorized, msg) {}

GeoNoSuchRecordError::GeoNoSuchRecordError(const std::string& msg)
    : GeoApiError(error::NoSuch, msg) {}

GeoUnsupportedOperationError::GeoUnsupportedOperationError(const std::string& msg)
    : GeoApiError(error::BadRequest, msg) {}

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotAuthorized:        return "not_authorized";
        case ErrorKind::NoSuchRecord:         return "no_such_record";
        case ErrorKind::UnsupportedOperation: return "unsupported_operation";
        case ErrorKind::MalformedResponse:    return "malformed_response";
        case ErrorKind::Transport:            return "transport";
        case ErrorKind::InvalidRequest:       return "invalid_request";
        case ErrorKind::Service:              return "service";
    }
    return "service";
}

std::exception_ptr make_api_error(int code, const std::string& message) {
    switch (code) {
        case error::NotAuthorized:
            return std::make_exception_ptr(GeoNotAuthorizedError(message));
        case error::NoSuch:
            return std::make_exception_ptr(GeoNoSuchRecordError(message));
        default:
            return std::make_exception_ptr(GeoApiError(code, message));
    }
}

ErrorKind error_kind(std::exception_ptr error) {
    if (!error) {
        throw std::invalid_argument("error_kind: no exception stored");
    }
    try {
        std::rethrow_exception(error);
    } catch (const GeoError& e) {
        return e.kind();
    }
}

} // namespace geodata
