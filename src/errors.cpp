#include "errors.hpp"

namespace supercast {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Authentication: return "authentication_error";
        case ErrorKind::Permission:     return "permission_error";
        case ErrorKind::InvalidRequest: return "invalid_request_error";
        case ErrorKind::RateLimit:      return "rate_limit_error";
        case ErrorKind::GenericApi:     return "api_error";
        case ErrorKind::ApiConnection:  return "api_connection_error";
    }
    return "api_error";
}

SupercastError::SupercastError(const std::string& message, ErrorDetails details)
    : std::runtime_error(message)
    , mMessage(message)
    , mDetails(std::move(details)) {}

std::string SupercastError::toString() const {
    if (mDetails.httpStatus == 0) {
        return mMessage;
    }
    return "(Status " + std::to_string(mDetails.httpStatus) + ") " + mMessage;
}

} // namespace supercast
