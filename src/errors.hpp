#pragma once

#include "response.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace supercast {

enum class ErrorKind {
    Authentication,
    Permission,
    InvalidRequest,
    RateLimit,
    GenericApi,
    ApiConnection,
};

const char* toString(ErrorKind kind);

/// HTTP metadata attached to an error when a response was received.
struct ErrorDetails {
    unsigned int   httpStatus = 0;
    Headers        httpHeaders;
    std::string    httpBody;
    nlohmann::json jsonBody;
    int            code = 0;
};

/// Root of every error the library raises.
///
/// Errors are produced as std::unique_ptr<SupercastError> by the classifier
/// and thrown with raise(), which throws the most-derived type.
class SupercastError : public std::runtime_error {
public:
    explicit SupercastError(const std::string& message, ErrorDetails details = {});
    ~SupercastError() override = default;

    virtual ErrorKind kind() const = 0;
    [[noreturn]] virtual void raise() const = 0;

    const std::string&    message()     const { return mMessage; }
    unsigned int          httpStatus()  const { return mDetails.httpStatus; }
    const Headers&        httpHeaders() const { return mDetails.httpHeaders; }
    const std::string&    httpBody()    const { return mDetails.httpBody; }
    const nlohmann::json& jsonBody()    const { return mDetails.jsonBody; }
    int                   code()        const { return mDetails.code; }

    /// The response that triggered the error, when there was one.
    const std::optional<Response>& response() const { return mResponse; }
    void setResponse(Response response) { mResponse = std::move(response); }

    /// "(Status 404) No such episode" or just the message without a status.
    std::string toString() const;

private:
    std::string             mMessage;
    ErrorDetails            mDetails;
    std::optional<Response> mResponse;
};

/// Any non-2xx response without a more specific class, or an
/// undecodable response body.
class ApiError : public SupercastError {
public:
    using SupercastError::SupercastError;
    ErrorKind kind() const override { return ErrorKind::GenericApi; }
    [[noreturn]] void raise() const override { throw *this; }
};

/// Missing or malformed API key, or HTTP 401.
class AuthenticationError : public ApiError {
public:
    using ApiError::ApiError;
    ErrorKind kind() const override { return ErrorKind::Authentication; }
    [[noreturn]] void raise() const override { throw *this; }
};

/// HTTP 403.
class PermissionError : public ApiError {
public:
    using ApiError::ApiError;
    ErrorKind kind() const override { return ErrorKind::Permission; }
    [[noreturn]] void raise() const override { throw *this; }
};

/// HTTP 400, 404, 422.
class InvalidRequestError : public ApiError {
public:
    using ApiError::ApiError;
    ErrorKind kind() const override { return ErrorKind::InvalidRequest; }
    [[noreturn]] void raise() const override { throw *this; }
};

/// HTTP 429.
class RateLimitError : public ApiError {
public:
    using ApiError::ApiError;
    ErrorKind kind() const override { return ErrorKind::RateLimit; }
    [[noreturn]] void raise() const override { throw *this; }
};

/// The request never produced a response (timeout, refused, TLS) and
/// retries, if any, were exhausted.
class ApiConnectionError : public SupercastError {
public:
    using SupercastError::SupercastError;
    ErrorKind kind() const override { return ErrorKind::ApiConnection; }
    [[noreturn]] void raise() const override { throw *this; }
};

} // namespace supercast
