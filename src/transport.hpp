#pragma once

#include "util.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

namespace supercast {

/// Why an attempt did not yield a usable result.
/// Every consumer switches over this exhaustively.
enum class FailureKind {
    Timeout,            // open or read deadline expired
    ConnectionFailed,   // refused, reset, DNS, broken pipe
    TlsFailure,         // handshake or certificate verification
    HttpStatus,         // a complete response with a non-2xx status
    DecodeFailure,      // a response body that is not valid JSON
    Other,
};

const char* toString(FailureKind kind);

/// One fully-built HTTP request as handed to a Transport.
struct HttpRequest {
    std::string method;   // upper-case: "GET", "POST", ...
    std::string url;      // absolute, query string already encoded
    Headers     headers;
    std::string body;     // form-encoded or multipart; empty for GET/HEAD/DELETE

    std::chrono::milliseconds openTimeout{30000};
    std::chrono::milliseconds readTimeout{80000};
};

/// Canonical response shape produced at the transport boundary,
/// whatever the status code.
struct HttpResult {
    unsigned int status = 0;
    Headers      headers;
    std::string  body;
};

/// Thrown by a Transport when no HTTP response was obtained.
class TransportError : public std::runtime_error {
public:
    TransportError(FailureKind kind, const std::string& message)
        : std::runtime_error(message), mKind(kind) {}

    FailureKind kind() const { return mKind; }

private:
    FailureKind mKind;
};

/// Sends requests over a (possibly persistent) connection.
/// Implementations are not thread-safe; use one per thread.
class Transport {
public:
    Transport() = default;
    virtual ~Transport() = default;
    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    /// Return the response for any status code.
    /// @throws TransportError when the exchange failed before a response.
    virtual HttpResult perform(const HttpRequest& request) = 0;
};

} // namespace supercast
