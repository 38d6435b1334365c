#pragma once

#include "logger.hpp"
#include "util.hpp"

#include <optional>
#include <string>

namespace supercast {

/// What is known about one logical request, for logging.
///
/// Never modified once a request is in flight: information from a response
/// goes into a derived copy so a retry still logs what was actually sent.
struct RequestContext {
    std::string                account;
    std::string                apiKey;
    std::string                apiVersion;
    std::optional<std::string> body;          // form-encoded
    std::string                method;
    std::string                path;
    std::optional<std::string> queryParams;   // form-encoded
    std::string                idempotencyKey;

    /// Copy with account / API version / idempotency key taken from the
    /// Supercast-Account, Supercast-Version and Idempotency-Key headers that
    /// are present.  A null @p headers returns an unchanged copy.
    RequestContext derivedFromResponseHeaders(const Headers* headers) const;
};

} // namespace supercast
