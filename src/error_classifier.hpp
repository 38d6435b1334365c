#pragma once

#include "errors.hpp"
#include "response.hpp"
#include "transport.hpp"

#include <memory>
#include <string>

namespace supercast {

/// Build the error for a decoded non-2xx response from its status code:
///   400/404/422 -> InvalidRequestError, 401 -> AuthenticationError,
///   403 -> PermissionError, 429 -> RateLimitError, else ApiError.
/// The message comes from the body's "message" field.
std::unique_ptr<SupercastError> classifyStatus(const Response& response);

/// Decode @p result's body, then classifyStatus().  A body that is not a
/// JSON object yields generalApiError() instead.
std::unique_ptr<SupercastError> classifyResponse(const HttpResult& result);

/// "Invalid response object from API" error carrying the raw status/body.
std::unique_ptr<SupercastError> generalApiError(unsigned int status,
                                                const std::string& body);

/// Map a failure that produced no response to an ApiConnectionError with a
/// remediation hint.  Mentions the retry count when @p numRetries > 0.
std::unique_ptr<SupercastError> classifyNetworkFailure(FailureKind kind,
                                                       const std::string& detail,
                                                       int numRetries,
                                                       const std::string& apiBase);

} // namespace supercast
