#pragma once

#include "transport.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace supercast {

/// A decoded API response.  Built once from a transport result.
struct Response {
    unsigned int   httpStatus = 0;
    Headers        httpHeaders;
    std::string    httpBody;
    nlohmann::json data;

    /// Decode @p result's body as JSON.
    /// @throws nlohmann::json::parse_error when the body is not valid JSON.
    static Response fromHttpResult(const HttpResult& result);
};

} // namespace supercast
