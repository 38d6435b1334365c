#pragma once

#include "client.hpp"
#include "models.hpp"
#include "response.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace supercast {

/// Shared entry point for resource classes: runs the call on the active
/// client and returns the decoded data together with the response.
class ApiResource {
public:
    static std::pair<nlohmann::json, Response>
    request(const std::string& method,
            const std::string& path,
            const nlohmann::json& params = nlohmann::json::object(),
            RequestOptions options = {});
};

/// CRUD operations on /episodes.
class Episodes {
public:
    static constexpr const char* kPath = "/episodes";

    static std::vector<Episode> list(const nlohmann::json& params = nlohmann::json::object(),
                                     const RequestOptions& options = {});
    static Episode retrieve(std::int64_t id, const RequestOptions& options = {});
    static Episode create(const nlohmann::json& params, const RequestOptions& options = {});
    static Episode update(std::int64_t id, const nlohmann::json& params,
                          const RequestOptions& options = {});
    static Episode destroy(std::int64_t id, const RequestOptions& options = {});

    static std::string resourcePath(std::int64_t id);
};

} // namespace supercast
