#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace supercast {

/// Mirrors the Supercast Episode resource (fields used by the bindings).
struct Episode {
    std::int64_t id = 0;
    std::string  title;
    std::string  description;
    std::string  publishedAt;   // ISO-8601, empty when unpublished
};

/// Resource form: {"object": "episode", "id": ..., ...}.  Passing an Episode
/// as a request parameter therefore sends just its id (see objectsToIds).
void to_json(nlohmann::json& j, const Episode& episode);

} // namespace supercast
