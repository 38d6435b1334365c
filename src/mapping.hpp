#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace supercast {

/// Map a single episode JSON object into an Episode.
/// Throws std::runtime_error if @p node is not an object.
Episode parseEpisode(const nlohmann::json& node);

/// Accepts either a bare array or a list envelope {"data": [...]}.
/// Throws std::runtime_error if neither shape is present.
std::vector<Episode> parseEpisodeList(const nlohmann::json& body);

} // namespace supercast
