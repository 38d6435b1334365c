#include "mapping.hpp"

#include <stdexcept>

namespace supercast {

// Missing, null or non-string fields read as empty.
static std::string stringField(const nlohmann::json& node, const char* name) {
    auto it = node.find(name);
    if (it != node.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

void to_json(nlohmann::json& j, const Episode& episode) {
    j = nlohmann::json{
        {"object",       "episode"},
        {"id",           episode.id},
        {"title",        episode.title},
        {"description",  episode.description},
        {"published_at", episode.publishedAt},
    };
}

Episode parseEpisode(const nlohmann::json& node) {
    if (!node.is_object()) {
        throw std::runtime_error("Episode payload is not an object");
    }

    Episode e;
    auto id = node.find("id");
    if (id != node.end() && id->is_number_integer()) {
        e.id = id->get<std::int64_t>();
    }
    e.title       = stringField(node, "title");
    e.description = stringField(node, "description");
    e.publishedAt = stringField(node, "published_at");   // null for drafts
    return e;
}

std::vector<Episode> parseEpisodeList(const nlohmann::json& body) {
    const nlohmann::json* items = nullptr;

    if (body.is_array()) {
        items = &body;
    } else if (body.is_object() && body.contains("data") && body["data"].is_array()) {
        items = &body["data"];
    } else {
        throw std::runtime_error("Response is not an episode list");
    }

    std::vector<Episode> episodes;
    episodes.reserve(items->size());
    for (const auto& node : *items) {
        episodes.push_back(parseEpisode(node));
    }
    return episodes;
}

} // namespace supercast
