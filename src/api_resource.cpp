#include "api_resource.hpp"
#include "mapping.hpp"

namespace supercast {

std::pair<nlohmann::json, Response>
ApiResource::request(const std::string& method,
                     const std::string& path,
                     const nlohmann::json& params,
                     RequestOptions options) {
    options.params = params;
    Response response = Client::activeClient().executeRequest(method, path, options);
    nlohmann::json data = response.data;
    return {std::move(data), std::move(response)};
}

// ---------------------------------------------------------------------------
// Episodes
// ---------------------------------------------------------------------------

std::string Episodes::resourcePath(std::int64_t id) {
    return std::string(kPath) + "/" + std::to_string(id);
}

std::vector<Episode> Episodes::list(const nlohmann::json& params,
                                    const RequestOptions& options) {
    return parseEpisodeList(ApiResource::request("get", kPath, params, options).first);
}

Episode Episodes::retrieve(std::int64_t id, const RequestOptions& options) {
    return parseEpisode(ApiResource::request("get", resourcePath(id),
                                             nlohmann::json::object(), options).first);
}

Episode Episodes::create(const nlohmann::json& params, const RequestOptions& options) {
    return parseEpisode(ApiResource::request("post", kPath, params, options).first);
}

Episode Episodes::update(std::int64_t id, const nlohmann::json& params,
                         const RequestOptions& options) {
    return parseEpisode(ApiResource::request("patch", resourcePath(id),
                                             params, options).first);
}

Episode Episodes::destroy(std::int64_t id, const RequestOptions& options) {
    return parseEpisode(ApiResource::request("delete", resourcePath(id),
                                             nlohmann::json::object(), options).first);
}

} // namespace supercast
