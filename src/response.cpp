#include "response.hpp"

namespace supercast {

Response Response::fromHttpResult(const HttpResult& result) {
    Response response;
    response.data        = nlohmann::json::parse(result.body);
    response.httpStatus  = result.status;
    response.httpHeaders = result.headers;
    response.httpBody    = result.body;
    return response;
}

} // namespace supercast
