#include "request_context.hpp"

namespace supercast {

RequestContext RequestContext::derivedFromResponseHeaders(const Headers* headers) const {
    RequestContext context = *this;
    if (headers == nullptr) {
        return context;
    }

    auto overwrite = [headers](const char* name, std::string& field) {
        auto it = headers->find(name);
        if (it != headers->end()) {
            field = it->second;
        }
    };

    overwrite("Supercast-Account", context.account);
    overwrite("Supercast-Version", context.apiVersion);
    overwrite("Idempotency-Key",   context.idempotencyKey);
    return context;
}

} // namespace supercast
