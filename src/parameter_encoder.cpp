#include "parameter_encoder.hpp"
#include "util.hpp"

#include <stdexcept>

namespace supercast {

static nlohmann::json collapseResources(const nlohmann::json& value) {
    if (value.is_object()) {
        auto tag = value.find("object");
        auto id  = value.find("id");
        if (tag != value.end() && tag->is_string() && id != value.end()) {
            return *id;
        }

        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = collapseResources(it.value());
        }
        return out;
    }

    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& element : value) {
            out.push_back(collapseResources(element));
        }
        return out;
    }

    return value;
}

nlohmann::json objectsToIds(const nlohmann::json& params) {
    // The parameter set itself is a container, never a reference.
    if (!params.is_object()) {
        return collapseResources(params);
    }

    nlohmann::json out = nlohmann::json::object();
    for (auto it = params.begin(); it != params.end(); ++it) {
        out[it.key()] = collapseResources(it.value());
    }
    return out;
}

static std::string scalarToString(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return "";
        case nlohmann::json::value_t::string:
            return value.get<std::string>();
        case nlohmann::json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        default:
            // numbers (and binary, which never appears in parameters)
            return value.dump();
    }
}

static void flattenInto(const nlohmann::json& value,
                        const std::string& prefix,
                        std::vector<std::pair<std::string, std::string>>& out) {
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            const std::string key = prefix.empty()
                ? it.key()
                : prefix + "[" + it.key() + "]";
            flattenInto(it.value(), key, out);
        }
    } else if (value.is_array()) {
        std::size_t index = 0;
        for (const auto& element : value) {
            flattenInto(element, prefix + "[" + std::to_string(index) + "]", out);
            ++index;
        }
    } else {
        out.emplace_back(prefix, scalarToString(value));
    }
}

std::vector<std::pair<std::string, std::string>>
flattenParameters(const nlohmann::json& params) {
    std::vector<std::pair<std::string, std::string>> pairs;
    if (params.is_null()) {
        return pairs;
    }
    if (!params.is_object()) {
        throw std::invalid_argument(
            "Request parameters must be a JSON object, got " +
            std::string(params.type_name()));
    }
    flattenInto(params, "", pairs);
    return pairs;
}

std::string encodeParameters(const nlohmann::json& params) {
    std::string encoded;
    for (const auto& [key, value] : flattenParameters(params)) {
        if (!encoded.empty()) encoded.push_back('&');
        encoded += urlEncode(key, /*keepBrackets=*/true);
        encoded.push_back('=');
        encoded += urlEncode(value);
    }
    return encoded;
}

// ---------------------------------------------------------------------------
// multipart/form-data
// ---------------------------------------------------------------------------

// Quotes and line breaks cannot appear raw in a Content-Disposition value.
static std::string quotedFormValue(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        switch (c) {
            case '"':  out += "%22"; break;
            case '\r': out += "%0D"; break;
            case '\n': out += "%0A"; break;
            default:   out.push_back(c); break;
        }
    }
    out.push_back('"');
    return out;
}

std::string encodeMultipart(const nlohmann::json& params,
                            const std::vector<FilePart>& files,
                            const std::string& boundary) {
    const std::string delimiter = "--" + boundary + "\r\n";

    std::string body;
    for (const auto& [name, value] : flattenParameters(params)) {
        body += delimiter;
        body += "Content-Disposition: form-data; name=" + quotedFormValue(name) + "\r\n\r\n";
        body += value + "\r\n";
    }
    for (const auto& file : files) {
        body += delimiter;
        body += "Content-Disposition: form-data; name=" + quotedFormValue(file.name) +
                "; filename=" + quotedFormValue(file.filename) + "\r\n";
        body += "Content-Type: " + file.contentType + "\r\n\r\n";
        body += file.content + "\r\n";
    }
    body += "--" + boundary + "--\r\n";
    return body;
}

std::string inspectMultipart(const nlohmann::json& params,
                             const std::vector<FilePart>& files) {
    nlohmann::json shown = params.is_object() ? params : nlohmann::json::object();
    for (const auto& file : files) {
        shown[file.name] = "#<file " + file.filename + " " + file.contentType + " " +
                           std::to_string(file.content.size()) + " bytes>";
    }
    return shown.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ---------------------------------------------------------------------------
// ParamsEncoder
// ---------------------------------------------------------------------------

ParamsEncoder::ParamsEncoder(EncodeFn encodeFn)
    : mEncodeFn(std::move(encodeFn)) {}

const std::string& ParamsEncoder::encode(const nlohmann::json& params) {
    auto it = mCache.find(&params);
    if (it != mCache.end()) {
        return it->second;
    }
    return mCache.emplace(&params, mEncodeFn(params)).first->second;
}

nlohmann::json ParamsEncoder::decode(const std::string& /*encoded*/) const {
    throw std::logic_error("ParamsEncoder does not implement decode");
}

} // namespace supercast
