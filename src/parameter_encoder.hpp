#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace supercast {

/// Replace every resource representation nested in @p params (an object
/// with a string "object" tag and an "id") by its id, so resources can be
/// passed where the API expects a reference.
nlohmann::json objectsToIds(const nlohmann::json& params);

/// Flatten nested parameters into (key, value) pairs using bracket notation:
///   {"a": [1, 2], "b": {"c": 3}}  ->  a[0]=1, a[1]=2, b[c]=3
/// Arrays are always index-addressed so nothing is lost in transit.
std::vector<std::pair<std::string, std::string>>
flattenParameters(const nlohmann::json& params);

/// Form-encode nested parameters ("a[0]=1&a[1]=2&b[c]=3").
/// Object keys come out in sorted order, array elements in sequence order.
std::string encodeParameters(const nlohmann::json& params);

/// One file in a multipart/form-data body.
struct FilePart {
    std::string name;                                   // form field name
    std::string filename;
    std::string contentType = "application/octet-stream";
    std::string content;
};

/// Encode @p params (flattened as in flattenParameters()) followed by
/// @p files as a multipart/form-data body delimited by @p boundary.
std::string encodeMultipart(const nlohmann::json& params,
                            const std::vector<FilePart>& files,
                            const std::string& boundary);

/// Log rendering of a multipart body: the parameters as JSON with each file
/// shown as "#<file name type N bytes>" instead of its content.
std::string inspectMultipart(const nlohmann::json& params,
                             const std::vector<FilePart>& files);

/// Memoizing encoder owned by a single logical request.
///
/// A request's body or query is encoded twice: once for the wire, once for
/// the log.  Results are cached by the identity of the parameter object so
/// both uses see the same string and the work is done once.
class ParamsEncoder {
public:
    using EncodeFn = std::function<std::string(const nlohmann::json&)>;

    explicit ParamsEncoder(EncodeFn encodeFn = encodeParameters);

    /// @p params must outlive this encoder.
    const std::string& encode(const nlohmann::json& params);

    /// Always throws std::logic_error; the encoder is write-only.
    [[noreturn]] nlohmann::json decode(const std::string& encoded) const;

    std::size_t cachedEntries() const { return mCache.size(); }

private:
    EncodeFn mEncodeFn;
    std::unordered_map<const nlohmann::json*, std::string> mCache;
};

} // namespace supercast
