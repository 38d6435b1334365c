#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace supercast {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path + query (e.g. "/v1/episodes?page=2")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Case-insensitive ordering so header lookups ignore case.
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

/// "content-type" -> "Content-Type", "idempotency_key" -> "Idempotency-Key".
std::string normalizeHeaderName(const std::string& name);

/// Return a copy of @p headers with every name normalized.
Headers normalizeHeaders(const Headers& headers);

/// Form-encode a key or value: unreserved characters pass through,
/// space becomes '+', everything else becomes %XX.
/// Square brackets are kept literal when @p keepBrackets is set.
std::string urlEncode(const std::string& s, bool keepBrackets = false);

/// Inverse of urlEncode ('+' -> space, %XX -> byte).
/// Throws std::invalid_argument on a truncated or non-hex escape.
std::string urlDecode(const std::string& s);

/// Decode "a=1&b=2" into ordered pairs.  Empty segments are skipped.
std::vector<std::pair<std::string, std::string>>
parseQueryString(const std::string& query);

/// Split "/episodes?page=2" into {"/episodes", "page=2"}.
std::pair<std::string, std::string> splitPathAndQuery(const std::string& path);

bool containsWhitespace(const std::string& s);

} // namespace supercast
