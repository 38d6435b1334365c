#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace supercast {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    std::transform(parts.scheme.begin(), parts.scheme.end(),
                   parts.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target.front() == '?') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    if (parts.port.empty()) {
        throw std::invalid_argument("Invalid URL (empty port): " + url);
    }
    return parts;
}

// ---------------------------------------------------------------------------
// Headers
// ---------------------------------------------------------------------------

bool CaseInsensitiveLess::operator()(const std::string& a,
                                     const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) {
            return std::tolower(x) < std::tolower(y);
        });
}

std::string normalizeHeaderName(const std::string& name) {
    std::string out;
    out.reserve(name.size());

    bool startOfWord = true;
    for (unsigned char c : name) {
        if (c == '-' || c == '_') {
            out.push_back('-');
            startOfWord = true;
            continue;
        }
        out.push_back(static_cast<char>(startOfWord ? std::toupper(c)
                                                    : std::tolower(c)));
        startOfWord = false;
    }
    return out;
}

Headers normalizeHeaders(const Headers& headers) {
    Headers out;
    for (const auto& [name, value] : headers) {
        out[normalizeHeaderName(name)] = value;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Form encoding
// ---------------------------------------------------------------------------

std::string urlEncode(const std::string& s, bool keepBrackets) {
    static const char* kHex = "0123456789ABCDEF";

    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else if (keepBrackets && (c == '[' || c == ']')) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string urlDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= s.size()) {
                throw std::invalid_argument("Truncated percent-escape in: " + s);
            }
            const int hi = hexValue(s[i + 1]);
            const int lo = hexValue(s[i + 2]);
            if (hi < 0 || lo < 0) {
                throw std::invalid_argument("Invalid percent-escape in: " + s);
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::pair<std::string, std::string>>
parseQueryString(const std::string& query) {
    std::vector<std::pair<std::string, std::string>> pairs;

    std::size_t start = 0;
    while (start <= query.size()) {
        auto end = query.find('&', start);
        if (end == std::string::npos) end = query.size();

        const std::string segment = query.substr(start, end - start);
        if (!segment.empty()) {
            const auto eq = segment.find('=');
            if (eq == std::string::npos) {
                pairs.emplace_back(urlDecode(segment), "");
            } else {
                pairs.emplace_back(urlDecode(segment.substr(0, eq)),
                                   urlDecode(segment.substr(eq + 1)));
            }
        }
        start = end + 1;
    }
    return pairs;
}

std::pair<std::string, std::string> splitPathAndQuery(const std::string& path) {
    const auto q = path.find('?');
    if (q == std::string::npos) {
        return {path, ""};
    }
    return {path.substr(0, q), path.substr(q + 1)};
}

bool containsWhitespace(const std::string& s) {
    return std::any_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace supercast
