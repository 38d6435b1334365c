#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace supercast {

/// Describes the host the library runs on, for the client user-agent header.
class SystemProfiler {
public:
    SystemProfiler();

    /// Report @p uname instead of reading it from the host.
    explicit SystemProfiler(std::string uname);

    /// Kernel / OS description: /proc/version, else uname(2), else a placeholder.
    static std::string uname();

    /// {bindings_version, lang, lang_version, platform, engine, publisher,
    ///  uname, hostname}.  The hostname is looked up on every call.
    nlohmann::json userAgent() const;

    /// Plain "key: value, ..." rendering used when userAgent() cannot be
    /// serialized (for instance when uname contains invalid UTF-8).
    std::string rawUserAgent() const;

private:
    std::string mUname;
};

} // namespace supercast
