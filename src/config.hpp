#pragma once

#include <chrono>
#include <iosfwd>
#include <string>

namespace supercast {

enum class LogLevel { Debug = 0, Info = 1, Error = 2, None = 3 };

/// Parse "debug" / "info" / "error" / "none" (case-insensitive).
/// Throws std::invalid_argument for anything else.
LogLevel parseLogLevel(const std::string& name);

const char* toString(LogLevel level);

/// Library-wide settings.  Set once at startup, then read without locking.
struct Config {
    std::string apiBase    = "https://supercast.com/api";
    std::string apiVersion = "v1";
    std::string apiKey;

    std::string proxy;             // e.g. "http://user@proxy.local:3128"
    bool        verifySslCerts = true;
    std::string caBundlePath;      // empty = system trust store

    std::chrono::milliseconds openTimeout{30000};
    std::chrono::milliseconds readTimeout{80000};

    int                       maxNetworkRetries = 0;
    std::chrono::milliseconds initialNetworkRetryDelay{500};
    std::chrono::milliseconds maxNetworkRetryDelay{2000};

    LogLevel      logLevel = LogLevel::None;
    std::ostream* logSink  = nullptr;   // nullptr = std::cerr
};

/// The process-wide configuration instance.
Config& config();

/// Overlay SUPERCAST_* environment variables onto @p cfg.
void loadFromEnvironment(Config& cfg);

} // namespace supercast
