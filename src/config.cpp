#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace supercast {

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info")  return LogLevel::Info;
    if (lower == "error") return LogLevel::Error;
    if (lower == "none")  return LogLevel::None;

    throw std::invalid_argument(
        "Unknown log level '" + name + "' (expected debug, info, error or none)");
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Error: return "error";
        case LogLevel::None:  return "none";
    }
    return "none";
}

Config& config() {
    static Config instance;
    return instance;
}

static const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

void loadFromEnvironment(Config& cfg) {
    if (const char* v = env("SUPERCAST_API_KEY"))     cfg.apiKey       = v;
    if (const char* v = env("SUPERCAST_API_BASE"))    cfg.apiBase      = v;
    if (const char* v = env("SUPERCAST_API_VERSION")) cfg.apiVersion   = v;
    if (const char* v = env("SUPERCAST_PROXY"))       cfg.proxy        = v;
    if (const char* v = env("SUPERCAST_CA_BUNDLE"))   cfg.caBundlePath = v;

    if (const char* v = env("SUPERCAST_MAX_NETWORK_RETRIES")) {
        try {
            cfg.maxNetworkRetries = std::stoi(v);
        } catch (const std::exception&) {
            throw std::invalid_argument(
                std::string("SUPERCAST_MAX_NETWORK_RETRIES is not an integer: ") + v);
        }
    }

    if (const char* v = env("SUPERCAST_LOG")) {
        cfg.logLevel = parseLogLevel(v);
    }
}

} // namespace supercast
