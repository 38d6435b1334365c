#pragma once

#include "config.hpp"

#include <string>
#include <utility>
#include <vector>

namespace supercast {

/// Ordered key/value pairs attached to a log record.
using LogFields = std::vector<std::pair<std::string, std::string>>;

/// Render one logfmt record (without trailing newline):
///   level=info message="Request to Supercast API" method=get path=/episodes
/// Fields with empty values are omitted.
std::string formatLogLine(LogLevel level,
                          const std::string& message,
                          const LogFields& fields);

/// Write a record to config().logSink when @p level >= config().logLevel.
void log(LogLevel level, const std::string& message, const LogFields& fields = {});

inline void logDebug(const std::string& message, const LogFields& fields = {}) {
    log(LogLevel::Debug, message, fields);
}

inline void logInfo(const std::string& message, const LogFields& fields = {}) {
    log(LogLevel::Info, message, fields);
}

inline void logError(const std::string& message, const LogFields& fields = {}) {
    log(LogLevel::Error, message, fields);
}

} // namespace supercast
