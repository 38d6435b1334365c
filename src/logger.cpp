#include "logger.hpp"

#include <iostream>
#include <mutex>

namespace supercast {

static bool needsQuoting(const std::string& value) {
    for (char c : value) {
        if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t') {
            return true;
        }
    }
    return false;
}

static void appendValue(std::string& out, const std::string& value) {
    if (!needsQuoting(value)) {
        out += value;
        return;
    }

    out.push_back('"');
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\t': out += "\\t";  break;
            default:   out.push_back(c);
        }
    }
    out.push_back('"');
}

std::string formatLogLine(LogLevel level,
                          const std::string& message,
                          const LogFields& fields) {
    std::string line = "level=";
    line += toString(level);
    line += " message=";
    appendValue(line, message);

    for (const auto& [key, value] : fields) {
        if (value.empty()) continue;
        line.push_back(' ');
        line += key;
        line.push_back('=');
        appendValue(line, value);
    }
    return line;
}

void log(LogLevel level, const std::string& message, const LogFields& fields) {
    const Config& cfg = config();
    if (level == LogLevel::None || level < cfg.logLevel) {
        return;
    }

    static std::mutex sinkMutex;
    const std::string line = formatLogLine(level, message, fields);

    std::lock_guard<std::mutex> lock(sinkMutex);
    std::ostream& out = cfg.logSink != nullptr ? *cfg.logSink : std::cerr;
    out << "[Supercast] " << line << "\n";
}

} // namespace supercast
