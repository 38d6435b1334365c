#include "system_profiler.hpp"
#include "version.hpp"

#include <boost/asio/ip/host_name.hpp>

#include <fstream>
#include <sstream>
#include <utility>

#include <sys/utsname.h>

namespace supercast {

static std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

static std::string compilerEngine() {
#if defined(__clang__)
    return "clang";
#elif defined(__GNUC__)
    return "gcc";
#elif defined(_MSC_VER)
    return "msvc";
#else
    return "";
#endif
}

static std::string languageVersion() {
    std::string version = "C++ " + std::to_string(__cplusplus);
#ifdef __VERSION__
    version += " (" + std::string(__VERSION__) + ")";
#endif
    return version;
}

static std::string platform() {
    struct utsname info {};
    if (::uname(&info) != 0) {
        return "unknown";
    }
    return std::string(info.machine) + "-" + info.sysname;
}

SystemProfiler::SystemProfiler()
    : mUname(uname()) {}

SystemProfiler::SystemProfiler(std::string uname)
    : mUname(std::move(uname)) {}

std::string SystemProfiler::uname() {
    std::ifstream procVersion("/proc/version");
    if (procVersion) {
        std::stringstream ss;
        ss << procVersion.rdbuf();
        const std::string text = trim(ss.str());
        if (!text.empty()) return text;
    }

    struct utsname info {};
    if (::uname(&info) == 0) {
        return std::string(info.sysname) + " " + info.nodename + " " +
               info.release + " " + info.version + " " + info.machine;
    }
    return "unknown platform";
}

nlohmann::json SystemProfiler::userAgent() const {
    boost::system::error_code ec;
    std::string hostname = boost::asio::ip::host_name(ec);
    if (ec) hostname.clear();

    nlohmann::json ua = {
        {"bindings_version", kVersion},
        {"lang",             "c++"},
        {"lang_version",     languageVersion()},
        {"platform",         platform()},
        {"engine",           compilerEngine()},
        {"publisher",        "supercast"},
        {"uname",            mUname},
    };
    if (!hostname.empty()) {
        ua["hostname"] = hostname;
    }
    return ua;
}

std::string SystemProfiler::rawUserAgent() const {
    const nlohmann::json ua = userAgent();

    std::string raw;
    for (const auto& field : ua.items()) {
        if (!raw.empty()) raw += ", ";
        raw += field.key() + ": " + field.value().get<std::string>();
    }
    return "{" + raw + "}";
}

} // namespace supercast
