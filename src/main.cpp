#include "client.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

struct CliOptions {
    std::string    method = "GET";
    std::string    path   = "/episodes";
    nlohmann::json params = nlohmann::json::object();
    bool           verbose = false;
};

static void printUsage() {
    std::cout
        << "Usage: supercast_cli [options]\n\n"
        << "Options:\n"
        << "  --api-key KEY       API key                  (default: $SUPERCAST_API_KEY)\n"
        << "  --api-base URL      API base URL             (default: https://supercast.com/api)\n"
        << "  --api-version V     API version path segment (default: v1)\n"
        << "  --method M          HTTP method              (default: GET)\n"
        << "  --path P            Resource path            (default: /episodes)\n"
        << "  --param KEY=VALUE   Request parameter, repeatable; KEY may use\n"
        << "                      brackets, e.g. episode[title]=Pilot\n"
        << "  --max-retries N     Network retries          (default: 0)\n"
        << "  --verbose           Log requests at debug level to stderr\n"
        << "  --help, -h          Show this message\n";
}

static CliOptions parseArgs(int argc, char* argv[], supercast::Config& cfg) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--api-key" && i + 1 < argc) {
            cfg.apiKey = argv[++i];
        } else if (arg == "--api-base" && i + 1 < argc) {
            cfg.apiBase = argv[++i];
        } else if (arg == "--api-version" && i + 1 < argc) {
            cfg.apiVersion = argv[++i];
        } else if (arg == "--method" && i + 1 < argc) {
            opts.method = argv[++i];
        } else if (arg == "--path" && i + 1 < argc) {
            opts.path = argv[++i];
        } else if (arg == "--param" && i + 1 < argc) {
            const std::string kv = argv[++i];
            const auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Invalid --param (expected KEY=VALUE): " << kv << "\n";
                std::exit(1);
            }
            // Bracketed keys pass through as-is; the encoder leaves brackets alone.
            opts.params[kv.substr(0, eq)] = kv.substr(eq + 1);
        } else if (arg == "--max-retries" && i + 1 < argc) {
            cfg.maxNetworkRetries = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            opts.verbose = true;
            cfg.logLevel = supercast::LogLevel::Debug;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    return opts;
}

int main(int argc, char* argv[]) {
    try {
        supercast::Config& cfg = supercast::config();
        supercast::loadFromEnvironment(cfg);
        const CliOptions opts = parseArgs(argc, argv, cfg);

        if (opts.verbose) {
            std::cerr
                << "=== supercast_cli ===\n"
                << "API base:    " << cfg.apiBase    << "\n"
                << "API version: " << cfg.apiVersion << "\n"
                << "Request:     " << opts.method << " " << opts.path << "\n"
                << "Max retries: " << cfg.maxNetworkRetries << "\n"
                << "=====================\n\n";
        }

        supercast::Client client;
        auto [data, response] = client.request([&] {
            supercast::RequestOptions options;
            options.params = opts.params;
            return supercast::Client::activeClient()
                .executeRequest(opts.method, opts.path, options).data;
        });

        if (response) {
            std::cout << "HTTP " << response->httpStatus << "\n";
        }
        std::cout << data.dump(2) << "\n";
        return 0;

    } catch (const supercast::SupercastError& e) {
        std::cerr << "Supercast error (" << supercast::toString(e.kind()) << "): "
                  << e.toString() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
