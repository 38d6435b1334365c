#include "client.hpp"
#include "beast_transport.hpp"
#include "error_classifier.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "parameter_encoder.hpp"
#include "version.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace supercast {

namespace {

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string newIdempotencyKey() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::string newMultipartBoundary() {
    thread_local boost::uuids::random_generator generator;
    return "SupercastFormBoundary-" + boost::uuids::to_string(generator());
}

bool sameTransportSettings(const Config& a, const Config& b) {
    return a.proxy == b.proxy &&
           a.verifySslCerts == b.verifySslCerts &&
           a.caBundlePath == b.caBundlePath;
}

std::shared_ptr<Transport> makeBeastTransport(const Config& cfg) {
    if (!cfg.verifySslCerts) {
        static std::atomic<bool> warned{false};
        if (!warned.exchange(true)) {
            std::cerr << "WARNING: Running without SSL cert verification. "
                         "You should never do this in production. Set "
                         "`supercast::config().verifySslCerts = true` to enable "
                         "verification.\n";
        }
    }

    TransportOptions options;
    options.proxy          = cfg.proxy;
    options.verifySslCerts = cfg.verifySslCerts;
    options.caBundlePath   = cfg.caBundlePath;
    return std::make_shared<BeastTransport>(std::move(options));
}

nlohmann::json embeddedQueryParams(const std::string& embeddedQuery) {
    nlohmann::json params = nlohmann::json::object();
    try {
        for (const auto& [key, value] : parseQueryString(embeddedQuery)) {
            params[key] = value;
        }
    } catch (const std::invalid_argument& e) {
        const std::string message = std::string("Invalid query string in request path: ") + e.what();
        logError("Supercast API error", {{"error_message", message}});
        throw InvalidRequestError(message);
    }
    return params;
}

std::string apiUrl(const std::string& path,
                   const std::string& apiBase,
                   const std::string& apiVersion) {
    std::string base = apiBase;
    while (!base.empty() && base.back() == '/') base.pop_back();

    std::string url = base;
    if (!apiVersion.empty()) url += "/" + apiVersion;
    if (!path.empty() && path.front() != '/') url.push_back('/');
    return url + path;
}

[[noreturn]] void raiseAuthenticationError(const std::string& message) {
    logError("Supercast API error", {{"error_message", message}});
    throw AuthenticationError(message);
}

void checkApiKey(const std::string& apiKey) {
    if (apiKey.empty()) {
        raiseAuthenticationError(
            "No API key provided. Set your API key using "
            "\"supercast::config().apiKey = <API-KEY>\" or the SUPERCAST_API_KEY "
            "environment variable. You can generate API keys from the Supercast "
            "web interface. See https://docs.supercast.tech/docs/access-tokens "
            "for details, or email support@supercast.com if you have any questions.");
    }

    if (containsWhitespace(apiKey)) {
        raiseAuthenticationError(
            "Your API key is invalid, as it contains whitespace. (HINT: You can "
            "double-check your API key from the Supercast web interface. See "
            "https://docs.supercast.tech/docs/access-tokens for details, or email "
            "support@supercast.com if you have any questions.)");
    }
}

std::string headerOrEmpty(const Headers& headers, const char* name) {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

std::string elapsedSeconds(std::chrono::steady_clock::time_point start) {
    const std::chrono::duration<double> elapsed =
        std::chrono::steady_clock::now() - start;
    return std::to_string(elapsed.count());
}

// ---------------------------------------------------------------------------
// Structured request logging
// ---------------------------------------------------------------------------

void logRequest(const RequestContext& context, int numRetries) {
    logInfo("Request to Supercast API", {
        {"account",         context.account},
        {"api_version",     context.apiVersion},
        {"idempotency_key", context.idempotencyKey},
        {"method",          context.method},
        {"num_retries",     std::to_string(numRetries)},
        {"path",            context.path},
    });
    logDebug("Request details", {
        {"body",            context.body.value_or("")},
        {"idempotency_key", context.idempotencyKey},
        {"query_params",    context.queryParams.value_or("")},
    });
}

void logResponse(const RequestContext& context,
                 std::chrono::steady_clock::time_point requestStart,
                 unsigned int status,
                 const std::string& body) {
    logInfo("Response from Supercast API", {
        {"account",         context.account},
        {"api_version",     context.apiVersion},
        {"elapsed",         elapsedSeconds(requestStart)},
        {"idempotency_key", context.idempotencyKey},
        {"method",          context.method},
        {"path",            context.path},
        {"status",          std::to_string(status)},
    });
    logDebug("Response details", {
        {"body",            body},
        {"idempotency_key", context.idempotencyKey},
    });
}

void logResponseError(const RequestContext& context,
                      std::chrono::steady_clock::time_point requestStart,
                      const TransportError& error) {
    logError("Request error", {
        {"elapsed",         elapsedSeconds(requestStart)},
        {"error_kind",      toString(error.kind())},
        {"error_message",   error.what()},
        {"idempotency_key", context.idempotencyKey},
        {"method",          context.method},
        {"path",            context.path},
    });
}

} // namespace

// ---------------------------------------------------------------------------
// Construction and per-thread defaults
// ---------------------------------------------------------------------------

Client::Client(std::shared_ptr<Transport> transport, Config settings)
    : mTransport(transport ? std::move(transport) : transportFor(settings))
    , mSettings(std::move(settings))
    , mRetryPolicy(RetryPolicy::fromConfig(mSettings))
    , mSleeper([](std::chrono::milliseconds delay) {
          std::this_thread::sleep_for(delay);
      }) {}

Client& Client::activeClient() {
    if (Client* scoped = ScopedActiveClient::current()) {
        return *scoped;
    }
    return defaultClient();
}

Client& Client::defaultClient() {
    thread_local std::unique_ptr<Client> client;
    if (!client) {
        client = std::make_unique<Client>(defaultTransport());
        client->mTracksGlobalConfig = true;
    }
    return *client;
}

std::shared_ptr<Transport> Client::defaultTransport() {
    // One connection per thread so keep-alive reuse never crosses threads.
    thread_local std::shared_ptr<Transport> transport;
    if (!transport) {
        transport = makeBeastTransport(config());
    }
    return transport;
}

std::shared_ptr<Transport> Client::transportFor(const Config& settings) {
    if (sameTransportSettings(settings, config())) {
        return defaultTransport();
    }
    return makeBeastTransport(settings);
}

// ---------------------------------------------------------------------------
// Request execution
// ---------------------------------------------------------------------------

Response Client::executeRequest(const std::string& method,
                                const std::string& path,
                                const RequestOptions& options) {
    const Config& settings = mTracksGlobalConfig ? config() : mSettings;

    const std::string apiBase    = options.apiBase.empty()    ? settings.apiBase    : options.apiBase;
    const std::string apiVersion = options.apiVersion.empty() ? settings.apiVersion : options.apiVersion;
    const std::string apiKey     = options.apiKey.empty()     ? settings.apiKey     : options.apiKey;
    const std::string verb       = toUpper(method);

    const nlohmann::json params = objectsToIds(options.params);

    checkApiKey(apiKey);

    const bool hasBody   = !(verb == "GET" || verb == "HEAD" || verb == "DELETE");
    const bool multipart = options.multipart || !options.files.empty();
    if (multipart && !hasBody) {
        const std::string message = "A multipart body cannot be sent with a " + verb + " request";
        logError("Supercast API error", {{"error_message", message}});
        throw InvalidRequestError(message);
    }

    nlohmann::json body;    // null = no body
    nlohmann::json query;   // null = no query string
    if (hasBody) {
        body = params;
    } else {
        query = params;
    }

    // Parameters written into the path itself are merged with the explicit
    // ones (explicit wins) so that neither set is silently dropped.
    auto [requestPath, embeddedQuery] = splitPathAndQuery(path);
    if (!embeddedQuery.empty()) {
        nlohmann::json merged = embeddedQueryParams(embeddedQuery);
        if (query.is_object()) {
            merged.update(query);
        }
        query = std::move(merged);
    }

    Headers headers = requestHeaders(apiKey, verb, apiVersion);
    std::string boundary;
    if (multipart) {
        boundary = newMultipartBoundary();
        headers["Content-Type"] = "multipart/form-data; boundary=" + boundary;
    }
    for (const auto& [name, value] : normalizeHeaders(options.headers)) {
        headers[name] = value;
    }

    // One encoder per logical call: the wire and the log share its output.
    ParamsEncoder encoder;

    RequestContext context;
    context.account        = headerOrEmpty(headers, "Supercast-Account");
    context.apiKey         = apiKey;
    context.apiVersion     = headerOrEmpty(headers, "Supercast-Version");
    context.idempotencyKey = headerOrEmpty(headers, "Idempotency-Key");
    context.method         = toLower(verb);
    context.path           = requestPath;
    if (multipart) {
        context.body = inspectMultipart(body, options.files);
    } else if (!body.is_null()) {
        context.body = encoder.encode(body);
    }
    if (!query.is_null()) context.queryParams = encoder.encode(query);

    HttpRequest request;
    request.method      = verb;
    request.url         = apiUrl(requestPath, apiBase, apiVersion);
    request.headers     = std::move(headers);
    request.openTimeout = settings.openTimeout;
    request.readTimeout = settings.readTimeout;
    if (!query.is_null()) {
        const std::string& encodedQuery = encoder.encode(query);
        if (!encodedQuery.empty()) request.url += "?" + encodedQuery;
    }
    if (multipart) {
        request.body = encodeMultipart(body, options.files, boundary);
    } else if (!body.is_null()) {
        request.body = encoder.encode(body);
    }

    const HttpResult result = executeWithRescues(request, context, apiBase);

    Response response;
    try {
        response = Response::fromHttpResult(result);
    } catch (const nlohmann::json::exception&) {
        auto error = generalApiError(result.status, result.body);
        logError("Supercast API error", {
            {"status",          std::to_string(result.status)},
            {"error_message",   error->message()},
            {"idempotency_key", context.idempotencyKey},
        });
        error->raise();
    }

    // Lets Client::request() hand the response back to its caller.
    mLastResponse = response;
    return response;
}

HttpResult Client::executeWithRescues(const HttpRequest& request,
                                      const RequestContext& context,
                                      const std::string& apiBase) {
    int numRetries = 0;

    for (;;) {
        const auto requestStart = std::chrono::steady_clock::now();
        logRequest(context, numRetries);

        try {
            HttpResult result = mTransport->perform(request);

            const RequestContext responseContext =
                context.derivedFromResponseHeaders(&result.headers);
            logResponse(responseContext, requestStart, result.status, result.body);

            if (result.status >= 200 && result.status < 300) {
                return result;
            }
            handleErrorResponse(result, responseContext);

        } catch (const TransportError& e) {
            logResponseError(context, requestStart, e);

            if (mRetryPolicy.shouldRetry(e.kind(), numRetries)) {
                ++numRetries;
                mSleeper(mRetryPolicy.backoffDelay(numRetries));
                continue;
            }
            handleNetworkError(e, context, numRetries, apiBase);
        }
    }
}

void Client::handleErrorResponse(const HttpResult& result,
                                 const RequestContext& context) const {
    const auto error = classifyResponse(result);

    logError("Supercast API error", {
        {"status",          std::to_string(result.status)},
        {"error_code",      std::to_string(error->code())},
        {"error_message",   error->message()},
        {"idempotency_key", context.idempotencyKey},
    });
    error->raise();
}

void Client::handleNetworkError(const TransportError& error,
                                const RequestContext& context,
                                int numRetries,
                                const std::string& apiBase) const {
    logError("Supercast network error", {
        {"error_message",   error.what()},
        {"idempotency_key", context.idempotencyKey},
    });
    classifyNetworkFailure(error.kind(), error.what(), numRetries, apiBase)->raise();
}

Headers Client::requestHeaders(const std::string& apiKey,
                               const std::string& method,
                               const std::string& apiVersion) const {
    Headers headers;
    headers["User-Agent"]    = std::string("Supercast CppBindings/") + kVersion;
    headers["Authorization"] = "Bearer " + apiKey;
    headers["Content-Type"]  = "application/x-www-form-urlencoded";

    // Retrying a POST or DELETE is only safe with an idempotency key.
    if ((method == "POST" || method == "DELETE") && mSettings.maxNetworkRetries > 0) {
        headers["Idempotency-Key"] = newIdempotencyKey();
    }

    if (!apiVersion.empty()) {
        headers["Supercast-Version"] = apiVersion;
    }

    const nlohmann::json userAgent = mProfiler.userAgent();
    try {
        headers["X-Supercast-Client-User-Agent"] = userAgent.dump();
    } catch (const nlohmann::json::exception& e) {
        headers["X-Supercast-Client-Raw-User-Agent"] = mProfiler.rawUserAgent();
        logError("Failed to encode client user agent", {{"error_message", e.what()}});
    }

    return headers;
}

} // namespace supercast
