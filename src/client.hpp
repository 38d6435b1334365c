#pragma once

#include "client_scope.hpp"
#include "config.hpp"
#include "parameter_encoder.hpp"
#include "request_context.hpp"
#include "response.hpp"
#include "retry_policy.hpp"
#include "system_profiler.hpp"
#include "transport.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace supercast {

/// Per-call overrides.  Empty strings fall back to the client's Config.
struct RequestOptions {
    std::string    apiBase;
    std::string    apiVersion;
    std::string    apiKey;
    Headers        headers;
    nlohmann::json params = nlohmann::json::object();

    /// Any file, or multipart = true, sends the body as multipart/form-data
    /// instead of form encoding.  Only valid for methods that carry a body.
    std::vector<FilePart> files;
    bool                  multipart = false;
};

/// Executes requests against the Supercast API.
///
/// A Client owns a transport (one connection, reused between calls) and a
/// snapshot of the configuration.  It is not thread-safe: each thread gets
/// its own default client, and an explicitly created client must not be
/// used from two threads at once.
///
/// Usage:
///
///     supercast::Client client;
///     auto [episode, response] = client.request([] {
///         return supercast::Episodes::create({{"title", "Pilot"}});
///     });
class Client {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /// @param transport  nullptr selects this thread's default transport when
    ///                   @p settings agree with config() on proxy and TLS
    ///                   options, otherwise a BeastTransport built from
    ///                   @p settings.
    explicit Client(std::shared_ptr<Transport> transport = nullptr,
                    Config settings = config());

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// The client bound by the innermost request() on this thread, or the
    /// thread's default client.
    static Client& activeClient();

    /// Lazily created, one per thread.  Unlike an explicitly created client
    /// it reads the API key, base, version and timeouts from config() on
    /// every call; retry settings are fixed when it is first used.
    static Client& defaultClient();

    /// Lazily created BeastTransport, one per thread, configured from config().
    static std::shared_ptr<Transport> defaultTransport();

    /// Run @p block with this client active on the current thread.
    /// Returns the block's result and the last Response this client
    /// produced while the block ran.  A block returning void yields only
    /// the std::optional<Response>; a reference result stays a reference.
    template <class Block>
    auto request(Block&& block);

    /// Perform one logical API call, retrying transient network failures.
    /// @throws SupercastError subclasses (see errors.hpp).
    Response executeRequest(const std::string& method,
                            const std::string& path,
                            const RequestOptions& options = {});

    const std::optional<Response>& lastResponse() const { return mLastResponse; }

    /// Replace the backoff sleep (defaults to std::this_thread::sleep_for).
    void setSleeper(Sleeper sleeper) { mSleeper = std::move(sleeper); }

    void setSystemProfiler(SystemProfiler profiler) { mProfiler = std::move(profiler); }

    const Config& settings() const { return mSettings; }
    Transport& transport() { return *mTransport; }

private:
    std::shared_ptr<Transport> mTransport;
    Config                     mSettings;
    RetryPolicy                mRetryPolicy;
    SystemProfiler             mProfiler;
    Sleeper                    mSleeper;
    std::optional<Response>    mLastResponse;
    bool                       mTracksGlobalConfig = false;

    static std::shared_ptr<Transport> transportFor(const Config& settings);

    Headers requestHeaders(const std::string& apiKey,
                           const std::string& method,
                           const std::string& apiVersion) const;

    HttpResult executeWithRescues(const HttpRequest& request,
                                  const RequestContext& context,
                                  const std::string& apiBase);

    [[noreturn]] void handleErrorResponse(const HttpResult& result,
                                          const RequestContext& context) const;
    [[noreturn]] void handleNetworkError(const TransportError& error,
                                         const RequestContext& context,
                                         int numRetries,
                                         const std::string& apiBase) const;
};

/// Free-function spelling of Client::request().
template <class Block>
auto runScoped(Client& client, Block&& block) {
    return client.request(std::forward<Block>(block));
}

// ---------------------------------------------------------------------------
// Template implementation
// ---------------------------------------------------------------------------

template <class Block>
auto Client::request(Block&& block) {
    using Result = std::invoke_result_t<Block&>;

    mLastResponse.reset();
    ScopedActiveClient scope(*this);
    if constexpr (std::is_void_v<Result>) {
        block();
        return mLastResponse;
    } else {
        return std::pair<Result, std::optional<Response>>(block(), mLastResponse);
    }
}

} // namespace supercast
