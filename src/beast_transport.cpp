#include "beast_transport.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef SUPERCAST_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace supercast {

namespace {

constexpr std::uint64_t kMaxBodyBytes = 64 * 1024 * 1024;

/// Start one async operation and drive the io_context until it completes.
/// Going through the async API is what makes tcp_stream deadlines apply.
template <class Initiator>
beast::error_code runOp(net::io_context& ioc, Initiator&& initiate) {
    beast::error_code result = net::error::would_block;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

FailureKind classifyErrorCode(const beast::error_code& ec) {
    if (ec == beast::error::timeout) {
        return FailureKind::Timeout;
    }
#ifdef SUPERCAST_HAS_SSL
    if (ec.category() == net::error::get_ssl_category() ||
        ec.category() == net::ssl::error::get_stream_category()) {
        return FailureKind::TlsFailure;
    }
#endif
    if (ec == net::error::connection_refused ||
        ec == net::error::connection_reset ||
        ec == net::error::connection_aborted ||
        ec == net::error::host_not_found ||
        ec == net::error::host_not_found_try_again ||
        ec == net::error::network_unreachable ||
        ec == net::error::host_unreachable ||
        ec == net::error::broken_pipe ||
        ec == net::error::eof ||
        ec == http::error::end_of_stream) {
        return FailureKind::ConnectionFailed;
    }
    return FailureKind::Other;
}

/// A keep-alive connection the server closed while it sat idle.
bool isStaleConnectionError(const beast::error_code& ec) {
    return ec == http::error::end_of_stream ||
           ec == net::error::eof ||
           ec == net::error::connection_reset ||
           ec == net::error::broken_pipe;
}

bool isSafeToResend(const HttpRequest& request) {
    return request.method == "GET" || request.method == "HEAD" ||
           request.method == "PUT" || request.method == "DELETE" ||
           request.method == "OPTIONS" ||
           request.headers.count("Idempotency-Key") > 0;
}

[[noreturn]] void fail(const beast::error_code& ec, const std::string& what) {
    throw TransportError(classifyErrorCode(ec), what + ": " + ec.message());
}

std::string hostHeader(const UrlParts& parts) {
    const bool defaultPort = (parts.scheme == "https" && parts.port == "443") ||
                             (parts.scheme == "http" && parts.port == "80");
    return defaultPort ? parts.host : parts.host + ":" + parts.port;
}

http::request<http::string_body>
buildRequest(const HttpRequest& request, const UrlParts& parts, bool absoluteForm) {
    const http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + request.method);
    }

    const std::string target = absoluteForm ? request.url : parts.target;
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, hostHeader(parts));
    req.set(http::field::accept, "application/json");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.keep_alive(true);
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

template <class Stream>
beast::error_code exchange(net::io_context& ioc,
                           Stream& stream,
                           beast::flat_buffer& buffer,
                           http::request<http::string_body>& req,
                           std::chrono::milliseconds readTimeout,
                           HttpResult& out,
                           bool& keepAlive) {
    auto& lowest = beast::get_lowest_layer(stream);

    lowest.expires_after(readTimeout);
    beast::error_code ec = runOp(ioc, [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });
    if (ec) return ec;

    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxBodyBytes);
    if (req.method() == http::verb::head) {
        parser.skip(true);
    }

    lowest.expires_after(readTimeout);
    ec = runOp(ioc, [&](auto handler) {
        http::async_read(stream, buffer, parser, std::move(handler));
    });
    if (ec) return ec;
    lowest.expires_never();

    auto res = parser.release();
    out.status = res.result_int();
    out.headers.clear();
    for (const auto& field : res) {
        std::string name(field.name_string());
        std::string value(field.value());
        auto it = out.headers.find(name);
        if (it == out.headers.end()) {
            out.headers.emplace(std::move(name), std::move(value));
        } else {
            it->second += ", " + value;
        }
    }
    out.body  = std::move(res.body());
    keepAlive = res.keep_alive();
    return {};
}

} // namespace

// ---------------------------------------------------------------------------
// Connection state
// ---------------------------------------------------------------------------

struct BeastTransport::State {
    net::io_context ioc;
#ifdef SUPERCAST_HAS_SSL
    net::ssl::context sslCtx{net::ssl::context::tlsv12_client};
#endif

    std::string        key;         // "scheme://host:port" of the open connection
    bool               viaProxy = false;
    beast::flat_buffer buffer;

    std::unique_ptr<beast::tcp_stream> plain;
#ifdef SUPERCAST_HAS_SSL
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls;
#endif

    beast::tcp_stream* lowest() {
#ifdef SUPERCAST_HAS_SSL
        if (tls) return &beast::get_lowest_layer(*tls);
#endif
        return plain.get();
    }
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport(TransportOptions options)
    : mOptions(std::move(options))
    , mState(std::make_unique<State>())
{
    if (!mOptions.proxy.empty()) {
        // Validate eagerly so a bad proxy URL fails at construction.
        parseUrl(mOptions.proxy);
    }

#ifdef SUPERCAST_HAS_SSL
    auto& ctx = mState->sslCtx;
    if (mOptions.verifySslCerts) {
        ctx.set_verify_mode(net::ssl::verify_peer);
        beast::error_code ec;
        if (mOptions.caBundlePath.empty()) {
            ctx.set_default_verify_paths(ec);
        } else {
            ctx.load_verify_file(mOptions.caBundlePath, ec);
        }
        if (ec) {
            throw std::runtime_error("Failed to load CA certificates" +
                (mOptions.caBundlePath.empty() ? std::string()
                                               : " from " + mOptions.caBundlePath) +
                ": " + ec.message());
        }
    } else {
        ctx.set_verify_mode(net::ssl::verify_none);
    }
#endif
}

BeastTransport::~BeastTransport() {
    disconnect();
}

bool BeastTransport::isConnected() const {
    auto* stream = mState->lowest();
    return stream != nullptr && stream->socket().is_open();
}

void BeastTransport::disconnect() {
    beast::error_code ec;

#ifdef SUPERCAST_HAS_SSL
    if (mState->tls) {
        // Graceful TLS close; the peer may already be gone, so errors are ignored.
        auto& lowest = beast::get_lowest_layer(*mState->tls);
        if (lowest.socket().is_open()) {
            lowest.expires_after(std::chrono::seconds(1));
            ec = runOp(mState->ioc, [&](auto handler) {
                mState->tls->async_shutdown(std::move(handler));
            });
            lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
            lowest.socket().close(ec);
        }
        mState->tls.reset();
    }
#endif
    if (mState->plain) {
        mState->plain->socket().shutdown(tcp::socket::shutdown_both, ec);
        mState->plain->socket().close(ec);
        mState->plain.reset();
    }

    mState->key.clear();
    mState->viaProxy = false;
    mState->buffer.consume(mState->buffer.size());
}

// ---------------------------------------------------------------------------
// Connect (direct, through an HTTP proxy, or through a CONNECT tunnel)
// ---------------------------------------------------------------------------

void BeastTransport::connect(const UrlParts& target, const HttpRequest& request) {
    const bool viaProxy = !mOptions.proxy.empty();
    const UrlParts hop  = viaProxy ? parseUrl(mOptions.proxy) : target;
    const bool useSsl   = target.scheme == "https";

    tcp::resolver resolver(mState->ioc);
    beast::error_code ec;
    const auto results = resolver.resolve(hop.host, hop.port, ec);
    if (ec) {
        throw TransportError(FailureKind::ConnectionFailed,
                             "Could not resolve " + hop.host + ": " + ec.message());
    }

    if (useSsl) {
#ifdef SUPERCAST_HAS_SSL
        mState->tls = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(
            mState->ioc, mState->sslCtx);
        auto& lowest = beast::get_lowest_layer(*mState->tls);

        lowest.expires_after(request.openTimeout);
        ec = runOp(mState->ioc, [&](auto handler) {
            lowest.async_connect(results, std::move(handler));
        });
        if (ec) fail(ec, "Connection to " + hop.host + ":" + hop.port + " failed");

        if (viaProxy) {
            openTunnel(target, request);
        }

        // SNI hostname.
        if (!SSL_set_tlsext_host_name(mState->tls->native_handle(),
                                      target.host.c_str())) {
            throw TransportError(FailureKind::TlsFailure,
                                 "Failed to set SNI hostname " + target.host);
        }
        if (mOptions.verifySslCerts) {
            mState->tls->set_verify_callback(
                net::ssl::host_name_verification(target.host));
        }

        lowest.expires_after(request.openTimeout);
        ec = runOp(mState->ioc, [&](auto handler) {
            mState->tls->async_handshake(net::ssl::stream_base::client,
                                         std::move(handler));
        });
        if (ec) fail(ec, "TLS handshake with " + target.host + " failed");
#else
        throw TransportError(FailureKind::TlsFailure,
                             "HTTPS not supported: built without OpenSSL");
#endif
    } else {
        mState->plain = std::make_unique<beast::tcp_stream>(mState->ioc);

        mState->plain->expires_after(request.openTimeout);
        ec = runOp(mState->ioc, [&](auto handler) {
            mState->plain->async_connect(results, std::move(handler));
        });
        if (ec) fail(ec, "Connection to " + hop.host + ":" + hop.port + " failed");
    }

    mState->key      = target.scheme + "://" + target.host + ":" + target.port;
    mState->viaProxy = viaProxy;
}

void BeastTransport::openTunnel(const UrlParts& target, const HttpRequest& request) {
    auto& lowest = *mState->lowest();
    const std::string authority = target.host + ":" + target.port;

    http::request<http::empty_body> req{http::verb::connect, authority, 11};
    req.set(http::field::host, authority);
    req.set("Proxy-Connection", "keep-alive");

    lowest.expires_after(request.openTimeout);
    beast::error_code ec = runOp(mState->ioc, [&](auto handler) {
        http::async_write(lowest, req, std::move(handler));
    });
    if (ec) fail(ec, "CONNECT to proxy failed");

    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    ec = runOp(mState->ioc, [&](auto handler) {
        http::async_read_header(lowest, mState->buffer, parser, std::move(handler));
    });
    if (ec) fail(ec, "Reading proxy CONNECT response failed");

    const unsigned status = parser.get().result_int();
    if (status < 200 || status >= 300) {
        throw TransportError(FailureKind::ConnectionFailed,
                             "Proxy refused CONNECT to " + authority +
                             " (HTTP " + std::to_string(status) + ")");
    }
    mState->buffer.consume(mState->buffer.size());
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResult BeastTransport::perform(const HttpRequest& request) {
    const UrlParts parts = parseUrl(request.url);
    const std::string key = parts.scheme + "://" + parts.host + ":" + parts.port;

    const bool reused = isConnected() && mState->key == key;
    if (!reused) {
        disconnect();
        connect(parts, request);
    }

    // Plain HTTP through a proxy uses the absolute URL as request target.
    auto req = buildRequest(request, parts,
                            mState->viaProxy && parts.scheme == "http");

    auto attempt = [&](HttpResult& result, bool& keepAlive) {
#ifdef SUPERCAST_HAS_SSL
        if (mState->tls) {
            return exchange(mState->ioc, *mState->tls, mState->buffer, req,
                            request.readTimeout, result, keepAlive);
        }
#endif
        return exchange(mState->ioc, *mState->plain, mState->buffer, req,
                        request.readTimeout, result, keepAlive);
    };

    HttpResult result;
    bool keepAlive = false;
    beast::error_code ec = attempt(result, keepAlive);

    if (ec && reused && isStaleConnectionError(ec) && isSafeToResend(request)) {
        disconnect();
        connect(parts, request);
        ec = attempt(result, keepAlive);
    }

    if (ec) {
        disconnect();
        fail(ec, request.method + " " + request.url + " failed");
    }

    if (!keepAlive) {
        disconnect();
    }
    return result;
}

} // namespace supercast
