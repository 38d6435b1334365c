#pragma once

#include "transport.hpp"

#include <memory>
#include <string>

namespace supercast {

struct TransportOptions {
    std::string proxy;            // "http://proxy.local:3128", empty = direct
    bool        verifySslCerts = true;
    std::string caBundlePath;     // PEM file; empty = system default paths
};

/// Transport built on Boost.Beast.
///
/// Keeps one keep-alive connection open and reuses it for consecutive
/// requests to the same scheme/host/port.  Open and read deadlines are
/// enforced per request.  HTTPS goes through OpenSSL (SNI and hostname
/// verification) and is tunnelled with CONNECT when a proxy is configured.
class BeastTransport : public Transport {
public:
    explicit BeastTransport(TransportOptions options = {});
    ~BeastTransport() override;

    HttpResult perform(const HttpRequest& request) override;

    bool isConnected() const;
    void disconnect();

    const TransportOptions& options() const { return mOptions; }

private:
    struct State;

    TransportOptions       mOptions;
    std::unique_ptr<State> mState;

    void connect(const UrlParts& target, const HttpRequest& request);
    void openTunnel(const UrlParts& target, const HttpRequest& request);
};

} // namespace supercast
