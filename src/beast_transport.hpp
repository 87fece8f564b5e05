#pragma once

#include "client_options.hpp"
#include "transport.hpp"

#include <chrono>
#include <memory>

namespace webfetch {

/// Transport built on Boost.Beast. Opens one connection per round trip and
/// closes it when the returned ResponseStream is destroyed.
///
/// Timeouts compose as follows: @c timeout bounds the whole round trip, body
/// included. Resolve + connect are additionally capped by @c dialTimeout and
/// the TLS handshake by @c tlsHandshakeTimeout. A zero duration disables
/// that bound.
class BeastTransport : public Transport {
public:
    explicit BeastTransport(const ClientOptions& options);

    std::unique_ptr<ResponseStream> roundTrip(const Request& request) override;

private:
    std::chrono::milliseconds mTimeout;
    std::chrono::milliseconds mDialTimeout;
    std::chrono::milliseconds mTlsHandshakeTimeout;
};

} // namespace webfetch
