#pragma once

#include <chrono>
#include <optional>

namespace webfetch {

/// Configuration snapshot taken by WebClient at construction.
/// Defaults: 60s request timeout, 5s dial and TLS handshake timeouts,
/// one retry, quiet.
struct ClientOptions {
    std::chrono::milliseconds timeout{60000};              // whole round trip
    std::chrono::milliseconds tlsHandshakeTimeout{5000};
    std::chrono::milliseconds dialTimeout{5000};           // resolve + connect
    int  maxTries = 1;                                     // retries after the first attempt
    bool verbose  = false;

    /// Pause between attempts. Falls back to @c timeout when unset.
    std::optional<std::chrono::milliseconds> retryDelay;

    int maxRedirects = 10;

    std::chrono::milliseconds effectiveRetryDelay() const {
        return retryDelay.value_or(timeout);
    }
};

} // namespace webfetch
