#pragma once

#include <stdexcept>
#include <string>

namespace webfetch {

/// Base of everything the library throws on purpose.
class WebFetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed or unsupported URL.
class UrlError : public WebFetchError {
public:
    using WebFetchError::WebFetchError;
};

/// The caller-supplied request body could not be read.
class RequestError : public WebFetchError {
public:
    using WebFetchError::WebFetchError;
};

/// DNS, connect, TLS, write or header-read failure, including timeouts.
/// The only error WebClient retries.
class TransportError : public WebFetchError {
public:
    using WebFetchError::WebFetchError;
};

/// Failure while draining the body of a response that already arrived.
class ReadError : public WebFetchError {
public:
    using WebFetchError::WebFetchError;
};

class RedirectError : public WebFetchError {
public:
    using WebFetchError::WebFetchError;
};

/// Cookie file could not be read, written or decoded.
class CookieIoError : public WebFetchError {
public:
    using WebFetchError::WebFetchError;
};

} // namespace webfetch
