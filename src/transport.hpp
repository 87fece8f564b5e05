#pragma once

#include "util.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <strings.h>

namespace webfetch {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return ::strcasecmp(a.c_str(), b.c_str()) < 0;
    }
};

/// Header name -> value. Repeated names keep every value in insertion order.
using Headers = std::multimap<std::string, std::string, CaseInsensitiveLess>;

struct Request {
    std::string                method;
    UrlParts                   url;
    Headers                    headers;
    std::optional<std::string> body;
};

/// A response whose headers have arrived and whose body may still be on the
/// wire. Destroying it releases the underlying connection.
class ResponseStream {
public:
    virtual ~ResponseStream() = default;

    virtual unsigned int   status()  const = 0;
    virtual const Headers& headers() const = 0;

    /// Drain the remaining body into memory.
    /// @throws ReadError if the connection fails mid-body.
    virtual std::string readAll() = 0;
};

/// Network layer underneath WebClient.
class Transport {
public:
    virtual ~Transport() = default;

    /// Send @p request and return once the response headers are read.
    /// @throws TransportError on DNS, connect, TLS, write or header-read
    ///         failures, timeouts included.
    virtual std::unique_ptr<ResponseStream> roundTrip(const Request& request) = 0;
};

} // namespace webfetch
