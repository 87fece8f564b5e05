#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace webfetch {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https", lower-cased
    std::string host;     // lower-cased, IPv6 literals without brackets
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path plus query (e.g. "/search?q=x")

    /// Path component of target, without the query.
    std::string path() const;
    bool isHttps() const { return scheme == "https"; }
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input or a scheme other than
/// http/https.
UrlParts parseUrl(const std::string& url);

/// Reassemble a URL, leaving out the port when it is the scheme default.
std::string toString(const UrlParts& parts);

/// Resolve a Location header value against the URL it was received from.
std::string resolveReference(const UrlParts& base, const std::string& reference);

/// "Sun, 06 Nov 1994 08:49:37 GMT". Also accepts the dashed
/// "Sunday, 06-Nov-94 08:49:37 GMT" form cookies still use.
std::optional<std::chrono::system_clock::time_point>
parseHttpDate(const std::string& text);

/// "1994-11-06T08:49:37Z", whole seconds, UTC.
std::string formatIso8601(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point>
parseIso8601(const std::string& text);

} // namespace webfetch
