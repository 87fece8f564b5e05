#pragma once

#include "util.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace webfetch {

struct Cookie {
    std::string name;
    std::string value;
    std::string domain;    // no leading dot
    std::string path;
    std::optional<std::chrono::system_clock::time_point> expires;  // nullopt = session
    bool        secure   = false;
    bool        httpOnly = false;
    bool        hostOnly = false;  // sent to exactly @c domain, not its subdomains
    std::string sameSite;          // "", "Lax", "Strict" or "None"

    bool isExpired(std::chrono::system_clock::time_point now =
                       std::chrono::system_clock::now()) const {
        return expires && *expires <= now;
    }
};

bool operator==(const Cookie& a, const Cookie& b);
inline bool operator!=(const Cookie& a, const Cookie& b) { return !(a == b); }

/// Parse one Set-Cookie header value. Domain and path are left as sent;
/// CookieJar fills in the defaults. Returns nullopt for a header without a
/// name=value pair.
std::optional<Cookie> parseSetCookie(const std::string& header,
                                     std::chrono::system_clock::time_point now =
                                         std::chrono::system_clock::now());

/// Cookie store keyed by (domain, path, name), in the manner of RFC 6265.
/// All members are safe to call from several threads.
class CookieJar {
public:
    /// Apply the scoping rules of @p url to @p cookie: empty domain becomes
    /// host-only, missing path becomes the URL's default path. Returns
    /// nullopt when @p url may not set the cookie.
    static std::optional<Cookie> scopeTo(const UrlParts& url, Cookie cookie);

    /// Store cookies received from @p url. Cookies @p url may not set are
    /// skipped; expired ones delete their stored counterpart.
    void setCookies(const UrlParts& url, const std::vector<Cookie>& cookies);

    /// Parse and store raw Set-Cookie header values. Malformed ones are skipped.
    void setCookieHeaders(const UrlParts& url,
                          const std::vector<std::string>& headerValues);

    /// Unexpired cookies that would be sent to @p url, longest path first.
    /// Expired entries met along the way are erased.
    std::vector<Cookie> cookies(const UrlParts& url);

    /// Value for the Cookie request header, empty when nothing matches.
    std::string cookieHeader(const UrlParts& url);

    std::size_t size() const;
    void clear();

private:
    struct Entry {
        Cookie        cookie;
        std::uint64_t created = 0;
    };

    void storeLocked(Cookie cookie, std::chrono::system_clock::time_point now);

    mutable std::mutex           mMutex;
    std::map<std::string, Entry> mEntries;  // key = domain;path;name
    std::uint64_t                mNextSeq = 0;
};

} // namespace webfetch
