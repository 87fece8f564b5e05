#include "cookie_jar.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace webfetch {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isIpLiteral(const std::string& host) {
    if (host.find(':') != std::string::npos) {
        return true;
    }
    return !host.empty() &&
           std::all_of(host.begin(), host.end(), [](unsigned char c) {
               return std::isdigit(c) || c == '.';
           });
}

bool domainMatch(const std::string& host, const std::string& domain) {
    if (host == domain) {
        return true;
    }
    return !isIpLiteral(host) && host.size() > domain.size() &&
           host.compare(host.size() - domain.size(), domain.size(), domain) == 0 &&
           host[host.size() - domain.size() - 1] == '.';
}

bool pathMatch(const std::string& requestPath, const std::string& cookiePath) {
    if (requestPath == cookiePath) {
        return true;
    }
    if (requestPath.compare(0, cookiePath.size(), cookiePath) != 0) {
        return false;
    }
    return cookiePath.back() == '/' || requestPath[cookiePath.size()] == '/';
}

/// Directory of the request path: "/a/b/c" -> "/a/b", "/a" -> "/".
std::string defaultPath(const std::string& requestPath) {
    if (requestPath.empty() || requestPath[0] != '/') {
        return "/";
    }
    const auto slash = requestPath.rfind('/');
    return slash == 0 ? "/" : requestPath.substr(0, slash);
}

std::optional<long long> parseMaxAge(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    const bool negative = text[0] == '-';
    const std::string digits = negative ? text.substr(1) : text;
    if (digits.empty() || digits.size() > 12 ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    const long long n = std::stoll(digits);
    return negative ? -n : n;
}

std::string entryKey(const Cookie& c) {
    return c.domain + ";" + c.path + ";" + c.name;
}

} // namespace

bool operator==(const Cookie& a, const Cookie& b) {
    return a.name == b.name && a.value == b.value && a.domain == b.domain &&
           a.path == b.path && a.expires == b.expires && a.secure == b.secure &&
           a.httpOnly == b.httpOnly && a.hostOnly == b.hostOnly &&
           a.sameSite == b.sameSite;
}

std::optional<Cookie> parseSetCookie(const std::string& header,
                                     std::chrono::system_clock::time_point now) {
    Cookie cookie;
    std::optional<std::chrono::system_clock::time_point> maxAgeExpiry;

    std::istringstream ss(header);
    std::string segment;
    bool first = true;

    while (std::getline(ss, segment, ';')) {
        segment = trim(segment);

        if (first) {
            // First segment is name=value.
            const auto eq = segment.find('=');
            if (eq == std::string::npos) {
                return std::nullopt;
            }
            cookie.name  = trim(segment.substr(0, eq));
            cookie.value = trim(segment.substr(eq + 1));
            if (cookie.name.empty()) {
                return std::nullopt;
            }
            first = false;
            continue;
        }

        const auto eq = segment.find('=');
        const std::string attr  = toLower(trim(segment.substr(0, eq)));
        const std::string value =
            eq == std::string::npos ? "" : trim(segment.substr(eq + 1));

        if (attr == "domain") {
            std::string domain = toLower(value);
            if (!domain.empty() && domain[0] == '.') {
                domain.erase(0, 1);
            }
            cookie.domain = domain;
        } else if (attr == "path") {
            cookie.path = value;
        } else if (attr == "secure") {
            cookie.secure = true;
        } else if (attr == "httponly") {
            cookie.httpOnly = true;
        } else if (attr == "samesite") {
            const std::string mode = toLower(value);
            if (mode == "lax") {
                cookie.sameSite = "Lax";
            } else if (mode == "strict") {
                cookie.sameSite = "Strict";
            } else if (mode == "none") {
                cookie.sameSite = "None";
            }
        } else if (attr == "max-age") {
            if (auto seconds = parseMaxAge(value)) {
                maxAgeExpiry = *seconds <= 0
                    ? std::chrono::system_clock::time_point{}
                    : now + std::chrono::seconds(*seconds);
            }
        } else if (attr == "expires") {
            if (auto tp = parseHttpDate(value)) {
                cookie.expires = *tp;
            }
        }
    }

    if (first) {
        return std::nullopt;
    }
    // Max-Age wins over Expires.
    if (maxAgeExpiry) {
        cookie.expires = maxAgeExpiry;
    }
    return cookie;
}

std::optional<Cookie> CookieJar::scopeTo(const UrlParts& url, Cookie cookie) {
    if (cookie.name.empty()) {
        return std::nullopt;
    }

    if (!cookie.domain.empty() && cookie.domain[0] == '.') {
        cookie.domain.erase(0, 1);
    }
    cookie.domain = toLower(cookie.domain);

    if (cookie.domain.empty()) {
        cookie.domain   = url.host;
        cookie.hostOnly = true;
    } else if (cookie.hostOnly) {
        if (cookie.domain != url.host) {
            return std::nullopt;
        }
    } else {
        if (!domainMatch(url.host, cookie.domain)) {
            return std::nullopt;
        }
        // A bare label such as "com" may only name the host itself.
        if (cookie.domain.find('.') == std::string::npos && cookie.domain != url.host) {
            return std::nullopt;
        }
        if (cookie.domain == url.host && isIpLiteral(url.host)) {
            cookie.hostOnly = true;
        }
    }

    if (cookie.path.empty() || cookie.path[0] != '/') {
        cookie.path = defaultPath(url.path());
    }
    return cookie;
}

void CookieJar::storeLocked(Cookie cookie, std::chrono::system_clock::time_point now) {
    const std::string key = entryKey(cookie);
    if (cookie.isExpired(now)) {
        mEntries.erase(key);
        return;
    }

    auto it = mEntries.find(key);
    if (it != mEntries.end()) {
        // Replacing keeps the first creation order.
        it->second.cookie = std::move(cookie);
        return;
    }
    mEntries.emplace(key, Entry{std::move(cookie), mNextSeq++});
}

void CookieJar::setCookies(const UrlParts& url, const std::vector<Cookie>& cookies) {
    const auto now = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mMutex);
    for (const auto& c : cookies) {
        if (auto scoped = scopeTo(url, c)) {
            storeLocked(std::move(*scoped), now);
        }
    }
}

void CookieJar::setCookieHeaders(const UrlParts& url,
                                 const std::vector<std::string>& headerValues) {
    const auto now = std::chrono::system_clock::now();

    std::vector<Cookie> parsed;
    parsed.reserve(headerValues.size());
    for (const auto& value : headerValues) {
        if (auto cookie = parseSetCookie(value, now)) {
            parsed.push_back(std::move(*cookie));
        }
    }
    setCookies(url, parsed);
}

std::vector<Cookie> CookieJar::cookies(const UrlParts& url) {
    const auto now = std::chrono::system_clock::now();
    const std::string requestPath = url.path();

    std::vector<const Entry*> matching;
    std::lock_guard<std::mutex> lock(mMutex);
    for (auto it = mEntries.begin(); it != mEntries.end();) {
        const Entry& entry = it->second;
        const Cookie& c = entry.cookie;
        if (c.isExpired(now)) {
            it = mEntries.erase(it);
            continue;
        }
        ++it;
        if (c.secure && !url.isHttps()) continue;

        const bool hostOk = c.hostOnly ? url.host == c.domain
                                       : domainMatch(url.host, c.domain);
        if (hostOk && pathMatch(requestPath, c.path)) {
            matching.push_back(&entry);
        }
    }

    std::sort(matching.begin(), matching.end(), [](const Entry* a, const Entry* b) {
        if (a->cookie.path.size() != b->cookie.path.size()) {
            return a->cookie.path.size() > b->cookie.path.size();
        }
        return a->created < b->created;
    });

    std::vector<Cookie> result;
    result.reserve(matching.size());
    for (const Entry* e : matching) {
        result.push_back(e->cookie);
    }
    return result;
}

std::string CookieJar::cookieHeader(const UrlParts& url) {
    std::ostringstream out;
    bool first = true;
    for (const auto& c : cookies(url)) {
        if (!first) out << "; ";
        out << c.name << "=" << c.value;
        first = false;
    }
    return out.str();
}

std::size_t CookieJar::size() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mEntries.size();
}

void CookieJar::clear() {
    std::lock_guard<std::mutex> lock(mMutex);
    mEntries.clear();
}

} // namespace webfetch
