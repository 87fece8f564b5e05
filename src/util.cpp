#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace webfetch {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string defaultPort(const std::string& scheme) {
    return scheme == "https" ? "443" : "80";
}

std::optional<std::chrono::system_clock::time_point>
parseWithFormat(const std::string& text, const char* format) {
    std::tm tm{};
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, format);
    if (in.fail()) {
        return std::nullopt;
    }
    // Two-digit years from the dashed cookie format.
    if (tm.tm_year + 1900 < 100) {
        const int yy = tm.tm_year + 1900;
        tm.tm_year = yy < 70 ? yy + 100 : yy;
    }
    const std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace

std::string UrlParts::path() const {
    auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = toLower(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme '" + parts.scheme +
                                    "': " + url);
    }

    // --- authority ([userinfo@]host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?#", hostStart);

    std::string authority;
    std::string rest;
    if (pathStart == std::string::npos) {
        authority = url.substr(hostStart);
    } else {
        authority = url.substr(hostStart, pathStart - hostStart);
        rest      = url.substr(pathStart);
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    // --- target (fragment is never sent) ---
    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        rest.erase(hash);
    }
    if (rest.empty() || rest[0] != '/') {
        rest.insert(0, "/");
    }
    parts.target = rest;

    // --- host / port ---
    std::string portText;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Invalid URL (unterminated IPv6 host): " + url);
        }
        parts.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw std::invalid_argument("Invalid URL (bad authority): " + url);
            }
            portText = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.find(':');
        if (colon == std::string::npos) {
            parts.host = authority;
        } else {
            parts.host = authority.substr(0, colon);
            portText   = authority.substr(colon + 1);
        }
    }
    parts.host = toLower(parts.host);

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }

    if (portText.empty()) {
        parts.port = defaultPort(parts.scheme);
    } else {
        if (!std::all_of(portText.begin(), portText.end(),
                         [](unsigned char c) { return std::isdigit(c); }) ||
            portText.size() > 5 || std::stoi(portText) > 65535) {
            throw std::invalid_argument("Invalid URL (bad port): " + url);
        }
        parts.port = portText;
    }
    return parts;
}

std::string toString(const UrlParts& parts) {
    std::string out = parts.scheme + "://";
    if (parts.host.find(':') != std::string::npos) {
        out += "[" + parts.host + "]";
    } else {
        out += parts.host;
    }
    if (parts.port != defaultPort(parts.scheme)) {
        out += ":" + parts.port;
    }
    out += parts.target;
    return out;
}

std::string resolveReference(const UrlParts& base, const std::string& reference) {
    if (reference.find("://") != std::string::npos) {
        return reference;
    }
    if (reference.rfind("//", 0) == 0) {
        return base.scheme + ":" + reference;
    }

    UrlParts resolved = base;
    if (reference.empty()) {
        return toString(resolved);
    }
    if (reference[0] == '/') {
        resolved.target = reference;
    } else if (reference[0] == '?') {
        resolved.target = base.path() + reference;
    } else {
        const std::string basePath = base.path();
        resolved.target = basePath.substr(0, basePath.rfind('/') + 1) + reference;
    }
    return toString(resolved);
}

std::optional<std::chrono::system_clock::time_point>
parseHttpDate(const std::string& text) {
    if (auto tp = parseWithFormat(text, "%a, %d %b %Y %H:%M:%S")) {
        return tp;
    }
    if (auto tp = parseWithFormat(text, "%a, %d-%b-%Y %H:%M:%S")) {
        return tp;
    }
    // Weekday is optional in the wild.
    auto comma = text.find(',');
    if (comma != std::string::npos) {
        const std::string tail = text.substr(comma + 1);
        if (auto tp = parseWithFormat(tail, " %d %b %Y %H:%M:%S")) {
            return tp;
        }
        return parseWithFormat(tail, " %d-%b-%Y %H:%M:%S");
    }
    return std::nullopt;
}

std::string formatIso8601(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::optional<std::chrono::system_clock::time_point>
parseIso8601(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
    char zone = 0;
    if (!(in >> zone) || zone != 'Z') {
        return std::nullopt;
    }
    const std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace webfetch
