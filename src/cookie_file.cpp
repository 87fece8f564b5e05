#include "cookie_file.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <fstream>
#include <stdexcept>

namespace webfetch {

void to_json(nlohmann::json& j, const Cookie& cookie) {
    j = nlohmann::json{
        {"name",     cookie.name},
        {"value",    cookie.value},
        {"domain",   cookie.domain},
        {"path",     cookie.path},
        {"expires",  nullptr},
        {"secure",   cookie.secure},
        {"httpOnly", cookie.httpOnly},
        {"hostOnly", cookie.hostOnly},
        {"sameSite", cookie.sameSite}
    };
    if (cookie.expires) {
        j["expires"] = formatIso8601(*cookie.expires);
    }
}

void from_json(const nlohmann::json& j, Cookie& cookie) {
    cookie.name     = j.at("name").get<std::string>();
    cookie.value    = j.value("value", "");
    cookie.domain   = j.value("domain", "");
    cookie.path     = j.value("path", "");
    cookie.secure   = j.value("secure", false);
    cookie.httpOnly = j.value("httpOnly", false);
    cookie.hostOnly = j.value("hostOnly", false);
    cookie.sameSite = j.value("sameSite", "");

    cookie.expires.reset();
    if (j.contains("expires") && !j["expires"].is_null()) {
        const auto text = j["expires"].get<std::string>();
        auto tp = parseIso8601(text);
        if (!tp) {
            throw std::invalid_argument("bad expires timestamp '" + text + "'");
        }
        cookie.expires = *tp;
    }
}

std::vector<Cookie> cookiesFromJson(const nlohmann::json& document) {
    if (!document.is_array()) {
        throw CookieIoError("Cookie data is not a JSON array");
    }

    std::vector<Cookie> cookies;
    cookies.reserve(document.size());
    for (std::size_t i = 0; i < document.size(); ++i) {
        try {
            cookies.push_back(document[i].get<Cookie>());
        } catch (const nlohmann::json::exception& e) {
            throw CookieIoError("Malformed cookie record #" + std::to_string(i) +
                                ": " + e.what());
        } catch (const std::invalid_argument& e) {
            throw CookieIoError("Malformed cookie record #" + std::to_string(i) +
                                ": " + e.what());
        }
    }
    return cookies;
}

void writeCookieFile(const std::string& path, const std::vector<Cookie>& cookies) {
    // Serialize before truncating so a failure leaves the old file intact.
    // Cookie bytes come straight from Set-Cookie headers and need not be
    // UTF-8; invalid sequences become U+FFFD.
    std::string text;
    try {
        text = nlohmann::json(cookies).dump(
            2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        throw CookieIoError("Failed to serialize cookies for " + path + ": " + e.what());
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw CookieIoError("Cannot open cookie file for writing: " + path);
    }

    out << text << "\n";
    out.flush();
    if (!out) {
        throw CookieIoError("Failed to write cookie file: " + path);
    }
}

std::vector<Cookie> readCookieFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw CookieIoError("Cannot open cookie file: " + path);
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw CookieIoError("Failed to parse cookie file " + path + ": " + e.what());
    }
    return cookiesFromJson(document);
}

} // namespace webfetch
