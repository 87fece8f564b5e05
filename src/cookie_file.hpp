#pragma once

#include "cookie_jar.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace webfetch {

/// JSON shape of one cookie record:
///   {"name", "value", "domain", "path", "expires", "secure",
///    "httpOnly", "hostOnly", "sameSite"}
/// "expires" is an RFC 3339 UTC timestamp or null for session cookies.
void to_json(nlohmann::json& j, const Cookie& cookie);
void from_json(const nlohmann::json& j, Cookie& cookie);

/// Decode a JSON array of cookie records.
/// Throws CookieIoError if the document is not an array of valid records.
std::vector<Cookie> cookiesFromJson(const nlohmann::json& document);

/// Overwrite @p path with the cookies as a JSON array.
/// Throws CookieIoError if the file cannot be written.
void writeCookieFile(const std::string& path, const std::vector<Cookie>& cookies);

/// Read a file produced by writeCookieFile.
/// Throws CookieIoError if it is missing, unreadable or malformed.
std::vector<Cookie> readCookieFile(const std::string& path);

} // namespace webfetch
