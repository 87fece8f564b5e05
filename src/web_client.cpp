#include "web_client.hpp"
#include "beast_transport.hpp"
#include "cookie_file.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace webfetch {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

WebClient WebClient::create() {
    return create(ClientOptions{});
}

WebClient WebClient::create(const ClientOptions& options) {
    return WebClient(options, std::make_shared<BeastTransport>(options));
}

WebClient::WebClient(const ClientOptions& options,
                     std::shared_ptr<Transport> transport,
                     SleepFunction sleep)
    : mOptions(options)
    , mTransport(std::move(transport))
    , mJar(std::make_shared<CookieJar>())
    , mSleep(std::move(sleep))
{
    if (!mTransport) {
        throw std::invalid_argument("WebClient requires a transport");
    }
    if (!mSleep) {
        mSleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

std::string WebClient::get(const std::string& url, const Headers& headers) {
    return fetch("GET", url, headers, nullptr);
}

std::string WebClient::post(const std::string& url, const Headers& headers,
                            std::istream& payload) {
    return fetch("POST", url, headers, &payload);
}

std::string WebClient::post(const std::string& url, const Headers& headers,
                            const std::string& payload) {
    return customRequest("POST", url, headers, payload);
}

std::string WebClient::customRequest(const std::string& method, const std::string& url,
                                     const Headers& headers, std::istream* payload) {
    return fetch(method, url, headers, payload);
}

std::string WebClient::customRequest(const std::string& method, const std::string& url,
                                     const Headers& headers, const std::string& payload) {
    std::istringstream in(payload);
    return fetch(method, url, headers, &in);
}

std::string WebClient::fetch(const std::string& method, const std::string& url,
                             const Headers& headers, std::istream* payload)
{
    Request request;
    request.method  = method;
    request.url     = parseOrThrow(url);
    request.headers = headers;

    if (payload != nullptr) {
        std::string body{std::istreambuf_iterator<char>(*payload),
                         std::istreambuf_iterator<char>()};
        if (payload->bad()) {
            throw RequestError("Failed to read request body for " + method +
                               " " + url);
        }
        request.body = std::move(body);
    }

    log(request.method + " " + toString(request.url));

    const int maxTries = std::max(0, mOptions.maxTries);
    for (int attempt = 0; attempt <= maxTries; ++attempt) {
        try {
            return sendOnce(request);
        } catch (const TransportError& e) {
            if (attempt == maxTries) {
                log(std::string("aborting fetch: ") + e.what());
                throw;
            }

            const auto delay = mOptions.effectiveRetryDelay();
            log("retry after " + std::to_string(delay.count()) +
                " ms due to call failure: " + e.what());
            mSleep(delay);
        }
    }

    throw TransportError("Max retries exceeded (unreachable)");
}

void WebClient::exportCookies(const std::string& filePath,
                              const std::string& siteUrl) const {
    const UrlParts site = parseOrThrow(siteUrl);
    writeCookieFile(filePath, mJar->cookies(site));
}

void WebClient::importCookies(const std::string& filePath, const std::string& siteUrl) {
    const std::vector<Cookie> records = readCookieFile(filePath);
    const UrlParts site = parseOrThrow(siteUrl);

    // Validate everything before touching the jar.
    std::vector<Cookie> scoped;
    scoped.reserve(records.size());
    for (const auto& record : records) {
        auto cookie = CookieJar::scopeTo(site, record);
        if (!cookie) {
            throw CookieIoError("Cookie '" + record.name + "' for domain '" +
                                record.domain + "' cannot be set from " + siteUrl);
        }
        scoped.push_back(std::move(*cookie));
    }
    mJar->setCookies(site, scoped);
}

// ---------------------------------------------------------------------------
// Private
// ---------------------------------------------------------------------------

std::string WebClient::sendOnce(const Request& initial) {
    Request request = initial;
    const int maxRedirects = std::max(0, mOptions.maxRedirects);

    for (int hop = 0;; ++hop) {
        Request outgoing = request;
        const std::string cookieHeader = mJar->cookieHeader(outgoing.url);
        if (!cookieHeader.empty()) {
            // A request carries a single Cookie field; extend the caller's.
            auto existing = outgoing.headers.find("Cookie");
            if (existing == outgoing.headers.end()) {
                outgoing.headers.emplace("Cookie", cookieHeader);
            } else if (existing->second.empty()) {
                existing->second = cookieHeader;
            } else {
                existing->second += "; " + cookieHeader;
            }
        }

        // Throws TransportError; nothing below runs unless a response exists.
        std::unique_ptr<ResponseStream> response = mTransport->roundTrip(outgoing);

        const unsigned int status = response->status();
        log("HTTP " + std::to_string(status));

        std::vector<std::string> setCookies;
        auto range = response->headers().equal_range("Set-Cookie");
        for (auto it = range.first; it != range.second; ++it) {
            setCookies.push_back(it->second);
        }
        if (!setCookies.empty()) {
            mJar->setCookieHeaders(request.url, setCookies);
        }

        auto location = response->headers().find("Location");
        if (!isRedirect(status) || location == response->headers().end()) {
            return response->readAll();
        }

        if (hop >= maxRedirects) {
            throw RedirectError("Stopped after " + std::to_string(maxRedirects) +
                                " redirects at " + toString(request.url));
        }

        const std::string next = resolveReference(request.url, location->second);
        UrlParts nextUrl;
        try {
            nextUrl = parseUrl(next);
        } catch (const std::invalid_argument& e) {
            throw RedirectError("Bad redirect target from " + toString(request.url) +
                                ": " + e.what());
        }
        log("redirect " + std::to_string(status) + " -> " + next);

        if (status != 307 && status != 308 && request.method != "HEAD") {
            request.method = "GET";
            request.body.reset();
            request.headers.erase("Content-Type");
            request.headers.erase("Content-Length");
        }
        if (nextUrl.host != request.url.host) {
            request.headers.erase("Authorization");
            request.headers.erase("Cookie");
        }
        request.url = std::move(nextUrl);
    }
}

void WebClient::log(const std::string& line) const {
    if (mOptions.verbose) {
        std::cerr << "[WebClient] " << line << "\n";
    }
}

UrlParts WebClient::parseOrThrow(const std::string& url) {
    try {
        return parseUrl(url);
    } catch (const std::invalid_argument& e) {
        throw UrlError(e.what());
    }
}

bool WebClient::isRedirect(unsigned int status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

} // namespace webfetch
