#pragma once

#include "client_options.hpp"
#include "cookie_jar.hpp"
#include "transport.hpp"

#include <chrono>
#include <functional>
#include <istream>
#include <memory>
#include <string>

namespace webfetch {

/// Preconfigured HTTP client: cookie jar, timeouts, retry on transport
/// failure and optional request logging.
///
/// Every request call blocks until the body has been read or an exception
/// is thrown. Transport failures are retried up to ClientOptions::maxTries
/// times with a fixed pause in between; anything else propagates at once.
/// HTTP error statuses are not failures, their body is returned as-is.
class WebClient {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    /// Client with the documented default options.
    static WebClient create();
    static WebClient create(const ClientOptions& options);

    /// Client over a caller-supplied transport. @p sleep replaces the pause
    /// between attempts (std::this_thread::sleep_for when empty).
    WebClient(const ClientOptions& options,
              std::shared_ptr<Transport> transport,
              SleepFunction sleep = {});

    std::string get(const std::string& url, const Headers& headers = {});

    std::string post(const std::string& url, const Headers& headers,
                     std::istream& payload);
    std::string post(const std::string& url, const Headers& headers,
                     const std::string& payload);

    std::string customRequest(const std::string& method, const std::string& url,
                              const Headers& headers, std::istream* payload);
    std::string customRequest(const std::string& method, const std::string& url,
                              const Headers& headers, const std::string& payload);

    /// Build, dispatch and (on transport failure) retry one request.
    /// @p payload may be null; it is read to the end once, before the first
    /// attempt, so every retry re-sends the same bytes.
    /// @throws UrlError, RequestError, TransportError, ReadError, RedirectError
    std::string fetch(const std::string& method, const std::string& url,
                      const Headers& headers, std::istream* payload);

    /// Write every cookie the jar would send to @p siteUrl to @p filePath as
    /// JSON, replacing the file.
    /// @throws UrlError, CookieIoError
    void exportCookies(const std::string& filePath, const std::string& siteUrl) const;

    /// Load cookies written by exportCookies into the jar, scoped to
    /// @p siteUrl. Nothing is installed unless every record is valid.
    /// @throws UrlError, CookieIoError
    void importCookies(const std::string& filePath, const std::string& siteUrl);

    const ClientOptions& options() const { return mOptions; }
    CookieJar&           cookieJar()     { return *mJar; }

private:
    ClientOptions              mOptions;
    std::shared_ptr<Transport> mTransport;
    std::shared_ptr<CookieJar> mJar;
    SleepFunction              mSleep;

    /// One attempt: dispatch plus any redirect hops.
    std::string sendOnce(const Request& request);

    void log(const std::string& line) const;

    static UrlParts parseOrThrow(const std::string& url);
    static bool     isRedirect(unsigned int status);
};

} // namespace webfetch
