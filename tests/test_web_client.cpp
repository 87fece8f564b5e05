/// @file test_web_client.cpp
/// Unit tests for web_client.hpp: retry loop, request building, cookies and
/// redirects, driven through a scripted in-memory transport.

#include "errors.hpp"
#include "web_client.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <deque>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace webfetch;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Helper: scripted transport
// ---------------------------------------------------------------------------

namespace {

struct StubReply {
    bool         fail       = false;   // throw TransportError from roundTrip
    std::string  error;
    unsigned int status     = 200;
    Headers      headers;
    std::string  body;
    bool         failOnRead = false;   // throw ReadError from readAll
};

StubReply ok(const std::string& body, unsigned int status = 200) {
    StubReply r;
    r.status = status;
    r.body   = body;
    return r;
}

StubReply failure(const std::string& what) {
    StubReply r;
    r.fail  = true;
    r.error = what;
    return r;
}

StubReply redirect(unsigned int status, const std::string& location) {
    StubReply r;
    r.status = status;
    r.headers.emplace("Location", location);
    return r;
}

class StubResponse : public ResponseStream {
public:
    StubResponse(StubReply reply, int& closed)
        : mReply(std::move(reply)), mClosed(closed) {}
    ~StubResponse() override { ++mClosed; }

    unsigned int   status()  const override { return mReply.status; }
    const Headers& headers() const override { return mReply.headers; }

    std::string readAll() override {
        if (mReply.failOnRead) {
            throw ReadError("connection reset while reading body");
        }
        return mReply.body;
    }

private:
    StubReply mReply;
    int&      mClosed;
};

/// Replays a fixed script of replies; once the script runs out, repeats
/// the last entry.
class ScriptedTransport : public Transport {
public:
    explicit ScriptedTransport(std::vector<StubReply> script)
        : mScript(script.begin(), script.end()) {}

    std::unique_ptr<ResponseStream> roundTrip(const Request& request) override {
        requests.push_back(request);

        StubReply reply = mScript.front();
        if (mScript.size() > 1) {
            mScript.pop_front();
        }
        if (reply.fail) {
            throw TransportError(reply.error);
        }
        return std::make_unique<StubResponse>(std::move(reply), closed);
    }

    std::vector<Request> requests;
    int                  closed = 0;

private:
    std::deque<StubReply> mScript;
};

struct Harness {
    std::shared_ptr<ScriptedTransport>     transport;
    std::vector<std::chrono::milliseconds> sleeps;
    std::unique_ptr<WebClient>             client;

    Harness(const ClientOptions& options, std::vector<StubReply> script)
        : transport(std::make_shared<ScriptedTransport>(std::move(script)))
    {
        client = std::make_unique<WebClient>(
            options, transport,
            [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }
};

ClientOptions withTries(int maxTries) {
    ClientOptions o;
    o.maxTries = maxTries;
    return o;
}

std::vector<std::string> headerValues(const Headers& headers, const std::string& name) {
    std::vector<std::string> values;
    auto range = headers.equal_range(name);
    for (auto it = range.first; it != range.second; ++it) {
        values.push_back(it->second);
    }
    return values;
}

} // namespace

// ============================================================================
// Options
// ============================================================================

TEST(ClientOptions, DocumentedDefaults) {
    ClientOptions o;
    EXPECT_EQ(o.timeout, 60s);
    EXPECT_EQ(o.tlsHandshakeTimeout, 5s);
    EXPECT_EQ(o.dialTimeout, 5s);
    EXPECT_EQ(o.maxTries, 1);
    EXPECT_FALSE(o.verbose);
    EXPECT_FALSE(o.retryDelay.has_value());
    EXPECT_EQ(o.effectiveRetryDelay(), 60s);
}

TEST(ClientOptions, ExplicitRetryDelayWins) {
    ClientOptions o;
    o.retryDelay = 250ms;
    EXPECT_EQ(o.effectiveRetryDelay(), 250ms);
}

TEST(WebClient, CreateWithDefaultsKeepsDefaults) {
    auto client = WebClient::create();
    EXPECT_EQ(client.options().timeout, 60s);
    EXPECT_EQ(client.options().maxTries, 1);
    EXPECT_EQ(client.cookieJar().size(), 0u);
}

TEST(WebClient, CreateWithOptionsKeepsSnapshot) {
    ClientOptions o;
    o.timeout  = 3s;
    o.maxTries = 4;
    auto client = WebClient::create(o);
    EXPECT_EQ(client.options().timeout, 3s);
    EXPECT_EQ(client.options().maxTries, 4);
}

TEST(WebClient, NullTransportIsRejected) {
    EXPECT_THROW(WebClient(ClientOptions{}, nullptr), std::invalid_argument);
}

// ============================================================================
// Success path
// ============================================================================

TEST(WebClientFetch, GetReturnsBody) {
    Harness h(ClientOptions{}, {ok("hello")});

    EXPECT_EQ(h.client->get("https://example.test/ok"), "hello");
    ASSERT_EQ(h.transport->requests.size(), 1u);
    EXPECT_EQ(h.transport->requests[0].method, "GET");
    EXPECT_EQ(toString(h.transport->requests[0].url), "https://example.test/ok");
    EXPECT_FALSE(h.transport->requests[0].body.has_value());
    EXPECT_TRUE(h.sleeps.empty());
}

TEST(WebClientFetch, FirstSuccessIgnoresRetryBudget) {
    for (int tries : {0, 1, 5}) {
        Harness h(withTries(tries), {ok("payload")});
        EXPECT_EQ(h.client->get("http://example.test/"), "payload");
        EXPECT_EQ(h.transport->requests.size(), 1u) << "maxTries=" << tries;
        EXPECT_TRUE(h.sleeps.empty());
    }
}

TEST(WebClientFetch, ErrorStatusIsReturnedNotRetried) {
    Harness h(withTries(3), {ok("server exploded", 500)});

    EXPECT_EQ(h.client->get("http://example.test/"), "server exploded");
    EXPECT_EQ(h.transport->requests.size(), 1u);
}

TEST(WebClientFetch, ResponseIsReleasedAfterSuccess) {
    Harness h(ClientOptions{}, {ok("x")});
    h.client->get("http://example.test/");
    EXPECT_EQ(h.transport->closed, 1);
}

// ============================================================================
// Retry loop
// ============================================================================

TEST(WebClientRetry, PermanentFailureMakesMaxTriesPlusOneAttempts) {
    for (int tries = 0; tries <= 4; ++tries) {
        Harness h(withTries(tries), {failure("connection refused")});

        EXPECT_THROW(h.client->get("http://example.test/"), TransportError);
        EXPECT_EQ(h.transport->requests.size(), static_cast<size_t>(tries + 1))
            << "maxTries=" << tries;
        EXPECT_EQ(h.sleeps.size(), static_cast<size_t>(tries));
    }
}

TEST(WebClientRetry, ZeroTriesMeansSingleAttemptWithoutSleep) {
    Harness h(withTries(0), {failure("timeout")});

    EXPECT_THROW(h.client->get("http://example.test/"), TransportError);
    EXPECT_EQ(h.transport->requests.size(), 1u);
    EXPECT_TRUE(h.sleeps.empty());
}

TEST(WebClientRetry, NegativeTriesBehavesLikeZero) {
    Harness h(withTries(-3), {failure("timeout")});

    EXPECT_THROW(h.client->get("http://example.test/"), TransportError);
    EXPECT_EQ(h.transport->requests.size(), 1u);
}

TEST(WebClientRetry, FailsTwiceThenSucceeds) {
    Harness h(withTries(2), {failure("reset"), failure("reset"), ok("ok")});

    EXPECT_EQ(h.client->get("http://example.test/"), "ok");
    EXPECT_EQ(h.transport->requests.size(), 3u);
    EXPECT_EQ(h.sleeps.size(), 2u);
}

TEST(WebClientRetry, ExhaustedBudgetRethrowsLastError) {
    ClientOptions o;
    o.maxTries = 1;
    o.timeout  = 1500ms;
    Harness h(o, {failure("first"), failure("E")});

    try {
        h.client->get("http://example.test/");
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_STREQ(e.what(), "E");
    }
    EXPECT_EQ(h.transport->requests.size(), 2u);
    ASSERT_EQ(h.sleeps.size(), 1u);
    EXPECT_EQ(h.sleeps[0], 1500ms);
}

TEST(WebClientRetry, SleepsForRetryDelayWhenSet) {
    ClientOptions o;
    o.maxTries   = 2;
    o.retryDelay = 20ms;
    Harness h(o, {failure("a"), failure("b"), ok("done")});

    EXPECT_EQ(h.client->get("http://example.test/"), "done");
    EXPECT_EQ(h.sleeps, (std::vector<std::chrono::milliseconds>{20ms, 20ms}));
}

TEST(WebClientRetry, ReadErrorIsNotRetried) {
    StubReply broken = ok("partial");
    broken.failOnRead = true;
    Harness h(withTries(3), {broken, ok("never reached")});

    EXPECT_THROW(h.client->get("http://example.test/"), ReadError);
    EXPECT_EQ(h.transport->requests.size(), 1u);
    EXPECT_TRUE(h.sleeps.empty());
    EXPECT_EQ(h.transport->closed, 1);
}

TEST(WebClientRetry, MalformedUrlFailsBeforeDispatch) {
    Harness h(withTries(3), {ok("x")});

    EXPECT_THROW(h.client->get("example.test/no-scheme"), UrlError);
    EXPECT_THROW(h.client->get("gopher://example.test/"), UrlError);
    EXPECT_TRUE(h.transport->requests.empty());
}

// ============================================================================
// Request building
// ============================================================================

TEST(WebClientRequest, RepeatedHeaderKeysAreAllSent) {
    Harness h(ClientOptions{}, {ok("")});

    Headers headers{
        {"Accept", "text/html"},
        {"X-Tag", "alpha"},
        {"X-Tag", "beta"},
        {"x-tag", "gamma"},
    };
    h.client->get("http://example.test/", headers);

    ASSERT_EQ(h.transport->requests.size(), 1u);
    const auto& sent = h.transport->requests[0].headers;
    EXPECT_EQ(headerValues(sent, "X-Tag"),
              (std::vector<std::string>{"alpha", "beta", "gamma"}));
    EXPECT_EQ(headerValues(sent, "Accept"), (std::vector<std::string>{"text/html"}));
}

TEST(WebClientRequest, PostStreamBodyIsResentOnRetry) {
    Harness h(withTries(1), {failure("reset"), ok("created", 201)});

    std::istringstream payload("name=widget&qty=3");
    EXPECT_EQ(h.client->post("http://example.test/items", {}, payload), "created");

    ASSERT_EQ(h.transport->requests.size(), 2u);
    for (const auto& req : h.transport->requests) {
        EXPECT_EQ(req.method, "POST");
        ASSERT_TRUE(req.body.has_value());
        EXPECT_EQ(*req.body, "name=widget&qty=3");
    }
}

TEST(WebClientRequest, CustomMethodWithStringBody) {
    Harness h(ClientOptions{}, {ok("patched")});

    EXPECT_EQ(h.client->customRequest("PATCH", "http://example.test/items/7",
                                      {{"Content-Type", "application/json"}},
                                      std::string(R"({"qty":4})")),
              "patched");
    const auto& req = h.transport->requests.at(0);
    EXPECT_EQ(req.method, "PATCH");
    EXPECT_EQ(req.body.value_or(""), R"({"qty":4})");
}

TEST(WebClientRequest, CustomMethodWithoutBody) {
    Harness h(ClientOptions{}, {ok("")});

    h.client->customRequest("DELETE", "http://example.test/items/7", {}, nullptr);
    const auto& req = h.transport->requests.at(0);
    EXPECT_EQ(req.method, "DELETE");
    EXPECT_FALSE(req.body.has_value());
}

// ============================================================================
// Cookies
// ============================================================================

TEST(WebClientCookies, SetCookieIsSentOnNextRequest) {
    StubReply login = ok("welcome");
    login.headers.emplace("Set-Cookie", "sid=abc; Path=/");
    login.headers.emplace("Set-Cookie", "theme=dark; Path=/");
    Harness h(ClientOptions{}, {login, ok("profile")});

    h.client->get("http://example.test/login");
    h.client->get("http://example.test/profile");

    ASSERT_EQ(h.transport->requests.size(), 2u);
    EXPECT_TRUE(headerValues(h.transport->requests[0].headers, "Cookie").empty());
    EXPECT_EQ(headerValues(h.transport->requests[1].headers, "Cookie"),
              (std::vector<std::string>{"sid=abc; theme=dark"}));
}

TEST(WebClientCookies, JarCookiesExtendCallerCookieHeader) {
    StubReply login = ok("welcome");
    login.headers.emplace("Set-Cookie", "sid=abc; Path=/");
    Harness h(ClientOptions{}, {login, ok("profile")});

    h.client->get("http://example.test/login");
    h.client->get("http://example.test/profile", {{"Cookie", "lang=en"}});

    ASSERT_EQ(h.transport->requests.size(), 2u);
    EXPECT_EQ(headerValues(h.transport->requests[1].headers, "Cookie"),
              (std::vector<std::string>{"lang=en; sid=abc"}));
}

TEST(WebClientCookies, CookiesAreNotSentToOtherHosts) {
    StubReply login = ok("welcome");
    login.headers.emplace("Set-Cookie", "sid=abc");
    Harness h(ClientOptions{}, {login, ok("other")});

    h.client->get("http://example.test/");
    h.client->get("http://elsewhere.test/");

    EXPECT_TRUE(headerValues(h.transport->requests[1].headers, "Cookie").empty());
}

// ============================================================================
// Redirects
// ============================================================================

TEST(WebClientRedirect, FollowsRelativeLocation) {
    Harness h(ClientOptions{}, {redirect(302, "/landing"), ok("landed")});

    EXPECT_EQ(h.client->get("http://example.test/start"), "landed");
    ASSERT_EQ(h.transport->requests.size(), 2u);
    EXPECT_EQ(toString(h.transport->requests[1].url), "http://example.test/landing");
    EXPECT_EQ(h.transport->closed, 2);
}

TEST(WebClientRedirect, SeeOtherTurnsPostIntoGet) {
    Harness h(ClientOptions{}, {redirect(303, "/result"), ok("done")});

    h.client->post("http://example.test/form", {{"Content-Type", "text/plain"}},
                   std::string("data"));
    const auto& follow = h.transport->requests.at(1);
    EXPECT_EQ(follow.method, "GET");
    EXPECT_FALSE(follow.body.has_value());
    EXPECT_TRUE(headerValues(follow.headers, "Content-Type").empty());
}

TEST(WebClientRedirect, TemporaryRedirectKeepsMethodAndBody) {
    Harness h(ClientOptions{}, {redirect(307, "http://mirror.test/upload"), ok("stored")});

    h.client->post("http://example.test/upload", {}, std::string("blob"));
    const auto& follow = h.transport->requests.at(1);
    EXPECT_EQ(follow.method, "POST");
    EXPECT_EQ(follow.body.value_or(""), "blob");
    EXPECT_EQ(follow.url.host, "mirror.test");
}

TEST(WebClientRedirect, CookieSetDuringRedirectIsSentToTarget) {
    StubReply hop = redirect(302, "/home");
    hop.headers.emplace("Set-Cookie", "sid=fresh; Path=/");
    Harness h(ClientOptions{}, {hop, ok("home")});

    h.client->get("http://example.test/login");
    EXPECT_EQ(headerValues(h.transport->requests.at(1).headers, "Cookie"),
              (std::vector<std::string>{"sid=fresh"}));
}

TEST(WebClientRedirect, AuthorizationIsDroppedAcrossHosts) {
    Harness h(ClientOptions{}, {redirect(302, "http://other.test/"), ok("")});

    h.client->get("http://example.test/", {{"Authorization", "Bearer t0k3n"}});
    EXPECT_EQ(headerValues(h.transport->requests.at(0).headers, "Authorization").size(), 1u);
    EXPECT_TRUE(headerValues(h.transport->requests.at(1).headers, "Authorization").empty());
}

TEST(WebClientRedirect, TooManyRedirectsThrows) {
    ClientOptions o;
    o.maxRedirects = 3;
    o.maxTries     = 2;
    Harness h(o, {redirect(301, "/loop")});

    EXPECT_THROW(h.client->get("http://example.test/loop"), RedirectError);
    EXPECT_EQ(h.transport->requests.size(), 4u);  // first request + 3 hops, no retry
    EXPECT_EQ(h.transport->closed, 4);
    EXPECT_TRUE(h.sleeps.empty());
}

TEST(WebClientRedirect, RedirectWithoutLocationIsReturned) {
    Harness h(ClientOptions{}, {ok("moved somewhere", 302)});
    EXPECT_EQ(h.client->get("http://example.test/"), "moved somewhere");
}

// ============================================================================
// Logging
// ============================================================================

TEST(WebClientLogging, VerboseLogsRequestRetryAndStatus) {
    ClientOptions o;
    o.verbose    = true;
    o.maxTries   = 1;
    o.retryDelay = 5ms;
    Harness h(o, {failure("refused"), ok("fine", 204)});

    testing::internal::CaptureStderr();
    h.client->get("http://example.test/path");
    const std::string log = testing::internal::GetCapturedStderr();

    EXPECT_NE(log.find("[WebClient] GET http://example.test/path"), std::string::npos) << log;
    EXPECT_NE(log.find("retry after 5 ms due to call failure: refused"), std::string::npos) << log;
    EXPECT_NE(log.find("HTTP 204"), std::string::npos) << log;
}

TEST(WebClientLogging, VerboseLogsAbort) {
    ClientOptions o;
    o.verbose  = true;
    o.maxTries = 0;
    Harness h(o, {failure("unreachable host")});

    testing::internal::CaptureStderr();
    EXPECT_THROW(h.client->get("http://example.test/"), TransportError);
    const std::string log = testing::internal::GetCapturedStderr();

    EXPECT_NE(log.find("aborting fetch: unreachable host"), std::string::npos) << log;
}

TEST(WebClientLogging, QuietClientWritesNothing) {
    Harness h(withTries(1), {failure("refused"), ok("fine")});

    testing::internal::CaptureStderr();
    h.client->get("http://example.test/");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST(WebClientLogging, VerbosityIsPerInstance) {
    ClientOptions loud;
    loud.verbose = true;
    Harness a(loud, {ok("a")});
    Harness b(ClientOptions{}, {ok("b")});

    testing::internal::CaptureStderr();
    b.client->get("http://quiet.test/");
    a.client->get("http://loud.test/");
    const std::string log = testing::internal::GetCapturedStderr();

    EXPECT_EQ(log.find("quiet.test"), std::string::npos) << log;
    EXPECT_NE(log.find("loud.test"), std::string::npos) << log;
}
