#include "beast_transport.hpp"
#include "errors.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#ifdef WEBFETCH_HAS_SSL
#include <boost/asio/ssl.hpp>
#include <boost/beast/ssl.hpp>
#endif

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace webfetch {

namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

constexpr const char* kUserAgent = "webfetch/1.0";

// Response header bytes accepted before the read fails.
constexpr std::uint32_t kMaxHeaderBytes = 10u << 20;

/// Absolute point in time a phase must finish by. Unset means unbounded.
class Deadline {
public:
    static Deadline after(milliseconds d) {
        Deadline out;
        if (d.count() > 0) {
            out.mEnd = Clock::now() + d;
        }
        return out;
    }

    /// This deadline, pulled in to at most @p cap from now.
    Deadline capped(milliseconds cap) const {
        Deadline out = *this;
        if (cap.count() > 0) {
            const auto end = Clock::now() + cap;
            if (!out.mEnd || end < *out.mEnd) {
                out.mEnd = end;
            }
        }
        return out;
    }

    std::optional<milliseconds> remaining() const {
        if (!mEnd) {
            return std::nullopt;
        }
        auto left = std::chrono::duration_cast<milliseconds>(*mEnd - Clock::now());
        // An already-expired deadline still has to fire through the stream
        // timer so the operation completes with beast::error::timeout.
        return std::max(left, milliseconds(1));
    }

private:
    std::optional<Clock::time_point> mEnd;
};

void arm(beast::tcp_stream& stream, const Deadline& deadline) {
    if (auto left = deadline.remaining()) {
        stream.expires_after(*left);
    } else {
        stream.expires_never();
    }
}

http::request<http::string_body> buildBeastRequest(const Request& request) {
    http::request<http::string_body> req;
    req.method_string(request.method);
    req.target(request.url.target);
    req.version(11);

    for (const auto& [name, value] : request.headers) {
        req.insert(name, value);
    }
    if (req.find(http::field::host) == req.end()) {
        const bool defaultPort =
            request.url.port == (request.url.isHttps() ? "443" : "80");
        std::string host = request.url.host.find(':') != std::string::npos
                               ? "[" + request.url.host + "]"
                               : request.url.host;
        if (!defaultPort) {
            host += ":" + request.url.port;
        }
        req.set(http::field::host, host);
    }
    if (req.find(http::field::user_agent) == req.end()) {
        req.set(http::field::user_agent, kUserAgent);
    }
    if (request.body) {
        req.body() = *request.body;
    }
    req.prepare_payload();
    return req;
}

template <class Stream>
constexpr bool kIsTls = !std::is_same<Stream, beast::tcp_stream>::value;

/// One connection, alive from connect until the response is destroyed.
template <class Stream>
class BeastConnection final : public ResponseStream {
public:
    BeastConnection(const Request& request,
                    milliseconds timeout,
                    milliseconds dialTimeout,
                    milliseconds tlsHandshakeTimeout)
        : mHost(request.url.host)
        , mPort(request.url.port)
        , mDeadline(Deadline::after(timeout))
        , mDialTimeout(dialTimeout)
        , mTlsHandshakeTimeout(tlsHandshakeTimeout)
    {
#ifdef WEBFETCH_HAS_SSL
        if constexpr (kIsTls<Stream>) {
            namespace ssl = net::ssl;
            mSslContext = std::make_unique<ssl::context>(ssl::context::tls_client);
            mSslContext->set_default_verify_paths();
            mSslContext->set_verify_mode(ssl::verify_peer);
            mStream = std::make_unique<Stream>(mIoc, *mSslContext);
            mStream->set_verify_callback(ssl::host_name_verification(mHost));
        } else
#endif
        {
            mStream = std::make_unique<Stream>(mIoc);
        }

        mParser.header_limit(kMaxHeaderBytes);
        mParser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        if (request.method == "HEAD") {
            mParser.skip(true);
        }

        connect();
        handshake();
        send(buildBeastRequest(request));
        readHeader();
    }

    ~BeastConnection() override {
        // Graceful shutdown (non-critical errors are swallowed).
        beast::error_code ec;
        beast::get_lowest_layer(*mStream).socket().shutdown(
            tcp::socket::shutdown_both, ec);
    }

    unsigned int status() const override {
        return mParser.get().result_int();
    }

    const Headers& headers() const override { return mHeaders; }

    std::string readAll() override {
        if (!mParser.is_done()) {
            beast::error_code ec;
            arm(beast::get_lowest_layer(*mStream), mDeadline);
            http::async_read(*mStream, mBuffer, mParser,
                             [&](beast::error_code e, std::size_t) { ec = e; });
            runToCompletion();
            if (ec) {
                throw ReadError("read body from " + mHost + ": " + ec.message());
            }
        }
        return std::move(mParser.get().body());
    }

private:
    void runToCompletion() {
        mIoc.restart();
        mIoc.run();
    }

    void connect() {
        const Deadline dial = mDeadline.capped(mDialTimeout);

        // --- resolve: the resolver has no timer of its own ---
        tcp::resolver resolver(mIoc);
        tcp::resolver::results_type results;
        beast::error_code ec;
        bool resolved = false;
        resolver.async_resolve(mHost, mPort,
            [&](beast::error_code e, tcp::resolver::results_type r) {
                ec       = e;
                results  = std::move(r);
                resolved = true;
            });
        mIoc.restart();
        if (auto left = dial.remaining()) {
            mIoc.run_for(*left);
        } else {
            mIoc.run();
        }
        if (!resolved) {
            resolver.cancel();
            throw TransportError("resolve " + mHost + ": timed out");
        }
        if (ec) {
            throw TransportError("resolve " + mHost + ": " + ec.message());
        }

        // --- connect ---
        auto& tcpStream = beast::get_lowest_layer(*mStream);
        arm(tcpStream, dial);
        tcpStream.async_connect(results,
            [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
        runToCompletion();
        if (ec) {
            throw TransportError("connect " + mHost + ":" + mPort + ": " +
                                 ec.message());
        }
    }

    void handshake() {
#ifdef WEBFETCH_HAS_SSL
        if constexpr (kIsTls<Stream>) {
            // SNI hostname.
            if (!SSL_set_tlsext_host_name(mStream->native_handle(), mHost.c_str())) {
                throw TransportError("Failed to set SNI hostname for " + mHost);
            }
            beast::error_code ec;
            arm(beast::get_lowest_layer(*mStream),
                mDeadline.capped(mTlsHandshakeTimeout));
            mStream->async_handshake(net::ssl::stream_base::client,
                                     [&](beast::error_code e) { ec = e; });
            runToCompletion();
            if (ec) {
                throw TransportError("TLS handshake with " + mHost + ": " +
                                     ec.message());
            }
        }
#endif
    }

    void send(http::request<http::string_body> req) {
        beast::error_code ec;
        arm(beast::get_lowest_layer(*mStream), mDeadline);
        http::async_write(*mStream, req,
                          [&](beast::error_code e, std::size_t) { ec = e; });
        runToCompletion();
        if (ec) {
            throw TransportError("write request to " + mHost + ": " + ec.message());
        }
    }

    void readHeader() {
        beast::error_code ec;
        arm(beast::get_lowest_layer(*mStream), mDeadline);
        http::async_read_header(*mStream, mBuffer, mParser,
                                [&](beast::error_code e, std::size_t) { ec = e; });
        runToCompletion();
        if (ec) {
            throw TransportError("read response from " + mHost + ": " +
                                 ec.message());
        }
        for (const auto& field : mParser.get()) {
            const auto name  = field.name_string();
            const auto value = field.value();
            mHeaders.emplace(std::string(name.data(), name.size()),
                             std::string(value.data(), value.size()));
        }
    }

    std::string  mHost;
    std::string  mPort;
    Deadline     mDeadline;
    milliseconds mDialTimeout;
    milliseconds mTlsHandshakeTimeout;

    net::io_context mIoc;
#ifdef WEBFETCH_HAS_SSL
    std::unique_ptr<net::ssl::context> mSslContext;
#endif
    std::unique_ptr<Stream> mStream;

    beast::flat_buffer                       mBuffer;
    http::response_parser<http::string_body> mParser;
    Headers                                  mHeaders;
};

} // namespace

BeastTransport::BeastTransport(const ClientOptions& options)
    : mTimeout(options.timeout)
    , mDialTimeout(options.dialTimeout)
    , mTlsHandshakeTimeout(options.tlsHandshakeTimeout) {}

std::unique_ptr<ResponseStream> BeastTransport::roundTrip(const Request& request) {
    try {
        if (request.url.isHttps()) {
#ifdef WEBFETCH_HAS_SSL
            return std::make_unique<
                BeastConnection<beast::ssl_stream<beast::tcp_stream>>>(
                request, mTimeout, mDialTimeout, mTlsHandshakeTimeout);
#else
            throw TransportError(
                "HTTPS not supported: built without OpenSSL (" +
                toString(request.url) + ")");
#endif
        }
        return std::make_unique<BeastConnection<beast::tcp_stream>>(
            request, mTimeout, mDialTimeout, mTlsHandshakeTimeout);
    } catch (const boost::system::system_error& e) {
        // Socket or SSL context setup failures surface as Boost exceptions.
        throw TransportError(e.what());
    }
}

} // namespace webfetch
