#include "BeastWsTransport.hpp"
#include "realtime/RtmTypes.hpp"
#include "Log.hpp"
#include <boost/beast/http.hpp>
#include <boost/asio/post.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace rtmlink {

namespace http = beast::http;

namespace {
constexpr std::chrono::seconds kCloseTimeout{2};
constexpr const char* kUserAgent = "rtmlink/1.0";
}

BeastWsTransport::BeastWsTransport(std::shared_ptr<ssl::context> sslCtx)
    : sslCtx_(std::move(sslCtx))
    , resolver_(ioc_)
{}

BeastWsTransport::~BeastWsTransport() {
    close();
}

std::shared_ptr<ssl::context> BeastWsTransport::makeDefaultSslContext() {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    ctx->set_default_verify_paths();
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

bool BeastWsTransport::isOpen() {
    if (!hasStream()) return false;
    return withStream([](auto& ws) { return ws.is_open(); });
}

bool BeastWsTransport::runUntil(const bool& done, Deadline deadline) {
    ioc_.restart();
    while (!done) {
        const std::size_t ran = deadline ? ioc_.run_one_until(*deadline) : ioc_.run_one();
        if (ran == 0 && !done) {
            // deadline passed: abort the pending step and let its handler run
            cancelPending();
            ioc_.restart();
            ioc_.run();
            return false;
        }
    }
    return true;
}

void BeastWsTransport::cancelPending() noexcept {
    resolver_.cancel();
    if (hasStream()) {
        withStream([](auto& ws) { beast::get_lowest_layer(ws).cancel(); });
    }
}

void BeastWsTransport::checkStep(const beast::error_code& ec, const char* step, const bool& done, bool inTime) {
    if (!inTime) {
        RTMLINK_LOG_W("ws", "{} to {}:{} timed out", step, url_.host, url_.port);
        throw HandshakeTimeoutError(std::string(step) + " timed out");
    }
    if (done && ec) {
        RTMLINK_LOG_W("ws", "{} to {}:{} failed: {}", step, url_.host, url_.port, ec.message());
        throw TransportError(std::string(step) + " failed: " + ec.message());
    }
}

void BeastWsTransport::connect(const std::string& url, std::chrono::milliseconds timeout) {
    auto parsed = parseWsUrl(url);
    if (!parsed) {
        throw TransportError("invalid websocket url: " + url);
    }
    url_ = std::move(*parsed);
    resetStreams();

    Deadline deadline;
    if (timeout.count() >= 0) {
        deadline = std::chrono::steady_clock::now() + timeout;
    }

    try {
        // Resolve
        bool done = false;
        beast::error_code ec;
        tcp::resolver::results_type endpoints;
        resolver_.async_resolve(url_.host, url_.port,
            [&](beast::error_code e, tcp::resolver::results_type results) {
                ec = e; endpoints = std::move(results); done = true;
            });
        checkStep(ec, "resolve", done, runUntil(done, deadline));
        RTMLINK_LOG_D("ws", "Resolved {} ({} endpoints)", url_.host, endpoints.size());

        if (url_.secure) {
            tls_ = std::make_unique<TlsStream>(ioc_, *sslCtx_);
        } else {
            plain_ = std::make_unique<PlainStream>(ioc_);
        }

        // TCP connect
        done = false;
        withStream([&](auto& ws) {
            beast::get_lowest_layer(ws).async_connect(endpoints,
                [&](beast::error_code e, tcp::resolver::results_type::endpoint_type) { ec = e; done = true; });
        });
        checkStep(ec, "connect", done, runUntil(done, deadline));

        // TLS
        if (tls_) {
            auto* handle = tls_->next_layer().native_handle();
            if (!SSL_set_tlsext_host_name(handle, url_.host.c_str())) {
                beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
                throw TransportError("SNI setup failed: " + ssl_ec.message());
            }
            if (!SSL_set1_host(handle, url_.host.c_str())) {
                beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
                throw TransportError("hostname verification setup failed: " + ssl_ec.message());
            }
            tls_->next_layer().set_verify_mode(ssl::verify_peer);
            done = false;
            tls_->next_layer().async_handshake(ssl::stream_base::client,
                [&](beast::error_code e) { ec = e; done = true; });
            checkStep(ec, "TLS handshake", done, runUntil(done, deadline));
        }

        // WebSocket upgrade
        const bool defaultPort = (url_.secure && url_.port == "443") || (!url_.secure && url_.port == "80");
        const std::string hostHeader = defaultPort ? url_.host : url_.host + ":" + url_.port;
        done = false;
        withStream([&](auto& ws) {
            ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
            ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
                req.set(http::field::user_agent, kUserAgent);
            }));
            ws.async_handshake(hostHeader, url_.target, [&](beast::error_code e) { ec = e; done = true; });
        });
        checkStep(ec, "websocket handshake", done, runUntil(done, deadline));
    } catch (const TransportError&) {
        resetStreams();
        throw;
    }

    RTMLINK_LOG_I("ws", "WebSocket connected to {}:{}{}", url_.host, url_.port, url_.target);
}

ReceiveResult BeastWsTransport::receive(std::span<char> buffer, std::stop_token stop) {
    if (!hasStream()) {
        throw TransportError("receive on a transport that is not connected");
    }
    if (stop.stop_requested()) {
        return ReceiveResult::stopped();
    }

    bool done = false;
    beast::error_code ec;
    std::size_t bytes = 0;
    const std::uint64_t generation = ++readGeneration_;
    readPending_ = true;
    withStream([&](auto& ws) {
        ws.async_read_some(net::buffer(buffer.data(), buffer.size()),
            [&](beast::error_code e, std::size_t n) { ec = e; bytes = n; done = true; });
    });

    {
        // Runs on the thread calling request_stop(); the cancel itself executes inside run_one below
        std::stop_callback onStop(stop, [this, generation] {
            net::post(ioc_, [this, generation] {
                if (readPending_ && readGeneration_ == generation) {
                    cancelPending();
                }
            });
        });
        ioc_.restart();
        while (!done) {
            ioc_.run_one();
        }
    }
    readPending_ = false;

    if (ec == websocket::error::closed) {
        const auto reason = withStream([](auto& ws) { return ws.reason(); });
        RTMLINK_LOG_D("ws", "Close frame received (code {}, reason '{}')",
                      static_cast<int>(reason.code), std::string(reason.reason.data(), reason.reason.size()));
        return ReceiveResult::of(FrameKind::Close, 0, true);
    }
    if (ec == net::error::operation_aborted && stop.stop_requested()) {
        return ReceiveResult::stopped();
    }
    if (ec) {
        throw TransportError(ec.message());
    }

    return withStream([&](auto& ws) {
        return ReceiveResult::of(ws.got_text() ? FrameKind::Text : FrameKind::Binary,
                                 bytes, ws.is_message_done());
    });
}

void BeastWsTransport::close() noexcept {
    if (!hasStream()) return;
    try {
        if (isOpen()) {
            bool done = false;
            beast::error_code ec;
            withStream([&](auto& ws) {
                ws.async_close(websocket::close_code::normal, [&](beast::error_code e) { ec = e; done = true; });
            });
            if (!runUntil(done, std::chrono::steady_clock::now() + kCloseTimeout)) {
                RTMLINK_LOG_D("ws", "Close handshake with {} timed out", url_.host);
            } else if (ec) {
                RTMLINK_LOG_D("ws", "Close handshake with {} failed: {}", url_.host, ec.message());
            }
        }
    } catch (const std::exception& e) {
        RTMLINK_LOG_W("ws", "Error while closing websocket: {}", e.what());
    }
    resetStreams();
}

void BeastWsTransport::resetStreams() noexcept {
    plain_.reset();
    tls_.reset();
    readPending_ = false;
}

} // namespace rtmlink
