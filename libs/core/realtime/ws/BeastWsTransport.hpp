#pragma once
/*
rtmlink - BeastWsTransport
Role: WsTransport over Boost.Beast, for ws:// and wss:// endpoints.
Inputs/Outputs: connect() performs resolve/TCP/TLS/WebSocket handshakes; receive() yields one frame chunk per call.
Threading: Each call drives the private io_context on the calling thread. After connect() the
           instance is used by the receive thread only; the stop callback posts to the io_context,
           which is the one cross-thread entry point.
Observability: Handshake steps at DEBUG, failures at WARN under the "ws" category.
Related: WsTransport.hpp, WsUrl.hpp, FrameReceiver.hpp.
Assumptions: The ssl::context is shared with the owning client and configured for peer verification.
*/
#include "WsTransport.hpp"
#include "WsUrl.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace rtmlink {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

class BeastWsTransport : public WsTransport {
public:
    explicit BeastWsTransport(std::shared_ptr<ssl::context> sslCtx);
    ~BeastWsTransport() override;

    void connect(const std::string& url, std::chrono::milliseconds timeout) override;
    ReceiveResult receive(std::span<char> buffer, std::stop_token stop) override;
    void close() noexcept override;

    [[nodiscard]] bool isOpen();

    // Default TLS context: system trust store, peer verification on
    [[nodiscard]] static std::shared_ptr<ssl::context> makeDefaultSslContext();

private:
    using PlainStream = websocket::stream<beast::tcp_stream>;
    using TlsStream   = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
    using Deadline    = std::optional<std::chrono::steady_clock::time_point>;

    std::shared_ptr<ssl::context> sslCtx_;
    net::io_context ioc_;
    tcp::resolver resolver_;
    std::unique_ptr<PlainStream> plain_;
    std::unique_ptr<TlsStream> tls_;
    WsUrl url_;

    // Incremented per read; a stale cancel posted by a stop callback must not hit a later operation
    std::uint64_t readGeneration_{0};
    bool readPending_{false};

    template <class F>
    decltype(auto) withStream(F&& f) {
        if (tls_) return f(*tls_);
        return f(*plain_);
    }

    [[nodiscard]] bool hasStream() const noexcept { return tls_ || plain_; }

    // Runs the io_context until done is set; false once the deadline passes
    [[nodiscard]] bool runUntil(const bool& done, Deadline deadline);
    void cancelPending() noexcept;
    void checkStep(const beast::error_code& ec, const char* step, const bool& done, bool inTime);
    void resetStreams() noexcept;
};

} // namespace rtmlink
