#pragma once
#include <chrono>
#include <cstddef>
#include <span>
#include <stop_token>
#include <string>

namespace rtmlink {

enum class FrameKind { Text, Binary, Close };

// One delivery from the transport; the bytes themselves are in the caller's buffer
struct IncomingFrame {
    FrameKind kind{FrameKind::Text};
    std::size_t size{0};
    bool final{true};
};

struct ReceiveResult {
    bool cancelled{false};
    IncomingFrame frame;

    static ReceiveResult stopped() { return ReceiveResult{true, {}}; }
    static ReceiveResult of(FrameKind kind, std::size_t size, bool final) {
        return ReceiveResult{false, IncomingFrame{kind, size, final}};
    }
};

// Blocking, frame-oriented transport interface (no provider logic).
// One instance serves one connection and is owned by the receive loop once connected.
class WsTransport {
public:
    WsTransport() = default;
    virtual ~WsTransport() = default;

    WsTransport(const WsTransport&) = delete;
    WsTransport& operator=(const WsTransport&) = delete;

    // Handshake bounded by timeout (negative = unbounded).
    // Throws HandshakeTimeoutError on timeout and TransportError on any other failure.
    virtual void connect(const std::string& url, std::chrono::milliseconds timeout) = 0;

    // Reads at most buffer.size() bytes of the current message.
    // A frame larger than the buffer arrives as several non-final chunks.
    // Returns ReceiveResult::stopped() once stop is requested; a close frame from
    // the peer is reported as FrameKind::Close. Throws TransportError on I/O failure.
    virtual ReceiveResult receive(std::span<char> buffer, std::stop_token stop) = 0;

    // Best-effort close handshake; never throws.
    virtual void close() noexcept = 0;
};

} // namespace rtmlink
