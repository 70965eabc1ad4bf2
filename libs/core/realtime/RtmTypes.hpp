#pragma once
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace rtmlink {

// Lifecycle of one connection: Stopped -> Starting -> Started -> Stopping -> Stopped
enum class RunState {
    Stopped,
    Starting,
    Started,
    Stopping
};

[[nodiscard]] inline const char* toString(RunState state) noexcept {
    switch (state) {
        case RunState::Stopped:  return "Stopped";
        case RunState::Starting: return "Starting";
        case RunState::Started:  return "Started";
        case RunState::Stopping: return "Stopping";
    }
    return "Unknown";
}

struct StateTransition {
    RunState from;
    RunState to;
};

enum class ConnectStatus {
    Success,
    InvalidRunningState,   // connect() attempted while not Stopped
    HandshakeTimeout,      // handshake exceeded the connect timeout
    HandshakeFailed        // resolve/TCP/TLS/WebSocket handshake error
};

[[nodiscard]] inline const char* toString(ConnectStatus status) noexcept {
    switch (status) {
        case ConnectStatus::Success:             return "Success";
        case ConnectStatus::InvalidRunningState: return "InvalidRunningState";
        case ConnectStatus::HandshakeTimeout:    return "HandshakeTimeout";
        case ConnectStatus::HandshakeFailed:     return "HandshakeFailed";
    }
    return "Unknown";
}

struct ConnectResult {
    ConnectStatus status{ConnectStatus::Success};
    std::optional<RunState> observedState;   // InvalidRunningState only
    std::optional<std::string> error;        // handshake failures only

    [[nodiscard]] bool ok() const noexcept { return status == ConnectStatus::Success; }
    explicit operator bool() const noexcept { return ok(); }
};

// -1 ms: wait for the handshake without bound
inline constexpr std::chrono::milliseconds kInfiniteTimeout{-1};
inline constexpr std::chrono::milliseconds kDefaultConnectTimeout{5000};
inline constexpr int kDefaultReadBufferSize = 4096;

// Misuse: a state-gated operation was attempted outside its lifecycle phase
class InvalidRunningStateError : public std::logic_error {
public:
    InvalidRunningStateError(const std::string& what, RunState state)
        : std::logic_error(what), m_state(state) {}
    [[nodiscard]] RunState state() const noexcept { return m_state; }
private:
    RunState m_state;
};

// I/O failure on the transport
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class HandshakeTimeoutError : public TransportError {
public:
    using TransportError::TransportError;
};

} // namespace rtmlink
