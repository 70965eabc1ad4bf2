#pragma once
/*
rtmlink - RtmClient
Role: Real-time messaging client: owns the connection lifecycle and the receive thread of one stream.
Inputs/Outputs: connect(url) opens the WebSocket; events are raised on events() from the receive thread.
Threading: All public methods are safe from any thread. connect/disconnect and the state-gated
           setters are serialized by the state machine. Subscribers run on the receive thread,
           except stateChanged, which runs on whichever thread caused the transition.
Observability: Lifecycle at INFO, handshake failures at WARN under the "rtm" category.
Integration: The URL normally comes from WebApiGateway::rtmConnect(); see apps/rtm_cli.
Related: RtmClient.cpp, FrameReceiver.hpp, ConnectionStateMachine.hpp, RtmEventHub.hpp.
Assumptions: Subscribers do not block the receive thread for long; delivery is serial.
*/
#include "RtmClientConfig.hpp"
#include "RtmTypes.hpp"
#include "realtime/dispatch/RtmEventHub.hpp"
#include "realtime/lifecycle/ConnectionStateMachine.hpp"
#include "realtime/lifecycle/ShutdownCoordinator.hpp"
#include "realtime/ws/WsTransport.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace rtmlink {

class RtmClient {
public:
    using TransportFactory = std::function<std::unique_ptr<WsTransport>()>;

    // Beast transport with the system trust store
    explicit RtmClient(RtmClientConfig config = {});
    RtmClient(TransportFactory factory, RtmClientConfig config = {});

    // Disconnects when Started and joins the receive thread
    ~RtmClient();

    RtmClient(const RtmClient&) = delete;
    RtmClient& operator=(const RtmClient&) = delete;
    RtmClient(RtmClient&&) = delete;
    RtmClient& operator=(RtmClient&&) = delete;

    // Uses the configured connect timeout.
    // Throws std::invalid_argument for an empty url, std::out_of_range for a timeout below -1.
    ConnectResult connect(const std::string& url);
    ConnectResult connect(const std::string& url, std::chrono::milliseconds timeout);

    // true once the receive loop has exited and the state is Stopped.
    // false, with no side effects, when the client is not Started.
    bool disconnect();

    [[nodiscard]] RunState runState() const noexcept { return m_states.state(); }

    [[nodiscard]] RtmEventHub& events() noexcept { return m_events; }

    // Setters throw InvalidRunningStateError unless Stopped
    [[nodiscard]] int readBufferSize() const;
    void setReadBufferSize(int bytes);

    [[nodiscard]] std::size_t maxMessageBytes() const;
    void setMaxMessageBytes(std::size_t bytes);

    [[nodiscard]] std::chrono::milliseconds connectTimeout() const;
    void setConnectTimeout(std::chrono::milliseconds timeout);

private:
    RtmEventHub m_events;
    ConnectionStateMachine m_states;
    TransportFactory m_factory;

    mutable std::mutex m_configMx;
    RtmClientConfig m_config;

    std::mutex m_connMx;   // guards the connection members below; taken after the state lock, never before
    std::shared_ptr<ShutdownCoordinator> m_shutdown;
    std::thread m_thread;

    void reapPreviousThread();
    ConnectResult failHandshake(ConnectStatus status, const std::string& error);
};

} // namespace rtmlink
