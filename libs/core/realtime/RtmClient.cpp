/*
rtmlink - RtmClient
Role: Connection lifecycle: handshake, receive-thread start, cooperative shutdown and restart.
Threading: connect() claims Starting before any I/O. Started is entered before the receive
           thread exists. The previous receive thread is joined by the next connect() and by
           the destructor.
Observability: "rtm" category; transitions at TRACE via ConnectionStateMachine.
Related: RtmClient.hpp, FrameReceiver.cpp, ShutdownCoordinator.hpp.
*/
#include "RtmClient.hpp"
#include "Log.hpp"
#include "realtime/receive/FrameReceiver.hpp"
#include "realtime/ws/BeastWsTransport.hpp"
#include <stdexcept>
#include <system_error>
#include <utility>

namespace rtmlink {

namespace {

// Client whose code is running on this thread (the receive loop, or a connect() in progress).
// disconnect() from such a thread must not wait for a loop that cannot finish until it returns.
thread_local const RtmClient* t_activeClient = nullptr;

class ActiveClientScope {
public:
    explicit ActiveClientScope(const RtmClient* client) : m_prev(t_activeClient) { t_activeClient = client; }
    ~ActiveClientScope() { t_activeClient = m_prev; }
    ActiveClientScope(const ActiveClientScope&) = delete;
    ActiveClientScope& operator=(const ActiveClientScope&) = delete;
private:
    const RtmClient* m_prev;
};

RtmClient::TransportFactory defaultTransportFactory() {
    auto sslCtx = BeastWsTransport::makeDefaultSslContext();
    return [sslCtx] { return std::make_unique<BeastWsTransport>(sslCtx); };
}

} // namespace

RtmClient::RtmClient(RtmClientConfig config)
    : RtmClient(defaultTransportFactory(), std::move(config))
{}

RtmClient::RtmClient(TransportFactory factory, RtmClientConfig config)
    : m_states([this](RunState from, RunState to) { m_events.stateChanged.emit(StateTransition{from, to}); })
    , m_factory(std::move(factory))
    , m_config(std::move(config))
{
    if (!m_factory) {
        throw std::invalid_argument("RtmClient: transport factory must not be empty");
    }
    m_config.validate();
}

RtmClient::~RtmClient() {
    try {
        disconnect();
    } catch (const std::exception& e) {
        RTMLINK_LOG_E("rtm", "disconnect() during destruction failed: {}", e.what());
    }
    std::lock_guard<std::mutex> lock(m_connMx);
    reapPreviousThread();
}

ConnectResult RtmClient::connect(const std::string& url) {
    return connect(url, connectTimeout());
}

ConnectResult RtmClient::connect(const std::string& url, std::chrono::milliseconds timeout) {
    if (url.empty()) {
        throw std::invalid_argument("connect: url must not be empty");
    }
    if (timeout < kInfiniteTimeout) {
        throw std::out_of_range("connect: timeout must be -1 (infinite) or non-negative, got "
                                + std::to_string(timeout.count()));
    }

    if (const auto observed = m_states.tryTransition(RunState::Stopped, RunState::Starting)) {
        RTMLINK_LOG_W("rtm", "connect() rejected: client is {}", toString(*observed));
        ConnectResult rejected;
        rejected.status = ConnectStatus::InvalidRunningState;
        rejected.observedState = observed;
        return rejected;
    }

    ActiveClientScope scope(this);
    {
        std::lock_guard<std::mutex> lock(m_connMx);
        reapPreviousThread();
        m_shutdown.reset();
    }

    RtmClientConfig cfg;
    {
        std::lock_guard<std::mutex> lock(m_configMx);
        cfg = m_config;
    }

    std::unique_ptr<WsTransport> transport;
    try {
        transport = m_factory();
        if (!transport) {
            throw TransportError("transport factory returned no transport");
        }
        RTMLINK_LOG_I("rtm", "Connecting to {} (timeout {} ms)", url, timeout.count());
        transport->connect(url, timeout);
    } catch (const HandshakeTimeoutError& e) {
        if (transport) transport->close();
        return failHandshake(ConnectStatus::HandshakeTimeout, e.what());
    } catch (const std::exception& e) {
        if (transport) transport->close();
        return failHandshake(ConnectStatus::HandshakeFailed, e.what());
    }

    auto shutdown = std::make_shared<ShutdownCoordinator>();
    auto receiver = std::make_shared<FrameReceiver>(
        std::move(transport), m_states, *shutdown, m_events,
        FrameReceiver::Settings{static_cast<std::size_t>(cfg.readBufferSize), cfg.maxMessageBytes});
    {
        std::lock_guard<std::mutex> lock(m_connMx);
        m_shutdown = shutdown;
    }

    if (const auto observed = m_states.tryTransition(RunState::Starting, RunState::Started)) {
        throw std::logic_error(std::string("connect: Starting was lost to ") + toString(*observed));
    }
    RTMLINK_LOG_I("rtm", "Connected to {}", url);

    try {
        std::lock_guard<std::mutex> lock(m_connMx);
        m_thread = std::thread([this, receiver, shutdown] {
            ActiveClientScope loopScope(this);
            receiver->run();
        });
    } catch (const std::system_error& e) {
        RTMLINK_LOG_E("rtm", "Failed to start the receive thread: {}", e.what());
        receiver.reset();
        m_states.finishStopping();
        shutdown->markCompleted();
        ConnectResult failed;
        failed.status = ConnectStatus::HandshakeFailed;
        failed.error = std::string("receive thread: ") + e.what();
        return failed;
    }

    return ConnectResult{};
}

bool RtmClient::disconnect() {
    // The coordinator is taken together with the claim; once observers run, the loop may already
    // have ended and a new connect() may have replaced m_shutdown.
    std::shared_ptr<ShutdownCoordinator> shutdown;
    const auto observed = m_states.tryTransition(RunState::Started, RunState::Stopping, [&] {
        std::lock_guard<std::mutex> lock(m_connMx);
        shutdown = m_shutdown;
    });
    if (observed) {
        RTMLINK_LOG_D("rtm", "disconnect() ignored: client is {}", toString(*observed));
        return false;
    }
    if (!shutdown) {
        throw std::logic_error("disconnect: Started without a shutdown coordinator");
    }

    RTMLINK_LOG_I("rtm", "Disconnecting");
    shutdown->requestStop();

    if (t_activeClient == this) {
        RTMLINK_LOG_D("rtm", "disconnect() on the receive thread: stop requested, not waiting");
        return true;
    }

    shutdown->waitCompleted();
    RTMLINK_LOG_I("rtm", "Disconnected");
    return true;
}

int RtmClient::readBufferSize() const {
    std::lock_guard<std::mutex> lock(m_configMx);
    return m_config.readBufferSize;
}

void RtmClient::setReadBufferSize(int bytes) {
    if (bytes < 1) {
        throw std::out_of_range("readBufferSize must be strictly greater than zero, got " + std::to_string(bytes));
    }
    m_states.guarded(RunState::Stopped, "setReadBufferSize", [&] {
        std::lock_guard<std::mutex> lock(m_configMx);
        if (m_config.readBufferSize == bytes) return;
        RTMLINK_LOG_T("rtm", "readBufferSize changed: {} -> {}", m_config.readBufferSize, bytes);
        m_config.readBufferSize = bytes;
    });
}

std::size_t RtmClient::maxMessageBytes() const {
    std::lock_guard<std::mutex> lock(m_configMx);
    return m_config.maxMessageBytes;
}

void RtmClient::setMaxMessageBytes(std::size_t bytes) {
    m_states.guarded(RunState::Stopped, "setMaxMessageBytes", [&] {
        std::lock_guard<std::mutex> lock(m_configMx);
        m_config.maxMessageBytes = bytes;
    });
}

std::chrono::milliseconds RtmClient::connectTimeout() const {
    std::lock_guard<std::mutex> lock(m_configMx);
    return m_config.connectTimeout;
}

void RtmClient::setConnectTimeout(std::chrono::milliseconds timeout) {
    if (timeout < kInfiniteTimeout) {
        throw std::out_of_range("connectTimeout must be -1 (infinite) or non-negative, got "
                                + std::to_string(timeout.count()));
    }
    std::lock_guard<std::mutex> lock(m_configMx);
    m_config.connectTimeout = timeout;
}

// Caller holds m_connMx
void RtmClient::reapPreviousThread() {
    if (!m_thread.joinable()) return;
    if (m_thread.get_id() == std::this_thread::get_id()) {
        // connect() issued from a handler on the finished loop's own thread
        m_thread.detach();
        return;
    }
    m_thread.join();
}

ConnectResult RtmClient::failHandshake(ConnectStatus status, const std::string& error) {
    RTMLINK_LOG_W("rtm", "Handshake failed ({}): {}", toString(status), error);
    if (const auto observed = m_states.tryTransition(RunState::Starting, RunState::Stopped)) {
        throw std::logic_error(std::string("connect: Starting was lost to ") + toString(*observed));
    }
    ConnectResult failed;
    failed.status = status;
    failed.error = error;
    return failed;
}

} // namespace rtmlink
