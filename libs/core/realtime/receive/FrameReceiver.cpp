#include "FrameReceiver.hpp"
#include "Log.hpp"
#include <fmt/format.h>
#include <span>
#include <string>
#include <utility>

namespace rtmlink {

FrameReceiver::FrameReceiver(std::unique_ptr<WsTransport> transport,
                             ConnectionStateMachine& states,
                             ShutdownCoordinator& shutdown,
                             RtmEventHub& events,
                             Settings settings)
    : m_transport(std::move(transport))
    , m_states(states)
    , m_shutdown(shutdown)
    , m_events(events)
    , m_router(events)
    , m_assembler(settings.maxMessageBytes)
    , m_buffer(settings.readBufferSize)
{}

void FrameReceiver::run() {
    RTMLINK_LOG_D("rtm", "Receive loop started (buffer {} bytes)", m_buffer.size());

    CloseEvent closeEvent{CloseReason::UserRequested, std::nullopt};
    try {
        closeEvent = pump();
    } catch (const std::exception& e) {
        if (m_shutdown.stopRequested()) {
            // Errors raised by tearing down a read that disconnect() interrupted
            RTMLINK_LOG_D("rtm", "Receive ended during disconnect: {}", e.what());
            closeEvent = CloseEvent{CloseReason::UserRequested, std::nullopt};
        } else {
            RTMLINK_LOG_W("rtm", "Receive loop fault: {}", e.what());
            closeEvent = CloseEvent{CloseReason::TransportFault, std::string(e.what())};
        }
    } catch (...) {
        RTMLINK_LOG_E("rtm", "Receive loop fault: non-standard exception");
        closeEvent = CloseEvent{CloseReason::TransportFault, std::string("unknown receive error")};
    }

    m_events.closed.emit(closeEvent);
    RTMLINK_LOG_D("rtm", "Receive loop exiting: {} after {} messages", toString(closeEvent.reason), m_delivered);
    finish();
}

CloseEvent FrameReceiver::pump() {
    const std::stop_token stop = m_shutdown.stopToken();
    const std::span<char> buffer(m_buffer.data(), m_buffer.size());

    while (!stop.stop_requested()) {
        const ReceiveResult result = m_transport->receive(buffer, stop);
        if (result.cancelled) {
            break;
        }

        const IncomingFrame& frame = result.frame;
        if (frame.kind == FrameKind::Close) {
            RTMLINK_LOG_I("rtm", "Close frame received from server");
            return CloseEvent{CloseReason::RemoteClose, std::nullopt};
        }

        const std::span<const char> chunk(m_buffer.data(), frame.size);

        if (!frame.final) {
            if (!m_assembler.append(chunk)) {
                throw TransportError(fmt::format("message exceeds {} bytes", m_assembler.maxBytes()));
            }
            continue;
        }

        if (!m_assembler.open()) {
            if (!m_assembler.fits(0, chunk.size())) {
                throw TransportError(fmt::format("message exceeds {} bytes", m_assembler.maxBytes()));
            }
            deliver(frame.kind, std::string_view(chunk.data(), chunk.size()));
            continue;
        }

        if (!m_assembler.append(chunk)) {
            throw TransportError(fmt::format("message exceeds {} bytes", m_assembler.maxBytes()));
        }
        const std::string message = m_assembler.take();
        deliver(frame.kind, message);
    }

    return CloseEvent{CloseReason::UserRequested, std::nullopt};
}

void FrameReceiver::deliver(FrameKind kind, std::string_view payload) {
    if (kind == FrameKind::Binary) {
        RTMLINK_LOG_T("rtm", "Ignoring binary message ({} bytes)", payload.size());
        return;
    }
    m_router.route(std::string(payload));
    ++m_delivered;
    RTMLINK_LOG_EVERY_N(DEBUG, 1000, "rtm", "{} messages delivered on this connection", m_delivered);
}

void FrameReceiver::finish() {
    m_assembler.clear();
    if (m_transport) {
        m_transport->close();
        m_transport.reset();
    }
    try {
        m_states.finishStopping();
    } catch (const std::exception& e) {
        RTMLINK_LOG_E("rtm", "State observer failed during shutdown: {}", e.what());
    }
    m_shutdown.markCompleted();
}

} // namespace rtmlink
