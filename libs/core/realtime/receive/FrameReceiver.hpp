#pragma once
/*
rtmlink - FrameReceiver
Role: Receive loop of one connection: reads frame chunks, reassembles logical messages, routes text.
Inputs/Outputs: Owns the connected transport; raises events through MessageRouter and the closed signal.
Threading: run() is the body of the connection's dedicated thread and returns only after the
           transport has been released, the state is Stopped and the completion signal is set.
Performance: One fixed read buffer per connection; the arena only grows for multi-frame messages.
Observability: Loop start/exit at DEBUG, binary messages at TRACE, faults at WARN under "rtm".
Related: MessageAssembler.hpp, MessageRouter.hpp, ShutdownCoordinator.hpp, RtmClient.cpp.
Assumptions: The state machine, coordinator and event hub outlive run().
*/
#include "MessageAssembler.hpp"
#include "realtime/dispatch/MessageRouter.hpp"
#include "realtime/dispatch/RtmEventHub.hpp"
#include "realtime/lifecycle/ConnectionStateMachine.hpp"
#include "realtime/lifecycle/ShutdownCoordinator.hpp"
#include "realtime/ws/WsTransport.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace rtmlink {

class FrameReceiver {
public:
    struct Settings {
        std::size_t readBufferSize{kDefaultReadBufferSize};
        std::size_t maxMessageBytes{0};
    };

    FrameReceiver(std::unique_ptr<WsTransport> transport,
                  ConnectionStateMachine& states,
                  ShutdownCoordinator& shutdown,
                  RtmEventHub& events,
                  Settings settings);

    FrameReceiver(const FrameReceiver&) = delete;
    FrameReceiver& operator=(const FrameReceiver&) = delete;

    void run();

private:
    std::unique_ptr<WsTransport> m_transport;
    ConnectionStateMachine& m_states;
    ShutdownCoordinator& m_shutdown;
    RtmEventHub& m_events;
    MessageRouter m_router;
    MessageAssembler m_assembler;
    std::vector<char> m_buffer;
    std::uint64_t m_delivered{0};

    // Runs until cancellation, a close frame or a fault; returns the close notification
    CloseEvent pump();
    void deliver(FrameKind kind, std::string_view payload);
    void finish();
};

} // namespace rtmlink
