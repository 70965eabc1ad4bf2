#pragma once
/*
rtmlink - MessageRouter
Role: Classifies one complete text message by its top-level "type" and raises the matching events.
Inputs/Outputs: Takes the reassembled message text; emits on the RtmEventHub it was built with.
Threading: Called from the receive loop only. Subscribers run synchronously on that thread.
Observability: Unknown or missing types and parse failures are logged at warn; parse failures are
               also reported on the parseError signal.
Related: TypeScanner.hpp, RtmEvents.cpp, FrameReceiver.cpp.
*/
#include "RtmEventHub.hpp"
#include <string>

namespace rtmlink {

class MessageRouter {
public:
    enum class Outcome {
        Delivered,     // typed event raised
        Unhandled,     // no type, or a type without a typed event
        ParseFailed    // recognized type, but the payload could not be deserialized
    };

    explicit MessageRouter(RtmEventHub& events) : m_events(events) {}

    // rawMessage is raised first, then at most one typed event
    Outcome route(const std::string& payload);

private:
    RtmEventHub& m_events;

    Outcome deliverTyped(const std::string& type, const std::string& payload);
};

} // namespace rtmlink
