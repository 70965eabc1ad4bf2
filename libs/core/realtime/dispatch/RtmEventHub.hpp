#pragma once
#include "Signal.hpp"
#include "realtime/RtmTypes.hpp"
#include "realtime/model/RtmEvents.hpp"

namespace rtmlink {

// Subscription table of one client: one ordered listener list per event kind.
// rawMessage fires for every text message, before the typed event for that message.
struct RtmEventHub {
    Signal<RawMessage>         rawMessage;
    Signal<HelloEvent>         hello;
    Signal<MessageEvent>       message;
    Signal<ReactionAddedEvent> reactionAdded;
    Signal<ParseErrorInfo>     parseError;
    Signal<CloseEvent>         closed;
    Signal<StateTransition>    stateChanged;
};

} // namespace rtmlink
