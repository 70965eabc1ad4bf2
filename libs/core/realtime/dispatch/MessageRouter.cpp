#include "MessageRouter.hpp"
#include "TypeScanner.hpp"
#include "Log.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace rtmlink {

namespace MessageTypes {
    inline constexpr const char* Hello         = "hello";
    inline constexpr const char* Message       = "message";
    inline constexpr const char* ReactionAdded = "reaction_added";
}

MessageRouter::Outcome MessageRouter::route(const std::string& payload) {
    std::optional<std::string> type = TypeScanner::messageType(payload);

    m_events.rawMessage.emit(RawMessage{type, payload});

    if (!type) {
        RTMLINK_LOG_W("router", "Message without a top-level type ({} bytes)", payload.size());
        return Outcome::Unhandled;
    }
    return deliverTyped(*type, payload);
}

MessageRouter::Outcome MessageRouter::deliverTyped(const std::string& type, const std::string& payload) {
    try {
        if (type == MessageTypes::Hello) {
            m_events.hello.emit(HelloEvent{});
            return Outcome::Delivered;
        }
        if (type == MessageTypes::Message) {
            const auto evt = nlohmann::json::parse(payload).get<MessageEvent>();
            m_events.message.emit(evt);
            return Outcome::Delivered;
        }
        if (type == MessageTypes::ReactionAdded) {
            const auto evt = nlohmann::json::parse(payload).get<ReactionAddedEvent>();
            m_events.reactionAdded.emit(evt);
            return Outcome::Delivered;
        }
    } catch (const nlohmann::json::exception& e) {
        RTMLINK_LOG_W("router", "Failed to parse '{}' message: {}", type, e.what());
        m_events.parseError.emit(ParseErrorInfo{type, payload, e.what()});
        return Outcome::ParseFailed;
    } catch (const std::invalid_argument& e) {
        RTMLINK_LOG_W("router", "Invalid field in '{}' message: {}", type, e.what());
        m_events.parseError.emit(ParseErrorInfo{type, payload, e.what()});
        return Outcome::ParseFailed;
    }

    RTMLINK_LOG_W("router", "Unhandled message type '{}'", type);
    return Outcome::Unhandled;
}

} // namespace rtmlink
