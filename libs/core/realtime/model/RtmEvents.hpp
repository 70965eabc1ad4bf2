#pragma once
/*
rtmlink - RtmEvents
Role: Plain data types for the events delivered by the real-time messaging stream.
Inputs/Outputs: Built by MessageRouter from JSON text (see RtmEvents.cpp); handed to subscribers by const reference.
Threading: Value types; no shared state.
Integration: Payload types of the RtmEvents signals declared in dispatch/RtmEventHub.hpp.
Related: RtmEvents.cpp, MessageRouter.hpp.
*/
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace rtmlink {

// Catch-all notification, raised for every text message before any typed event
struct RawMessage {
    std::optional<std::string> type;   // empty when no top-level "type" string could be found
    std::string payload;
};

// {"type":"hello"} - sent by the server right after the socket is established
struct HelloEvent {};

// {"type":"message", ...}
struct MessageEvent {
    std::string channel;                    // channel, private group or IM identifier
    std::optional<std::string> user;
    std::optional<std::string> text;        // may be absent when only attachments are set
    std::optional<std::string> thread_ts;   // set when the message is a thread reply
    std::string ts;
    std::optional<std::string> subtype;
    std::optional<std::string> team;
    std::optional<std::string> source_team;
    std::optional<std::string> username;

    [[nodiscard]] bool isThreadReply() const noexcept { return thread_ts.has_value(); }
};

enum class ReactionItemType {
    Message,
    File,
    FileComment
};

struct ReactionItem {
    ReactionItemType type{ReactionItemType::Message};
    std::optional<std::string> channel;
    std::optional<std::string> ts;
    std::optional<std::string> file;
    std::optional<std::string> file_comment;
};

// {"type":"reaction_added", ...}
struct ReactionAddedEvent {
    std::string user;        // who reacted
    std::string reaction;    // emoji name, without colons
    std::optional<std::string> item_user;   // author of the item reacted to
    ReactionItem item;
    std::optional<std::string> event_ts;
};

enum class CloseReason {
    RemoteClose,     // peer sent a close frame
    UserRequested,   // disconnect() was called
    TransportFault   // I/O error while the connection was open
};

struct CloseEvent {
    CloseReason reason;
    std::optional<std::string> cause;
};

// Raised when a recognized message type could not be deserialized
struct ParseErrorInfo {
    std::string type;
    std::string payload;
    std::string error;
};

[[nodiscard]] const char* toString(CloseReason reason) noexcept;
[[nodiscard]] const char* toString(ReactionItemType type) noexcept;

// Case-insensitive "message" / "file" / "file_comment"; throws std::invalid_argument otherwise
[[nodiscard]] ReactionItemType parseReactionItemType(std::string_view value);

void from_json(const nlohmann::json& j, MessageEvent& out);
void from_json(const nlohmann::json& j, ReactionItem& out);
void from_json(const nlohmann::json& j, ReactionAddedEvent& out);

} // namespace rtmlink
