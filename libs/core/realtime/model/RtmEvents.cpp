#include "RtmEvents.hpp"
#include <nlohmann/json.hpp>
#include <string_view>

namespace rtmlink {

namespace {

inline char asciiToLower(unsigned char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c + ('a' - 'A'));
    }
    return static_cast<char>(c);
}

inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (asciiToLower(static_cast<unsigned char>(lhs[i])) != asciiToLower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

// Absent and null keys both map to an empty optional
std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

const char* toString(CloseReason reason) noexcept {
    switch (reason) {
        case CloseReason::RemoteClose:    return "RemoteClose";
        case CloseReason::UserRequested:  return "UserRequested";
        case CloseReason::TransportFault: return "TransportFault";
    }
    return "Unknown";
}

const char* toString(ReactionItemType type) noexcept {
    switch (type) {
        case ReactionItemType::Message:     return "message";
        case ReactionItemType::File:        return "file";
        case ReactionItemType::FileComment: return "file_comment";
    }
    return "unknown";
}

ReactionItemType parseReactionItemType(std::string_view value) {
    if (equalsIgnoreCase(value, "message"))      return ReactionItemType::Message;
    if (equalsIgnoreCase(value, "file"))         return ReactionItemType::File;
    if (equalsIgnoreCase(value, "file_comment")) return ReactionItemType::FileComment;
    throw std::invalid_argument("invalid reaction item type '" + std::string(value) + "'");
}

void from_json(const nlohmann::json& j, MessageEvent& out) {
    out.channel     = j.at("channel").get<std::string>();
    out.ts          = j.at("ts").get<std::string>();
    out.user        = optionalString(j, "user");
    out.text        = optionalString(j, "text");
    out.thread_ts   = optionalString(j, "thread_ts");
    out.subtype     = optionalString(j, "subtype");
    out.team        = optionalString(j, "team");
    out.source_team = optionalString(j, "source_team");
    out.username    = optionalString(j, "username");
}

void from_json(const nlohmann::json& j, ReactionItem& out) {
    out.type         = parseReactionItemType(j.at("type").get<std::string>());
    out.channel      = optionalString(j, "channel");
    out.ts           = optionalString(j, "ts");
    out.file         = optionalString(j, "file");
    out.file_comment = optionalString(j, "file_comment");
}

void from_json(const nlohmann::json& j, ReactionAddedEvent& out) {
    out.user      = j.at("user").get<std::string>();
    out.reaction  = j.at("reaction").get<std::string>();
    out.item      = j.at("item").get<ReactionItem>();
    out.item_user = optionalString(j, "item_user");
    out.event_ts  = optionalString(j, "event_ts");
}

} // namespace rtmlink
