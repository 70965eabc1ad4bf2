#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace rtmlink {

struct WsUrl {
    bool secure{true};     // wss:// vs ws://
    std::string host;
    std::string port;      // defaults to 443 / 80
    std::string target;    // path + query, "/" when absent
};

// Minimal ws:// / wss:// parser. Scheme match is case-insensitive.
// Returns std::nullopt for anything else, an empty host, or a port outside 1..65535.
//   wss://wss-primary.slack.com/link/?ticket=abc -> {true, "wss-primary.slack.com", "443", "/link/?ticket=abc"}
//   ws://127.0.0.1:9001                         -> {false, "127.0.0.1", "9001", "/"}
[[nodiscard]] std::optional<WsUrl> parseWsUrl(std::string_view url);

} // namespace rtmlink
