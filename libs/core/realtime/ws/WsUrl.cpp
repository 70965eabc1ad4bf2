#include "WsUrl.hpp"
#include <cctype>
#include <cstdlib>

namespace rtmlink {

namespace {

bool startsWithNoCase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
    }
    return true;
}

} // namespace

std::optional<WsUrl> parseWsUrl(std::string_view url) {
    WsUrl out;
    size_t pos = 0;
    if (startsWithNoCase(url, "wss://")) {
        out.secure = true;
        pos = 6;
    } else if (startsWithNoCase(url, "ws://")) {
        out.secure = false;
        pos = 5;
    } else {
        return std::nullopt;
    }

    // authority ends at the first '/', '?' or '#'
    const size_t end = url.find_first_of("/?#", pos);
    std::string_view hostport = (end == std::string_view::npos) ? url.substr(pos) : url.substr(pos, end - pos);
    if (hostport.empty()) return std::nullopt;

    const size_t colon = hostport.rfind(':');
    if (colon != std::string_view::npos) {
        out.host = std::string(hostport.substr(0, colon));
        out.port = std::string(hostport.substr(colon + 1));
        if (out.port.empty()) return std::nullopt;
        for (char c : out.port) {
            if (c < '0' || c > '9') return std::nullopt;
        }
        if (out.port.size() > 5) return std::nullopt;
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) return std::nullopt;
    } else {
        out.host = std::string(hostport);
        out.port = out.secure ? "443" : "80";
    }
    if (out.host.empty()) return std::nullopt;

    if (end == std::string_view::npos) {
        out.target = "/";
    } else {
        std::string_view rest = url.substr(end);
        // fragments never go on the wire
        if (const size_t hash = rest.find('#'); hash != std::string_view::npos) rest = rest.substr(0, hash);
        if (rest.empty() || rest.front() != '/') {
            out.target = "/" + std::string(rest);
        } else {
            out.target = std::string(rest);
        }
    }
    return out;
}

} // namespace rtmlink
