#pragma once
/*
rtmlink - WebApiGateway
Role: RPC side of the service: obtains the WebSocket URL that RtmClient connects to.
Inputs/Outputs: rtmConnect(options) -> ConnectResponse (url plus limited team and self info).
Threading: Implementations are blocking and may be called from any thread.
Related: BeastWebApiGateway.hpp, apps/rtm_cli/rtm_main.cpp.
*/
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rtmlink {

struct ConnectTeamInfo {
    std::string id;
    std::string name;
    std::string domain;
    std::optional<std::string> enterpriseId;
    std::optional<std::string> enterpriseName;
};

struct ConnectSelfInfo {
    std::string id;
    std::string name;
};

struct ConnectResponse {
    bool ok{false};
    std::optional<std::string> error;     // set when ok is false
    std::vector<std::string> warnings;
    std::string url;                      // WebSocket message server URL
    ConnectTeamInfo team;
    ConnectSelfInfo self;
};

struct RtmConnectOptions {
    bool batchPresenceAware{false};   // presence changes as presence_change_batch events
    bool presenceSub{false};          // presence events only on subscription
};

// Throws TransportError when body is not a JSON object, or ok is true without a url
[[nodiscard]] ConnectResponse parseConnectResponse(std::string_view body);

class WebApiGateway {
public:
    virtual ~WebApiGateway() = default;

    // An ok:false reply is returned with error set. Throws TransportError on HTTP/I/O failure.
    virtual ConnectResponse rtmConnect(const RtmConnectOptions& options) = 0;
};

} // namespace rtmlink
