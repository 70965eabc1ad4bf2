#pragma once
/*
rtmlink - BeastWebApiGateway
Role: WebApiGateway over Boost.Beast HTTP + OpenSSL: form-encoded POSTs to https://slack.com/api/<method>.
Inputs/Outputs: Bearer token at construction; one blocking HTTPS request per call.
Threading: Each call owns a private io_context, so concurrent calls do not share I/O state.
Observability: Requests at DEBUG, failures at WARN under the "webapi" category.
Related: WebApiGateway.hpp, ConnectResponse.cpp.
Assumptions: The ssl::context verifies peers against the system trust store.
*/
#include "WebApiGateway.hpp"
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace rtmlink {

class BeastWebApiGateway : public WebApiGateway {
public:
    static constexpr std::chrono::milliseconds kDefaultRequestTimeout{10000};

    // Throws std::invalid_argument for an empty or blank token.
    // timeout < 0: requests are not bounded.
    BeastWebApiGateway(std::string token,
                       std::shared_ptr<boost::asio::ssl::context> sslCtx,
                       std::chrono::milliseconds timeout = kDefaultRequestTimeout);

    ConnectResponse rtmConnect(const RtmConnectOptions& options) override;

    // POSTs form to /api/<method> and returns the response body.
    // Throws TransportError on I/O failure or a non-2xx status.
    std::string call(const std::string& method, const std::string& form);

private:
    std::string m_token;
    std::shared_ptr<boost::asio::ssl::context> m_sslCtx;
    std::chrono::milliseconds m_timeout;
    const std::string m_host = "slack.com";
    const std::string m_port = "443";
    const std::string m_basePath = "/api/";
};

} // namespace rtmlink
