#include "BeastWebApiGateway.hpp"
#include "realtime/RtmTypes.hpp"
#include "Log.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rtmlink {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {
constexpr const char* kUserAgent = "rtmlink/1.0";
constexpr std::chrono::seconds kShutdownTimeout{2};
}

BeastWebApiGateway::BeastWebApiGateway(std::string token,
                                       std::shared_ptr<ssl::context> sslCtx,
                                       std::chrono::milliseconds timeout)
    : m_token(std::move(token))
    , m_sslCtx(std::move(sslCtx))
    , m_timeout(timeout)
{
    const bool blank = std::all_of(m_token.begin(), m_token.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        throw std::invalid_argument("BeastWebApiGateway: token must not be empty");
    }
    if (!m_sslCtx) {
        throw std::invalid_argument("BeastWebApiGateway: ssl context is required");
    }
}

ConnectResponse BeastWebApiGateway::rtmConnect(const RtmConnectOptions& options) {
    std::string form;
    auto append = [&form](const char* key, const char* value) {
        if (!form.empty()) form += '&';
        form += key;
        form += '=';
        form += value;
    };
    if (options.batchPresenceAware) append("batch_presence_aware", "true");
    if (options.presenceSub) append("presence_sub", "true");

    ConnectResponse response = parseConnectResponse(call("rtm.connect", form));
    if (response.ok) {
        RTMLINK_LOG_I("webapi", "rtm.connect ok: team '{}' as '{}'", response.team.name, response.self.name);
    } else {
        RTMLINK_LOG_W("webapi", "rtm.connect refused: {}", response.error.value_or("unknown_error"));
    }
    for (const auto& w : response.warnings) {
        RTMLINK_LOG_W("webapi", "rtm.connect warning: {}", w);
    }
    return response;
}

std::string BeastWebApiGateway::call(const std::string& method, const std::string& form) {
    const std::string target = m_basePath + method;
    RTMLINK_LOG_D("webapi", "POST https://{}{}", m_host, target);

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, *m_sslCtx);
    beast::error_code ec;

    auto fail = [&](const char* step) -> TransportError {
        RTMLINK_LOG_W("webapi", "{} {} failed: {}", method, step, ec.message());
        return TransportError(fmt::format("{} {} failed: {}", method, step, ec.message()));
    };
    auto runStep = [&](const char* step) {
        ioc.restart();
        ioc.run();
        if (ec) throw fail(step);
    };
    auto arm = [&] {
        if (m_timeout.count() >= 0) beast::get_lowest_layer(stream).expires_after(m_timeout);
        else beast::get_lowest_layer(stream).expires_never();
    };

    if (!SSL_set_tlsext_host_name(stream.native_handle(), m_host.c_str())) {
        ec.assign(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        throw fail("SNI setup");
    }
    if (!SSL_set1_host(stream.native_handle(), m_host.c_str())) {
        ec.assign(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        throw fail("hostname verification setup");
    }
    stream.set_verify_mode(ssl::verify_peer);

    tcp::resolver::results_type endpoints;
    resolver.async_resolve(m_host, m_port, [&](beast::error_code e, tcp::resolver::results_type r) {
        ec = e;
        endpoints = std::move(r);
    });
    runStep("resolve");

    arm();
    beast::get_lowest_layer(stream).async_connect(endpoints,
        [&](beast::error_code e, tcp::resolver::results_type::endpoint_type) { ec = e; });
    runStep("connect");

    arm();
    stream.async_handshake(ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
    runStep("TLS handshake");

    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, m_host);
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::authorization, "Bearer " + m_token);
    req.set(http::field::content_type, "application/x-www-form-urlencoded");
    req.body() = form;
    req.prepare_payload();

    arm();
    http::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
    runStep("write");

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    arm();
    http::async_read(stream, buffer, res, [&](beast::error_code e, std::size_t) { ec = e; });
    runStep("read");

    // Peers often skip close_notify; shutdown errors are not request failures
    beast::get_lowest_layer(stream).expires_after(kShutdownTimeout);
    stream.async_shutdown([&](beast::error_code e) { ec = e; });
    ioc.restart();
    ioc.run();
    if (ec && ec != net::ssl::error::stream_truncated) {
        RTMLINK_LOG_D("webapi", "TLS shutdown with {}: {}", m_host, ec.message());
    }

    const unsigned status = res.result_int();
    if (status < 200 || status >= 300) {
        RTMLINK_LOG_W("webapi", "{} returned HTTP {}", method, status);
        throw TransportError(fmt::format("{} returned HTTP {}", method, status));
    }
    return std::move(res.body());
}

} // namespace rtmlink
