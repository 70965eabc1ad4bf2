// rtm_cli: connects to a real-time messaging stream and prints its events.
//
//   rtm_cli --url wss://...            connect to a known message server URL
//   rtm_cli --token xoxb-...           obtain the URL through rtm.connect (or set SLACK_TOKEN)
//   --seconds N    run time, default 60 (0 = until Ctrl-C)
//   --timeout MS   handshake timeout, -1 = infinite
//   --config FILE  client config JSON; RTMLINK_* environment variables override it
//   --log LEVEL    trace|debug|info|warn|error|off, overrides RTMLINK_LOG
#include "realtime/RtmClient.hpp"
#include "realtime/RtmClientConfig.hpp"
#include "realtime/gateway/BeastWebApiGateway.hpp"
#include "realtime/ws/BeastWsTransport.hpp"
#include "Log.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <fmt/format.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct Options {
    std::optional<std::string> url;
    std::optional<std::string> token;
    std::optional<std::string> configPath;
    std::optional<long long> timeoutMs;
    long long seconds{60};
    std::optional<rtmlink::Log::Level> logLevel;
};

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " (--url URL | --token TOKEN) [--seconds N] [--timeout MS] [--config FILE] [--log LEVEL]\n"
              << "       SLACK_TOKEN is used when neither --url nor --token is given\n";
}

std::optional<Options> parseArgs(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        }
        auto value = next();
        if (!value) return std::nullopt;
        try {
            if (arg == "--url") opts.url = *value;
            else if (arg == "--token") opts.token = *value;
            else if (arg == "--config") opts.configPath = *value;
            else if (arg == "--timeout") opts.timeoutMs = std::stoll(*value);
            else if (arg == "--seconds") opts.seconds = std::stoll(*value);
            else if (arg == "--log") {
                opts.logLevel = rtmlink::Log::parseLevel(*value);
                if (!opts.logLevel) {
                    std::cerr << "--log: unknown level " << *value << "\n";
                    return std::nullopt;
                }
            }
            else {
                std::cerr << "unknown option " << arg << "\n";
                return std::nullopt;
            }
        } catch (const std::exception&) {
            std::cerr << arg << ": not a number: " << *value << "\n";
            return std::nullopt;
        }
    }
    if (!opts.url && !opts.token) {
        if (const char* env = std::getenv("SLACK_TOKEN")) opts.token = env;
    }
    if (!opts.url && !opts.token) {
        std::cerr << "no --url, --token or SLACK_TOKEN given\n";
        return std::nullopt;
    }
    if (opts.seconds < 0) {
        std::cerr << "--seconds must be non-negative\n";
        return std::nullopt;
    }
    return opts;
}

void wireOutput(rtmlink::RtmClient& client) {
    auto& ev = client.events();
    ev.hello.subscribe([](const rtmlink::HelloEvent&) {
        std::cout << "[hello] connection ready" << std::endl;
    });
    ev.message.subscribe([](const rtmlink::MessageEvent& m) {
        std::cout << fmt::format("[message] {} {}{}: {}", m.channel, m.user.value_or("?"),
                                 m.isThreadReply() ? " (thread)" : "", m.text.value_or(""))
                  << std::endl;
    });
    ev.reactionAdded.subscribe([](const rtmlink::ReactionAddedEvent& r) {
        std::cout << fmt::format("[reaction] {} added :{}: to a {}", r.user, r.reaction,
                                 rtmlink::toString(r.item.type))
                  << std::endl;
    });
    ev.rawMessage.subscribe([](const rtmlink::RawMessage& raw) {
        RTMLINK_LOG_D("cli", "raw {}: {}", raw.type.value_or("<none>"), raw.payload);
    });
    ev.parseError.subscribe([](const rtmlink::ParseErrorInfo& err) {
        std::cerr << fmt::format("[parse-error] {}: {}", err.type, err.error) << std::endl;
    });
}

} // namespace

int main(int argc, char** argv) {
    const auto opts = parseArgs(argc, argv);
    if (!opts) {
        printUsage(argv[0]);
        return 2;
    }
    if (opts->logLevel) {
        rtmlink::Log::setLevel(*opts->logLevel);
    }

    try {
        rtmlink::RtmClientConfig cfg = opts->configPath
            ? rtmlink::RtmClientConfig::fromJsonFile(*opts->configPath)
            : rtmlink::RtmClientConfig{};
        cfg.applyEnvironment();
        if (opts->timeoutMs) {
            cfg.connectTimeout = std::chrono::milliseconds(*opts->timeoutMs);
        }
        cfg.validate();

        std::string url;
        if (opts->url) {
            url = *opts->url;
        } else {
            rtmlink::BeastWebApiGateway gateway(*opts->token, rtmlink::BeastWsTransport::makeDefaultSslContext());
            const auto reply = gateway.rtmConnect(rtmlink::RtmConnectOptions{});
            if (!reply.ok) {
                RTMLINK_LOG_E("cli", "rtm.connect failed: {}", reply.error.value_or("unknown_error"));
                return 1;
            }
            url = reply.url;
        }

        boost::asio::io_context ioc;
        bool remoteEnded = false;
        rtmlink::RtmClient client(cfg);
        wireOutput(client);

        client.events().closed.subscribe([&](const rtmlink::CloseEvent& e) {
            std::cout << "[closed] " << rtmlink::toString(e.reason);
            if (e.cause) std::cout << ": " << *e.cause;
            std::cout << std::endl;
            if (e.reason != rtmlink::CloseReason::UserRequested) {
                boost::asio::post(ioc, [&] { remoteEnded = true; ioc.stop(); });
            }
        });

        const auto result = client.connect(url);
        if (!result) {
            RTMLINK_LOG_E("cli", "connect failed: {} {}", rtmlink::toString(result.status), result.error.value_or(""));
            return 1;
        }

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            RTMLINK_LOG_I("cli", "Signal {} received, disconnecting", sig);
            ioc.stop();
        });

        boost::asio::steady_timer deadline(ioc);
        if (opts->seconds > 0) {
            deadline.expires_after(std::chrono::seconds(opts->seconds));
            deadline.async_wait([&](const boost::system::error_code& ec) {
                if (!ec) ioc.stop();
            });
        }

        ioc.run();
        client.disconnect();
        return remoteEnded ? 1 : 0;
    } catch (const std::exception& e) {
        RTMLINK_LOG_E("cli", "{}", e.what());
        return 1;
    }
}
