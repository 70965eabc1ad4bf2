#include "RtmClientConfig.hpp"
#include "Log.hpp"
#include <nlohmann/json.hpp>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace rtmlink {

namespace {

long long parseInteger(const char* name, std::string_view text) {
    long long value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw std::invalid_argument(std::string(name) + ": not an integer: '" + std::string(text) + "'");
    }
    return value;
}

} // namespace

void RtmClientConfig::validate() const {
    if (readBufferSize < 1) {
        throw std::out_of_range("readBufferSize must be at least 1, got " + std::to_string(readBufferSize));
    }
    if (connectTimeout < kInfiniteTimeout) {
        throw std::out_of_range("connectTimeout must be -1 (infinite) or non-negative, got "
                                + std::to_string(connectTimeout.count()));
    }
}

RtmClientConfig RtmClientConfig::fromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("RtmClientConfig: failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& ex) {
        throw std::runtime_error("RtmClientConfig: failed to parse JSON from " + path + ": " + ex.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("RtmClientConfig: top level of " + path + " is not an object");
    }

    RtmClientConfig cfg;
    try {
        cfg.readBufferSize = j.value("read_buffer_size", cfg.readBufferSize);
        cfg.connectTimeout = std::chrono::milliseconds(j.value("connect_timeout_ms", cfg.connectTimeout.count()));
        const long long maxBytes = j.value("max_message_bytes", 0LL);
        if (maxBytes < 0) {
            throw std::out_of_range("max_message_bytes must be non-negative");
        }
        cfg.maxMessageBytes = static_cast<std::size_t>(maxBytes);
    } catch (const nlohmann::json::type_error& ex) {
        throw std::runtime_error("RtmClientConfig: wrong value type in " + path + ": " + ex.what());
    }
    cfg.validate();

    RTMLINK_LOG_I("rtm", "Loaded client config from {}", path);
    return cfg;
}

void RtmClientConfig::applyEnvironment(const EnvLookup& lookup) {
    if (auto v = lookup("RTMLINK_READ_BUFFER_SIZE")) {
        const long long n = parseInteger("RTMLINK_READ_BUFFER_SIZE", *v);
        if (n < 1 || n > std::numeric_limits<int>::max()) {
            throw std::out_of_range("RTMLINK_READ_BUFFER_SIZE out of range: " + *v);
        }
        readBufferSize = static_cast<int>(n);
    }
    if (auto v = lookup("RTMLINK_CONNECT_TIMEOUT_MS")) {
        connectTimeout = std::chrono::milliseconds(parseInteger("RTMLINK_CONNECT_TIMEOUT_MS", *v));
    }
    if (auto v = lookup("RTMLINK_MAX_MESSAGE_BYTES")) {
        const long long n = parseInteger("RTMLINK_MAX_MESSAGE_BYTES", *v);
        if (n < 0) {
            throw std::out_of_range("RTMLINK_MAX_MESSAGE_BYTES must be non-negative: " + *v);
        }
        maxMessageBytes = static_cast<std::size_t>(n);
    }
    validate();
}

std::optional<std::string> RtmClientConfig::systemEnvironment(const char* name) {
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

} // namespace rtmlink
