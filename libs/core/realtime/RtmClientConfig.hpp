#pragma once
/*
rtmlink - RtmClientConfig
Role: Tunables of one RtmClient, with JSON-file and environment overlays.
Inputs/Outputs: Optional JSON file {"read_buffer_size", "connect_timeout_ms", "max_message_bytes"};
                environment RTMLINK_READ_BUFFER_SIZE, RTMLINK_CONNECT_TIMEOUT_MS, RTMLINK_MAX_MESSAGE_BYTES.
Threading: Plain value type.
Related: RtmClient.hpp, apps/rtm_cli/rtm_main.cpp.
*/
#include "RtmTypes.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace rtmlink {

struct RtmClientConfig {
    int readBufferSize{kDefaultReadBufferSize};
    std::chrono::milliseconds connectTimeout{kDefaultConnectTimeout};
    std::size_t maxMessageBytes{0};   // 0 = unlimited

    // Throws std::out_of_range when a value is outside its allowed range
    void validate() const;

    // Missing keys keep their defaults. Throws std::runtime_error when the file cannot be
    // read or parsed, std::out_of_range when a value is invalid.
    [[nodiscard]] static RtmClientConfig fromJsonFile(const std::string& path);

    using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

    // Overrides fields from the environment; unset variables leave fields untouched.
    // Throws std::invalid_argument for non-numeric values.
    void applyEnvironment(const EnvLookup& lookup = systemEnvironment);

    [[nodiscard]] static std::optional<std::string> systemEnvironment(const char* name);
};

} // namespace rtmlink
