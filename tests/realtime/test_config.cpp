/*
rtmlink - Configuration Tests
Role: Verify RtmClientConfig validation, JSON loading and environment overlay,
      and parsing of rtm.connect replies
Testing Strategy: Temporary files for JSON, an injected lookup for the environment
*/
#include <gtest/gtest.h>
#include "realtime/RtmClientConfig.hpp"
#include "realtime/RtmTypes.hpp"
#include "realtime/gateway/WebApiGateway.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>

using namespace rtmlink;
using namespace std::chrono_literals;

namespace {

class TempJsonFile {
public:
    explicit TempJsonFile(const std::string& contents) {
        path_ = std::filesystem::temp_directory_path()
              / ("rtmlink_cfg_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)) + ".json");
        std::ofstream(path_) << contents;
    }
    ~TempJsonFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }
private:
    std::filesystem::path path_;
};

RtmClientConfig::EnvLookup fakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

} // namespace

// =============================================================================
// RtmClientConfig
// =============================================================================

TEST(RtmClientConfig, Defaults) {
    RtmClientConfig cfg;
    EXPECT_EQ(cfg.readBufferSize, 4096);
    EXPECT_EQ(cfg.connectTimeout, 5000ms);
    EXPECT_EQ(cfg.maxMessageBytes, 0u);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(RtmClientConfig, ValidateRanges) {
    RtmClientConfig cfg;
    cfg.readBufferSize = 0;
    EXPECT_THROW(cfg.validate(), std::out_of_range);

    cfg.readBufferSize = 1;
    cfg.connectTimeout = -1ms;
    EXPECT_NO_THROW(cfg.validate());

    cfg.connectTimeout = -2ms;
    EXPECT_THROW(cfg.validate(), std::out_of_range);
}

TEST(RtmClientConfig, LoadsJsonFile) {
    TempJsonFile file(R"({"read_buffer_size":1024,"connect_timeout_ms":-1,"max_message_bytes":65536})");
    const auto cfg = RtmClientConfig::fromJsonFile(file.path());
    EXPECT_EQ(cfg.readBufferSize, 1024);
    EXPECT_EQ(cfg.connectTimeout, kInfiniteTimeout);
    EXPECT_EQ(cfg.maxMessageBytes, 65536u);
}

TEST(RtmClientConfig, MissingKeysKeepDefaults) {
    TempJsonFile file(R"({"connect_timeout_ms":250})");
    const auto cfg = RtmClientConfig::fromJsonFile(file.path());
    EXPECT_EQ(cfg.readBufferSize, kDefaultReadBufferSize);
    EXPECT_EQ(cfg.connectTimeout, 250ms);
}

TEST(RtmClientConfig, FileErrors) {
    EXPECT_THROW(RtmClientConfig::fromJsonFile("/nonexistent/rtmlink.json"), std::runtime_error);

    TempJsonFile broken("{not json");
    EXPECT_THROW(RtmClientConfig::fromJsonFile(broken.path()), std::runtime_error);

    TempJsonFile wrongType(R"({"read_buffer_size":"big"})");
    EXPECT_THROW(RtmClientConfig::fromJsonFile(wrongType.path()), std::runtime_error);

    TempJsonFile outOfRange(R"({"read_buffer_size":0})");
    EXPECT_THROW(RtmClientConfig::fromJsonFile(outOfRange.path()), std::out_of_range);
}

TEST(RtmClientConfig, EnvironmentOverridesFields) {
    RtmClientConfig cfg;
    cfg.applyEnvironment(fakeEnv({
        {"RTMLINK_READ_BUFFER_SIZE", "512"},
        {"RTMLINK_CONNECT_TIMEOUT_MS", "-1"},
        {"RTMLINK_MAX_MESSAGE_BYTES", "1048576"}}));
    EXPECT_EQ(cfg.readBufferSize, 512);
    EXPECT_EQ(cfg.connectTimeout, kInfiniteTimeout);
    EXPECT_EQ(cfg.maxMessageBytes, 1048576u);
}

TEST(RtmClientConfig, UnsetEnvironmentLeavesFields) {
    RtmClientConfig cfg;
    cfg.readBufferSize = 99;
    cfg.applyEnvironment(fakeEnv({}));
    EXPECT_EQ(cfg.readBufferSize, 99);
}

TEST(RtmClientConfig, EnvironmentErrors) {
    RtmClientConfig cfg;
    EXPECT_THROW(cfg.applyEnvironment(fakeEnv({{"RTMLINK_READ_BUFFER_SIZE", "abc"}})), std::invalid_argument);
    EXPECT_THROW(cfg.applyEnvironment(fakeEnv({{"RTMLINK_READ_BUFFER_SIZE", "0"}})), std::out_of_range);
    EXPECT_THROW(cfg.applyEnvironment(fakeEnv({{"RTMLINK_CONNECT_TIMEOUT_MS", "-7"}})), std::out_of_range);
    EXPECT_THROW(cfg.applyEnvironment(fakeEnv({{"RTMLINK_MAX_MESSAGE_BYTES", "-1"}})), std::out_of_range);
}

// =============================================================================
// rtm.connect Replies
// =============================================================================

TEST(ConnectResponse, ParsesSuccessfulReply) {
    const auto r = parseConnectResponse(R"({
        "ok": true,
        "url": "wss://wss-primary.slack.com/link/?ticket=abc",
        "team": {"id": "T024BE7LD", "name": "Example Team", "domain": "example"},
        "self": {"id": "W123456", "name": "brautigan"}
    })");
    EXPECT_TRUE(r.ok);
    EXPECT_FALSE(r.error.has_value());
    EXPECT_EQ(r.url, "wss://wss-primary.slack.com/link/?ticket=abc");
    EXPECT_EQ(r.team.id, "T024BE7LD");
    EXPECT_EQ(r.team.name, "Example Team");
    EXPECT_EQ(r.team.domain, "example");
    EXPECT_FALSE(r.team.enterpriseId.has_value());
    EXPECT_EQ(r.self.id, "W123456");
    EXPECT_EQ(r.self.name, "brautigan");
}

TEST(ConnectResponse, EnterpriseFieldsAndWarnings) {
    const auto r = parseConnectResponse(R"({
        "ok": true, "url": "wss://x/", "warning": "superfluous_charset,missing_charset",
        "team": {"id": "T1", "name": "n", "domain": "d", "enterprise_id": "E1", "enterprise_name": "Org"}
    })");
    EXPECT_EQ(r.team.enterpriseId, "E1");
    EXPECT_EQ(r.team.enterpriseName, "Org");
    EXPECT_EQ(r.warnings, (std::vector<std::string>{"superfluous_charset", "missing_charset"}));
}

TEST(ConnectResponse, RefusedReplyCarriesError) {
    const auto r = parseConnectResponse(R"({"ok":false,"error":"invalid_auth"})");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, "invalid_auth");
    EXPECT_TRUE(r.url.empty());
}

TEST(ConnectResponse, MalformedRepliesThrow) {
    EXPECT_THROW(parseConnectResponse("<html>502</html>"), TransportError);
    EXPECT_THROW(parseConnectResponse("[]"), TransportError);
    EXPECT_THROW(parseConnectResponse(R"({"ok":true})"), TransportError);
    EXPECT_THROW(parseConnectResponse(R"({"ok":true,"url":5})"), TransportError);
}
