#include "config/GatewayConfig.hpp"
#include "core/Errors.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

using namespace mcp_gw;
using namespace std::chrono_literals;

TEST(GatewayConfigTest, DefaultsDeriveOrigin) {
    GatewayConfig config;
    EXPECT_EQ(config.origin(), "http://127.0.0.1:3000");

    config.host = "0.0.0.0";
    config.port = 8080;
    EXPECT_EQ(config.origin(), "http://localhost:8080");

    config.public_origin = "https://gw.example.com/";
    EXPECT_EQ(config.origin(), "https://gw.example.com");
}

TEST(GatewayConfigTest, MergeAppliesPresentKeysOnly) {
    GatewayConfig config;
    config.merge_json({
        {"port", 4000},
        {"sseEnabled", false},
        {"requestTimeoutMs", 1500},
        {"termGraceMs", 100},
        {"mcpServers", {
            {"files", {{"command", "node"}, {"args", {"files.js"}}}},
            {"remote", {{"transport", "websocket"}, {"websocketUrl", "ws://localhost:9000"}, {"disabled", true}}}
        }}
    });

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 4000);
    EXPECT_FALSE(config.sse_enabled);
    EXPECT_EQ(config.request_timeout, 1500ms);
    EXPECT_EQ(config.kill_grace, 5000ms);
    ASSERT_EQ(config.servers.size(), 2);
    EXPECT_EQ(config.servers[0].name, "files");
    EXPECT_TRUE(config.servers[1].disabled);
    EXPECT_EQ(config.servers[1].transport.kind(), TransportKind::WebSocket);
}

TEST(GatewayConfigTest, RejectsBadValues) {
    GatewayConfig config;
    EXPECT_THROW(config.merge_json(json::array()), ValidationError);
    EXPECT_THROW(config.merge_json({{"port", 70000}}), ValidationError);
    EXPECT_THROW(config.merge_json({{"port", "80"}}), ValidationError);
    EXPECT_THROW(config.merge_json({{"sseEnabled", "yes"}}), ValidationError);
    EXPECT_THROW(config.merge_json({{"handshakeTimeoutMs", -1}}), ValidationError);
    EXPECT_THROW(config.merge_json({{"mcpServers", json::array()}}), ValidationError);
}

TEST(GatewayConfigTest, DerivedOptions) {
    GatewayConfig config;
    config.handshake_timeout = 1000ms;
    config.term_grace = 200ms;
    config.kill_grace = 300ms;

    auto timers = std::make_shared<TimerQueue>();
    auto client = config.client_options(timers);
    EXPECT_EQ(client.handshake_timeout, 1000ms);
    EXPECT_EQ(client.shutdown.term_grace, 200ms);
    EXPECT_EQ(client.shutdown.kill_grace, 300ms);
    EXPECT_EQ(client.timers, timers);

    auto endpoint = config.endpoint_options();
    EXPECT_EQ(endpoint.public_origin, "http://127.0.0.1:3000");
    EXPECT_EQ(endpoint.reconnect_wait, 2500ms);
    timers->shutdown();
}

TEST(GatewayConfigTest, LoadFile) {
    std::string path = ::testing::TempDir() + "mcp_gw_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"host": "0.0.0.0", "logLevel": "debug"})";
    }

    GatewayConfig config;
    config.load_file(path);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.log_level, "debug");

    {
        std::ofstream out(path);
        out << "{not json";
    }
    EXPECT_THROW(config.load_file(path), ValidationError);
    std::remove(path.c_str());

    EXPECT_THROW(config.load_file("/nonexistent/mcp_gw.json"), ValidationError);
}
