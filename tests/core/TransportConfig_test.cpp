#include "core/TransportConfig.hpp"
#include "core/Errors.hpp"
#include <gtest/gtest.h>

using namespace mcp_gw;
using json = nlohmann::json;

TEST(TransportConfigTest, StdioFromQuery) {
    auto config = TransportConfig::from_query({
        {"transportType", "stdio"},
        {"command", "node"},
        {"args", "server.js  --verbose"},
        {"env", R"({"API_KEY":"secret"})"}
    });

    ASSERT_EQ(config.kind(), TransportKind::Stdio);
    const auto& params = config.stdio_params();
    EXPECT_EQ(params.command, "node");
    ASSERT_EQ(params.args.size(), 2);
    EXPECT_EQ(params.args[0], "server.js");
    EXPECT_EQ(params.args[1], "--verbose");
    EXPECT_EQ(params.env.at("API_KEY"), "secret");
}

TEST(TransportConfigTest, WebSocketFromQuery) {
    auto config = TransportConfig::from_query({
        {"transportType", "websocket"},
        {"url", "ws://localhost:9000/mcp"}
    });

    ASSERT_EQ(config.kind(), TransportKind::WebSocket);
    EXPECT_EQ(config.websocket_params().url, "ws://localhost:9000/mcp");
    EXPECT_THROW(config.stdio_params(), std::logic_error);
}

TEST(TransportConfigTest, QueryValidationErrors) {
    try {
        TransportConfig::from_query({{"transportType", "stdio"}, {"env", "{not json"}, {"command", "x"}});
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Invalid env JSON");
    }

    try {
        TransportConfig::from_query({{"transportType", "stdio"}});
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Missing command parameter for stdio transport");
    }

    try {
        TransportConfig::from_query({{"transportType", "websocket"}});
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Missing url parameter for websocket transport");
    }

    EXPECT_THROW(TransportConfig::from_query({}), ValidationError);
    EXPECT_THROW(TransportConfig::from_query({{"transportType", "carrier-pigeon"}}), ValidationError);
    EXPECT_THROW(TransportConfig::from_query({{"transportType", "stdio"}, {"command", "x"}, {"env", "[1]"}}),
                 ValidationError);
}

TEST(TransportConfigTest, SseIsDeclaredButEndpointOnly) {
    auto config = TransportConfig::from_query({{"transportType", "sse"}, {"url", "http://example/sse"}});
    EXPECT_EQ(config.kind(), TransportKind::Sse);
    EXPECT_EQ(config.endpoint_params().endpoint, "http://example/sse");
}

TEST(TransportConfigTest, FromConfigEntry) {
    json entry = {
        {"command", "python3"},
        {"args", {"-m", "server"}},
        {"rootPath", "/srv/tools"},
        {"env", {
            {"PLAIN", "1"},
            {"WRAPPED", {{"value", "2"}, {"metadata", {{"isSecret", true}}}}}
        }}
    };

    auto config = TransportConfig::from_json(entry);
    ASSERT_EQ(config.kind(), TransportKind::Stdio);
    const auto& params = config.stdio_params();
    EXPECT_EQ(params.command, "python3");
    EXPECT_EQ(params.args, (std::vector<std::string>{"-m", "server"}));
    EXPECT_EQ(params.cwd, "/srv/tools");
    EXPECT_EQ(params.env.at("PLAIN"), "1");
    EXPECT_EQ(params.env.at("WRAPPED"), "2");
}

TEST(TransportConfigTest, FromConfigEntryWebSocket) {
    auto config = TransportConfig::from_json({{"transport", "websocket"}, {"websocketUrl", "ws://h:1/"}});
    EXPECT_EQ(config.kind(), TransportKind::WebSocket);
    EXPECT_EQ(config.describe(), "websocket: ws://h:1/");

    EXPECT_THROW(TransportConfig::from_json({{"transport", "stdio"}, {"args", "not-a-list"}, {"command", "x"}}),
                 ValidationError);
    EXPECT_THROW(TransportConfig::from_json(json::array()), ValidationError);
}

TEST(TransportConfigTest, SplitArgsDropsEmptyTokens) {
    EXPECT_TRUE(split_args("").empty());
    EXPECT_TRUE(split_args("   ").empty());
    EXPECT_EQ(split_args(" a  b\tc "), (std::vector<std::string>{"a", "b", "c"}));
}
