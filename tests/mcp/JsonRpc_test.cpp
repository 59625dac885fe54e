#include "mcp/JsonRpc.hpp"
#include <gtest/gtest.h>

using namespace mcp_gw;

TEST(JsonRpcTest, ClassifiesMessages) {
    json request = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}};
    json notification = {{"jsonrpc", "2.0"}, {"method", "notifications/progress"}};
    json response = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}};
    json error = {{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", -1}, {"message", "x"}}}};

    EXPECT_TRUE(jsonrpc::is_request(request));
    EXPECT_FALSE(jsonrpc::is_notification(request));
    EXPECT_FALSE(jsonrpc::is_response(request));

    EXPECT_TRUE(jsonrpc::is_notification(notification));
    EXPECT_FALSE(jsonrpc::is_request(notification));

    EXPECT_TRUE(jsonrpc::is_response(response));
    EXPECT_TRUE(jsonrpc::is_response(error));
    EXPECT_FALSE(jsonrpc::is_response(json::array()));
    EXPECT_FALSE(jsonrpc::is_response({{"id", 1}}));
}

TEST(JsonRpcTest, IdKeysKeepTypesApart) {
    EXPECT_NE(jsonrpc::id_key(1), jsonrpc::id_key("1"));
    EXPECT_EQ(jsonrpc::id_key("gw-1"), jsonrpc::id_key(json("gw-1")));
}

TEST(JsonRpcTest, NotificationOmitsNullParams) {
    json message = jsonrpc::make_notification("notifications/initialized", json());
    EXPECT_FALSE(message.contains("params"));
    EXPECT_FALSE(message.contains("id"));
    EXPECT_EQ(message["jsonrpc"], "2.0");
}

TEST(JsonRpcTest, CancelledNotificationCarriesRequestId) {
    json message = jsonrpc::make_cancelled_notification("tok", "User cancelled operation");
    EXPECT_EQ(message["method"], "notifications/cancelled");
    EXPECT_EQ(message["params"]["requestId"], "tok");
    EXPECT_EQ(message["params"]["reason"], "User cancelled operation");
}
