#include "mcp/MCPClient.hpp"
#include "core/Errors.hpp"
#include "MockTransport.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mcp_gw;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

/**
 * @brief Healthy server that also answers one extra method
 */
MockTransport::Responder answering(const std::string& method, json result) {
    auto base = MockTransport::mcp_server();
    return [base, method, result](const json& written) -> json {
        if (written.value("method", "") == method) {
            return {{"jsonrpc", "2.0"}, {"id", written["id"]}, {"result", result}};
        }
        return base(written);
    };
}

json notification(int n) {
    return {{"jsonrpc", "2.0"}, {"method", "notifications/progress"}, {"params", {{"n", n}}}};
}

} // namespace

class MCPClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        mock_transport_raw = new MockTransport();
        mock_transport_raw->set_responder(MockTransport::mcp_server());
        options.handshake_timeout = 1000ms;
        options.stderr_tail_lines = 2;
        client = std::make_shared<MCPClient>("test-server",
                                             std::unique_ptr<ITransport>(mock_transport_raw),
                                             options);
    }

    void TearDown() override {
        client->close();
        client->wait_closed(2000ms);
    }

    MockTransport* mock_transport_raw = nullptr;
    ClientOptions options;
    std::shared_ptr<MCPClient> client;
};

TEST_F(MCPClientTest, HandshakeSendsInitializeThenInitialized) {
    client->connect();

    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
    auto written = mock_transport_raw->written();
    ASSERT_EQ(written.size(), 2);

    const json& init = written[0];
    EXPECT_EQ(init["method"], "initialize");
    EXPECT_EQ(init["params"]["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(init["params"]["capabilities"]["resources"].is_object());
    EXPECT_TRUE(init["params"]["capabilities"]["tools"].is_object());
    EXPECT_EQ(init["params"]["clientInfo"]["name"], "mcp-sse-gateway");

    EXPECT_EQ(written[1]["method"], "notifications/initialized");
    EXPECT_FALSE(written[1].contains("id"));
    EXPECT_EQ(client->server_info()["serverInfo"]["name"], "mock");
}

TEST_F(MCPClientTest, HandshakeWithoutProtocolVersionFails) {
    mock_transport_raw->set_responder([](const json& written) -> json {
        return {{"jsonrpc", "2.0"}, {"id", written["id"]}, {"result", {{"capabilities", json::object()}}}};
    });

    EXPECT_THROW(client->connect(), ConnectionError);
    EXPECT_EQ(client->status(), ConnectionStatus::Error);
    EXPECT_NE(client->last_error().find("protocolVersion"), std::string::npos);
    EXPECT_EQ(mock_transport_raw->close_count(), 1);
}

TEST_F(MCPClientTest, HandshakeErrorResponseFails) {
    mock_transport_raw->set_responder([](const json& written) -> json {
        return {{"jsonrpc", "2.0"}, {"id", written["id"]},
                {"error", {{"code", -32603}, {"message", "unsupported version"}}}};
    });

    EXPECT_THROW(client->connect(), ConnectionError);
    EXPECT_NE(client->last_error().find("unsupported version"), std::string::npos);
}

TEST_F(MCPClientTest, HandshakeTimesOut) {
    mock_transport_raw->set_responder(nullptr);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client->connect(), ConnectionError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, options.handshake_timeout);
    EXPECT_EQ(client->status(), ConnectionStatus::Error);
}

TEST_F(MCPClientTest, SendRequiresConnection) {
    EXPECT_THROW(client->send(notification(1)), SendError);

    client->connect();
    EXPECT_NO_THROW(client->send(notification(1)));

    mock_transport_raw->set_fail_writes(true);
    EXPECT_THROW(client->send(notification(2)), SendError);
}

TEST_F(MCPClientTest, FanOutPreservesOrderForEverySubscriber) {
    client->connect();

    std::mutex mutex;
    std::vector<int> first;
    std::vector<int> second;
    Subscriber a;
    a.on_message = [&](const json& m) {
        std::lock_guard<std::mutex> lock(mutex);
        first.push_back(m["params"]["n"].get<int>());
    };
    Subscriber b;
    b.on_message = [&](const json& m) {
        std::lock_guard<std::mutex> lock(mutex);
        second.push_back(m["params"]["n"].get<int>());
    };
    client->subscribe(a);
    client->subscribe(b);
    EXPECT_EQ(client->subscriber_count(), 2);

    for (int i = 0; i < 20; ++i) {
        mock_transport_raw->push_message(notification(i));
    }

    ASSERT_TRUE(eventually([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return first.size() == 20 && second.size() == 20;
    }));
    std::vector<int> expected(20);
    for (int i = 0; i < 20; ++i) {
        expected[i] = i;
    }
    EXPECT_EQ(first, expected);
    EXPECT_EQ(second, expected);
}

TEST_F(MCPClientTest, UnsubscribedCallbackStopsReceiving) {
    client->connect();

    std::atomic<int> count{0};
    Subscriber subscriber;
    subscriber.on_message = [&count](const json&) { ++count; };
    auto id = client->subscribe(subscriber);

    mock_transport_raw->push_message(notification(1));
    ASSERT_TRUE(eventually([&] { return count == 1; }));

    client->unsubscribe(id);
    client->unsubscribe(id);
    mock_transport_raw->push_message(notification(2));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(count, 1);
}

TEST_F(MCPClientTest, OnMessageReplacesPreviousHandler) {
    client->connect();

    std::atomic<int> old_calls{0};
    std::atomic<int> new_calls{0};
    client->on_message([&old_calls](const json&) { ++old_calls; });
    client->on_message([&new_calls](const json&) { ++new_calls; });

    mock_transport_raw->push_message(notification(1));
    ASSERT_TRUE(eventually([&] { return new_calls == 1; }));
    EXPECT_EQ(old_calls, 0);
}

TEST_F(MCPClientTest, ResponsesReachOnlyTheWaiter) {
    client->connect();

    std::atomic<int> broadcast{0};
    Subscriber subscriber;
    subscriber.on_message = [&broadcast](const json&) { ++broadcast; };
    client->subscribe(subscriber);

    json response = client->call("ping", json::object(), 1000ms);
    EXPECT_TRUE(response["result"].is_object());

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(broadcast, 0);
}

TEST_F(MCPClientTest, RequestTimeoutForgetsPendingEntry) {
    client->connect();

    std::promise<json> late;
    Subscriber subscriber;
    subscriber.on_message = [&late](const json& m) { late.set_value(m); };
    client->subscribe(subscriber);

    json request = {{"jsonrpc", "2.0"}, {"id", "slow-1"}, {"method", "tools/call"}, {"params", json::object()}};
    EXPECT_THROW(client->request(request, 50ms), RequestTimeoutError);

    // The late response has no waiter any more and is broadcast instead
    mock_transport_raw->push_message({{"jsonrpc", "2.0"}, {"id", "slow-1"}, {"result", json::object()}});
    auto future = late.get_future();
    ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(future.get()["id"], "slow-1");
}

TEST_F(MCPClientTest, DuplicateInFlightIdIsRejected) {
    client->connect();

    json request = {{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"}, {"params", json::object()}};
    auto first = std::async(std::launch::async, [&] { return client->request(request, 2000ms); });
    ASSERT_FALSE(mock_transport_raw->wait_for_written("tools/call", 1000ms).is_null());

    EXPECT_THROW(client->request(request, 100ms), SendError);

    mock_transport_raw->push_message({{"jsonrpc", "2.0"}, {"id", 7}, {"result", {{"ok", true}}}});
    EXPECT_EQ(first.get()["result"]["ok"], true);
}

TEST_F(MCPClientTest, TransportCloseFailsPendingRequests) {
    client->connect();

    std::promise<void> closed;
    Subscriber subscriber;
    subscriber.on_close = [&closed] { closed.set_value(); };
    client->subscribe(subscriber);

    auto pending = std::async(std::launch::async, [&] {
        return client->call("tools/call", json::object(), MCPClient::kNoTimeout);
    });
    ASSERT_FALSE(mock_transport_raw->wait_for_written("tools/call", 1000ms).is_null());

    mock_transport_raw->close();
    EXPECT_THROW(pending.get(), TransportRuntimeError);
    EXPECT_EQ(closed.get_future().wait_for(1s), std::future_status::ready);
    EXPECT_EQ(client->status(), ConnectionStatus::Disconnected);
    EXPECT_TRUE(client->wait_closed(1000ms));
}

TEST_F(MCPClientTest, CallToolAttachesProgressToken) {
    mock_transport_raw->set_responder(answering("tools/call", {{"content", json::array()}}));
    client->connect();

    auto result = client->call_tool("search", {{"q", "x"}}, std::chrono::seconds(5));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status_code, 200);
    EXPECT_TRUE(result.data["content"].is_array());

    json sent = mock_transport_raw->wait_for_written("tools/call", 100ms);
    EXPECT_EQ(sent["params"]["name"], "search");
    EXPECT_EQ(sent["params"]["arguments"]["q"], "x");
    EXPECT_EQ(sent["params"]["_meta"]["progressToken"], result.progress_token);
    EXPECT_EQ(result.progress_token.size(), 36);
}

TEST_F(MCPClientTest, CallToolTimeoutCancelsAndReports) {
    client->connect();

    auto result = client->call_tool("slow", json::object(), std::chrono::seconds(1));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status_code, 408);
    EXPECT_EQ(result.error_type, "timeout");
    EXPECT_EQ(result.error, "Tool execution timed out after 1 seconds");

    json cancelled = mock_transport_raw->wait_for_written("notifications/cancelled", 500ms);
    ASSERT_FALSE(cancelled.is_null());
    EXPECT_EQ(cancelled["params"]["requestId"], result.progress_token);

    json body = result.to_json();
    EXPECT_EQ(body["errorType"], "timeout");
    EXPECT_EQ(body["toolName"], "slow");
    EXPECT_EQ(body["timeout"], 1);
    EXPECT_EQ(body["statusCode"], 408);
    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
}

TEST_F(MCPClientTest, CallToolHonoursFractionalTimeout) {
    client->connect();

    auto started = std::chrono::steady_clock::now();
    auto result = client->call_tool("slow", json::object(), ToolTimeout(0.25));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_GE(elapsed, 200ms);
    EXPECT_EQ(result.status_code, 408);
    EXPECT_DOUBLE_EQ(result.timeout_seconds, 0.25);
    EXPECT_EQ(result.error, "Tool execution timed out after 0.25 seconds");
    EXPECT_DOUBLE_EQ(result.to_json()["timeout"].get<double>(), 0.25);
}

TEST_F(MCPClientTest, ThrowingHandlerDoesNotStarveSubscribers) {
    client->connect();
    client->on_message([](const json&) { throw std::runtime_error("handler bug"); });

    std::atomic<int> delivered{0};
    Subscriber first;
    first.on_message = [](const json&) { throw std::runtime_error("subscriber bug"); };
    Subscriber second;
    second.on_message = [&delivered](const json&) { ++delivered; };
    client->subscribe(first);
    client->subscribe(second);

    mock_transport_raw->push_message(notification(1));
    mock_transport_raw->push_message(notification(2));

    EXPECT_TRUE(eventually([&] { return delivered.load() == 2; }));
    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
}

TEST_F(MCPClientTest, CallToolErrorResponse) {
    mock_transport_raw->set_responder([](const json& written) -> json {
        if (written.value("method", "") == "tools/call") {
            return {{"jsonrpc", "2.0"}, {"id", written["id"]},
                    {"error", {{"code", -32602}, {"message", "Unknown tool"}}}};
        }
        return MockTransport::mcp_server()(written);
    });
    client->connect();

    auto result = client->call_tool("nope", json::object(), std::nullopt);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status_code, 500);
    EXPECT_EQ(result.error, "Failed to call tool: Unknown tool (Code: -32602)");
}

TEST_F(MCPClientTest, ListToolsReducesFields) {
    mock_transport_raw->set_responder(answering("tools/list", {{"tools", json::array({
        {{"name", "echo"}, {"description", "Echo"}, {"inputSchema", {{"type", "object"}}}, {"extra", 1}}
    })}}));
    client->connect();

    json tools = client->list_tools(1000ms);
    ASSERT_EQ(tools.size(), 1);
    EXPECT_EQ(tools[0]["name"], "echo");
    EXPECT_FALSE(tools[0].contains("extra"));
}

TEST_F(MCPClientTest, StderrTailIsBoundedAndFannedOut) {
    client->connect();

    std::vector<std::string> seen;
    Subscriber subscriber;
    subscriber.on_stderr = [&seen](const std::string& chunk) { seen.push_back(chunk); };
    client->subscribe(subscriber);

    mock_transport_raw->emit_stderr("one");
    mock_transport_raw->emit_stderr("two");
    mock_transport_raw->emit_stderr("three");

    EXPECT_EQ(seen, (std::vector<std::string>{"one", "two", "three"}));
    EXPECT_EQ(client->recent_stderr(), (std::vector<std::string>{"two", "three"}));
}

TEST_F(MCPClientTest, CloseIsIdempotentForNetworkTransports) {
    client->connect();

    client->close();
    client->close();

    EXPECT_TRUE(client->wait_closed(1000ms));
    EXPECT_EQ(mock_transport_raw->close_count(), 1);
    EXPECT_EQ(client->status(), ConnectionStatus::Disconnected);
    EXPECT_EQ(client->supervisor(), nullptr);
    EXPECT_THROW(client->send(notification(1)), SendError);
}

TEST_F(MCPClientTest, CancelSendsNotification) {
    client->connect();

    client->cancel("token-1", "User cancelled operation");

    json cancelled = mock_transport_raw->wait_for_written("notifications/cancelled", 100ms);
    EXPECT_EQ(cancelled["params"]["requestId"], "token-1");
    EXPECT_EQ(cancelled["params"]["reason"], "User cancelled operation");
    EXPECT_EQ(client->status(), ConnectionStatus::Connected);
}
