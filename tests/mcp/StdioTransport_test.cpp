#include "mcp/StdioTransport.hpp"
#include "mcp/MCPClient.hpp"
#include "core/Errors.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <mutex>

using namespace mcp_gw;
using namespace std::chrono_literals;

namespace {

StdioParams shell(const std::string& script) {
    StdioParams params;
    params.command = "sh";
    params.args = {"-c", script};
    return params;
}

StdioParams fake_server(std::vector<std::string> args = {}) {
    StdioParams params;
    params.command = FAKE_MCP_SERVER_PATH;
    params.args = std::move(args);
    return params;
}

} // namespace

TEST(StdioTransportTest, ReadsNewlineDelimitedMessages) {
    auto transport = StdioTransport::launch(shell(
        "printf '{\"a\":1}\\r\\n\\nnot json\\n{\"b\":2}\\n{\"partial\":'"));

    EXPECT_EQ(transport->read_message()["a"], 1);
    EXPECT_EQ(transport->read_message()["b"], 2);
    EXPECT_TRUE(transport->read_message().is_null());
    EXPECT_TRUE(transport->read_message().is_null());
    EXPECT_FALSE(transport->is_open());
}

TEST(StdioTransportTest, MessageSplitAcrossWrites) {
    auto transport = StdioTransport::launch(shell(
        "printf '{\"split\":'; sleep 0.1; printf 'true}\\n'"));

    json message = transport->read_message();
    EXPECT_EQ(message["split"], true);
}

TEST(StdioTransportTest, WritesOneLinePerMessage) {
    auto transport = StdioTransport::launch(shell("read line; echo \"$line\""));

    transport->write_message({{"jsonrpc", "2.0"}, {"method", "ping"}});
    json echoed = transport->read_message();
    EXPECT_EQ(echoed["method"], "ping");
    EXPECT_EQ(transport->kind(), TransportKind::Stdio);
    EXPECT_NE(transport->process(), nullptr);
}

TEST(StdioTransportTest, CloseOnlyClosesStdin) {
    auto transport = StdioTransport::launch(shell("cat; echo '{\"done\":true}'"));

    transport->close();

    EXPECT_EQ(transport->read_message()["done"], true);
    EXPECT_THROW(transport->write_message({{"x", 1}}), SendError);
}

TEST(StdioTransportTest, LaunchFailureIsConnectionError) {
    StdioParams params;
    params.command = "mcp-gw-definitely-not-a-command";
    EXPECT_THROW(StdioTransport::launch(params), ConnectionError);
}

class StdioClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        timers = std::make_shared<TimerQueue>();
        options.timers = timers;
        options.handshake_timeout = 5000ms;
        options.shutdown.term_grace = 200ms;
        options.shutdown.kill_grace = 200ms;
    }

    void TearDown() override {
        timers->shutdown();
    }

    std::shared_ptr<MCPClient> launch(std::vector<std::string> args = {}) {
        return std::make_shared<MCPClient>("fake", StdioTransport::launch(fake_server(std::move(args))), options);
    }

    std::shared_ptr<TimerQueue> timers;
    ClientOptions options;
};

TEST_F(StdioClientTest, HandshakeAndEchoTool) {
    auto client = launch();
    client->connect();
    ASSERT_EQ(client->status(), ConnectionStatus::Connected);
    EXPECT_EQ(client->server_info()["serverInfo"]["name"], "fake-mcp-server");

    auto result = client->call_tool("echo", {{"text", "hi"}}, std::chrono::seconds(5));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(json::parse(result.data["content"][0]["text"].get<std::string>())["text"], "hi");

    client->close();
    EXPECT_TRUE(client->wait_closed(2000ms));
    EXPECT_EQ(client->supervisor()->state(), ShutdownState::Exited);
}

TEST_F(StdioClientTest, MissingProtocolVersionFailsHandshake) {
    auto client = launch({"--no-protocol-version"});
    EXPECT_THROW(client->connect(), ConnectionError);
    EXPECT_EQ(client->status(), ConnectionStatus::Error);
    EXPECT_TRUE(client->wait_closed(2000ms));
}

TEST_F(StdioClientTest, StderrReachesSubscribers) {
    auto client = launch({"--stderr", "Error: disk full"});

    std::promise<std::string> chunk;
    std::once_flag once;
    Subscriber subscriber;
    subscriber.on_stderr = [&](const std::string& text) {
        std::call_once(once, [&] { chunk.set_value(text); });
    };
    client->subscribe(subscriber);
    client->connect();

    auto future = chunk.get_future();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_NE(future.get().find("Error: disk full"), std::string::npos);

    client->close();
    EXPECT_TRUE(client->wait_closed(2000ms));
}

TEST_F(StdioClientTest, StubbornServerIsKilled) {
    auto client = launch({"--ignore-eof", "--ignore-sigterm"});
    client->connect();

    auto start = std::chrono::steady_clock::now();
    client->close();
    ASSERT_TRUE(client->wait_closed(3000ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, options.shutdown.term_grace + options.shutdown.kill_grace);
    ASSERT_NE(client->supervisor(), nullptr);
    EXPECT_EQ(client->supervisor()->state(), ShutdownState::Exited);
}
