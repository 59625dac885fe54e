// Minimal stdio MCP server used by the process-level tests.
//
// Options:
//   --no-protocol-version   answer initialize without protocolVersion
//   --stderr <text>         print <text> to stderr after initialize
//   --notify                send notifications/message after initialized
//   --ignore-eof            keep running after stdin closes
//   --ignore-sigterm        ignore SIGTERM (only SIGKILL stops the process)
//
// Tools: "echo" returns its arguments, "sleep" never answers.

#include <nlohmann/json.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using json = nlohmann::json;

namespace {

void write_message(const json& message) {
    std::cout << message.dump() << std::endl;
}

json result(const json& id, const json& value) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", value}};
}

} // namespace

int main(int argc, char** argv) {
    bool protocol_version = true;
    bool notify = false;
    bool ignore_eof = false;
    std::string stderr_text;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-protocol-version") {
            protocol_version = false;
        } else if (arg == "--stderr" && i + 1 < argc) {
            stderr_text = argv[++i];
        } else if (arg == "--notify") {
            notify = true;
        } else if (arg == "--ignore-eof") {
            ignore_eof = true;
        } else if (arg == "--ignore-sigterm") {
            std::signal(SIGTERM, SIG_IGN);
        }
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        json message = json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            continue;
        }

        std::string method = message.value("method", "");
        json id = message.contains("id") ? message["id"] : json();

        if (method == "initialize") {
            json info = {
                {"capabilities", {{"tools", json::object()}}},
                {"serverInfo", {{"name", "fake-mcp-server"}, {"version", "0.1.0"}}}
            };
            if (protocol_version) {
                info["protocolVersion"] = "2024-11-05";
            }
            write_message(result(id, info));
            if (!stderr_text.empty()) {
                std::cerr << stderr_text << std::endl;
            }
        } else if (method == "notifications/initialized") {
            if (notify) {
                write_message({
                    {"jsonrpc", "2.0"},
                    {"method", "notifications/message"},
                    {"params", {{"level", "info"}, {"data", "ready"}}}
                });
            }
        } else if (method == "notifications/cancelled") {
            write_message({
                {"jsonrpc", "2.0"},
                {"method", "notifications/message"},
                {"params", {{"level", "info"}, {"data", "cancelled"},
                            {"requestId", message["params"].value("requestId", "")}}}
            });
        } else if (method == "ping") {
            write_message(result(id, json::object()));
        } else if (method == "tools/list") {
            write_message(result(id, {{"tools", json::array({
                {{"name", "echo"}, {"description", "Echo arguments"},
                 {"inputSchema", {{"type", "object"}}}},
                {{"name", "sleep"}, {"description", "Never answers"},
                 {"inputSchema", {{"type", "object"}}}}
            })}}));
        } else if (method == "tools/call") {
            std::string tool = message["params"].value("name", "");
            if (tool == "echo") {
                write_message(result(id, {
                    {"content", json::array({{{"type", "text"},
                                              {"text", message["params"]["arguments"].dump()}}})}
                }));
            } else if (tool != "sleep") {
                write_message({{"jsonrpc", "2.0"}, {"id", id},
                               {"error", {{"code", -32602}, {"message", "Unknown tool: " + tool}}}});
            }
        } else if (!id.is_null()) {
            write_message({{"jsonrpc", "2.0"}, {"id", id},
                           {"error", {{"code", -32601}, {"message", "Method not found: " + method}}}});
        }
    }

    while (ignore_eof) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return 0;
}
