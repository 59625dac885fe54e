#include "config/GatewayConfig.hpp"
#include "core/Errors.hpp"
#include "core/TimerQueue.hpp"
#include "http/HttpServer.hpp"
#include "http/SessionEndpoint.hpp"
#include "mcp/ConnectionRegistry.hpp"
#include "mcp/ServerManager.hpp"
#include "mcp/TransportFactory.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {
    std::atomic<bool> shutdown_requested{false};
    std::atomic<int> received_signal{0};

    void signal_handler(int signal) {
        received_signal = signal;
        shutdown_requested = true;
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGPIPE, SIG_IGN);
    }

    bool apply_log_level(const std::string& log_level) {
        if (log_level == "trace") {
            spdlog::set_level(spdlog::level::trace);
        } else if (log_level == "debug") {
            spdlog::set_level(spdlog::level::debug);
        } else if (log_level == "info") {
            spdlog::set_level(spdlog::level::info);
        } else if (log_level == "warn") {
            spdlog::set_level(spdlog::level::warn);
        } else if (log_level == "error") {
            spdlog::set_level(spdlog::level::err);
        } else if (log_level == "critical") {
            spdlog::set_level(spdlog::level::critical);
        } else {
            return false;
        }
        return true;
    }
}

int main(int argc, char** argv) {
    // Protocol output never shares a stream with logs
    spdlog::set_default_logger(spdlog::stderr_color_mt("gateway"));

    CLI::App app{"MCP SSE Gateway - bridges MCP servers to browser SSE sessions"};

    mcp_gw::GatewayConfig config;
    std::string config_path;
    long long handshake_ms = 0;
    long long request_ms = 0;
    long long connect_ms = 0;
    long long term_grace_ms = 0;
    long long kill_grace_ms = 0;

    app.add_option("-c,--config", config_path, "Gateway config file (JSON)");
    auto* host_opt = app.add_option("--host", config.host, "Listen address");
    auto* port_opt = app.add_option("-p,--port", config.port, "Listen port");
    auto* origin_opt = app.add_option("--public-origin", config.public_origin,
                                      "Origin advertised in endpoint events, e.g. http://localhost:3000");
    bool disable_sse = false;
    app.add_flag("--disable-sse", disable_sse, "Answer SSE routes with 503");
    auto* handshake_opt = app.add_option("--handshake-timeout-ms", handshake_ms, "Initialize handshake timeout")
        ->check(CLI::NonNegativeNumber);
    auto* request_opt = app.add_option("--request-timeout-ms", request_ms, "Timeout for relayed requests")
        ->check(CLI::NonNegativeNumber);
    auto* connect_opt = app.add_option("--connect-timeout-ms", connect_ms, "Websocket connect timeout")
        ->check(CLI::NonNegativeNumber);
    auto* term_opt = app.add_option("--term-grace-ms", term_grace_ms, "Delay between stdin close and SIGTERM")
        ->check(CLI::NonNegativeNumber);
    auto* kill_opt = app.add_option("--kill-grace-ms", kill_grace_ms, "Delay between SIGTERM and SIGKILL")
        ->check(CLI::NonNegativeNumber);

    std::string log_level = "info";
    auto* log_opt = app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mcp-sse-gateway version 1.0.0" << std::endl;
        return 0;
    }

    // Config file first, command line wins
    try {
        if (!config_path.empty()) {
            mcp_gw::GatewayConfig from_file;
            from_file.load_file(config_path);
            if (*host_opt) from_file.host = config.host;
            if (*port_opt) from_file.port = config.port;
            if (*origin_opt) from_file.public_origin = config.public_origin;
            config = std::move(from_file);
        }
    } catch (const mcp_gw::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (disable_sse) config.sse_enabled = false;
    if (*handshake_opt) config.handshake_timeout = std::chrono::milliseconds(handshake_ms);
    if (*request_opt) config.request_timeout = std::chrono::milliseconds(request_ms);
    if (*connect_opt) config.connect_timeout = std::chrono::milliseconds(connect_ms);
    if (*term_opt) config.term_grace = std::chrono::milliseconds(term_grace_ms);
    if (*kill_opt) config.kill_grace = std::chrono::milliseconds(kill_grace_ms);
    if (log_opt->count() > 0 || config_path.empty()) config.log_level = log_level;

    if (!apply_log_level(config.log_level)) {
        std::cerr << "Invalid log level: " << config.log_level << std::endl;
        return 1;
    }

    spdlog::info("Starting MCP SSE Gateway");
    spdlog::info("Log level: {}", config.log_level);
    spdlog::info("SSE sessions {}", config.sse_enabled ? "enabled" : "disabled");

    try {
        setup_signal_handlers();

        auto timers = std::make_shared<mcp_gw::TimerQueue>();
        mcp_gw::ConnectionRegistry registry;
        mcp_gw::TransportFactory factory(config.connect_timeout);
        mcp_gw::ServerManager manager(registry, factory, config.client_options(timers));
        manager.set_definitions(config.servers);
        manager.start_enabled_servers();

        mcp_gw::SessionEndpoint endpoint(registry, factory, manager, config.endpoint_options());
        mcp_gw::HttpServer server(endpoint, config.host, config.port);
        server.start();
        spdlog::info("Endpoint events advertise {}", config.origin());

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        spdlog::info("Received signal {}, shutting down gracefully", received_signal.load());

        server.stop();
        endpoint.close_all_sessions("gateway shutting down");
        manager.shutdown(config.term_grace + config.kill_grace + std::chrono::milliseconds(1000));
        timers->shutdown();

        spdlog::info("Gateway stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
