#include "config/GatewayConfig.hpp"
#include "core/Errors.hpp"
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace mcp_gw {

namespace {

std::chrono::milliseconds read_duration(const json& document, const char* key, std::chrono::milliseconds current) {
    if (!document.contains(key)) {
        return current;
    }
    const json& value = document[key];
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw ValidationError(std::string("Config key '") + key + "' must be a non-negative integer");
    }
    return std::chrono::milliseconds(value.get<long long>());
}

std::string read_string(const json& document, const char* key, const std::string& current) {
    if (!document.contains(key)) {
        return current;
    }
    if (!document[key].is_string()) {
        throw ValidationError(std::string("Config key '") + key + "' must be a string");
    }
    return document[key].get<std::string>();
}

} // namespace

void GatewayConfig::merge_json(const json& document) {
    if (!document.is_object()) {
        throw ValidationError("Config root must be an object");
    }

    host = read_string(document, "host", host);
    public_origin = read_string(document, "publicOrigin", public_origin);
    log_level = read_string(document, "logLevel", log_level);

    if (document.contains("port")) {
        const json& value = document["port"];
        if (!value.is_number_integer() || value.get<long long>() < 0 ||
            value.get<long long>() > std::numeric_limits<unsigned short>::max()) {
            throw ValidationError("Config key 'port' must be between 0 and 65535");
        }
        port = static_cast<unsigned short>(value.get<long long>());
    }
    if (document.contains("sseEnabled")) {
        if (!document["sseEnabled"].is_boolean()) {
            throw ValidationError("Config key 'sseEnabled' must be a boolean");
        }
        sse_enabled = document["sseEnabled"].get<bool>();
    }

    handshake_timeout = read_duration(document, "handshakeTimeoutMs", handshake_timeout);
    request_timeout = read_duration(document, "requestTimeoutMs", request_timeout);
    connect_timeout = read_duration(document, "connectTimeoutMs", connect_timeout);
    term_grace = read_duration(document, "termGraceMs", term_grace);
    kill_grace = read_duration(document, "killGraceMs", kill_grace);

    if (document.contains("mcpServers")) {
        const json& entries = document["mcpServers"];
        if (!entries.is_object()) {
            throw ValidationError("Config key 'mcpServers' must be an object");
        }
        servers.clear();
        for (const auto& [name, entry] : entries.items()) {
            servers.push_back(ServerDefinition::from_json(name, entry));
        }
    }
}

void GatewayConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("Cannot open config file: " + path);
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ValidationError("Invalid JSON in config file " + path + ": " + e.what());
    }
    merge_json(document);
    spdlog::info("Loaded config from {} ({} servers)", path, servers.size());
}

std::string GatewayConfig::origin() const {
    if (!public_origin.empty()) {
        std::string trimmed = public_origin;
        while (!trimmed.empty() && trimmed.back() == '/') {
            trimmed.pop_back();
        }
        return trimmed;
    }
    std::string visible_host = (host == "0.0.0.0" || host == "::") ? "localhost" : host;
    return "http://" + visible_host + ":" + std::to_string(port);
}

ClientOptions GatewayConfig::client_options(std::shared_ptr<TimerQueue> timers) const {
    ClientOptions options;
    options.handshake_timeout = handshake_timeout;
    options.shutdown.term_grace = term_grace;
    options.shutdown.kill_grace = kill_grace;
    options.timers = std::move(timers);
    return options;
}

EndpointOptions GatewayConfig::endpoint_options() const {
    EndpointOptions options;
    options.sse_enabled = sse_enabled;
    options.public_origin = origin();
    options.request_timeout = request_timeout;
    options.reconnect_wait = term_grace + kill_grace + std::chrono::milliseconds(2000);
    return options;
}

} // namespace mcp_gw
