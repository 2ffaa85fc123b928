#include "toolbridge/config.hpp"
#include "toolbridge/correlator.hpp"
#include "toolbridge/error.hpp"

#include <fstream>
#include <sstream>

namespace toolbridge {

namespace {

using ordered_json = nlohmann::ordered_json;

std::string require_string(const ordered_json& j, const std::string& where) {
    if (!j.is_string()) throw ConfigError(where + " must be a string");
    return j.get<std::string>();
}

std::chrono::milliseconds require_timeout(const ordered_json& j, const std::string& key) {
    if (!j.is_number_integer() && !j.is_number_unsigned()) {
        throw ConfigError("settings." + key + " must be an integer number of milliseconds");
    }
    auto ms = j.get<int64_t>();
    if (ms <= 0) throw ConfigError("settings." + key + " must be positive");
    if (ms > MAX_REQUEST_TIMEOUT.count()) {
        throw ConfigError("settings." + key + " must not exceed "
                          + std::to_string(MAX_REQUEST_TIMEOUT.count()) + " ms");
    }
    return std::chrono::milliseconds(ms);
}

ServerConfig parse_server(const std::string& name, const ordered_json& j) {
    const std::string where = "mcpServers." + name;
    if (!j.is_object()) throw ConfigError(where + " must be an object");

    ServerConfig s;
    s.name = name;

    if (!j.contains("command")) throw ConfigError(where + ".command is required");
    s.command = require_string(j["command"], where + ".command");
    if (s.command.empty()) throw ConfigError(where + ".command must not be empty");

    if (j.contains("args")) {
        const auto& args = j["args"];
        if (!args.is_array()) throw ConfigError(where + ".args must be an array");
        for (const auto& a : args) s.args.push_back(require_string(a, where + ".args[]"));
    }

    if (j.contains("env")) {
        const auto& env = j["env"];
        if (!env.is_object()) throw ConfigError(where + ".env must be an object");
        for (auto it = env.begin(); it != env.end(); ++it) {
            s.env[it.key()] = require_string(it.value(), where + ".env." + it.key());
        }
    }

    if (j.contains("description") && !j["description"].is_null()) {
        s.description = require_string(j["description"], where + ".description");
    }

    if (j.contains("remote") && !j["remote"].is_null()) {
        if (!j["remote"].is_boolean()) throw ConfigError(where + ".remote must be a boolean");
        s.remote = j["remote"].get<bool>();
    }
    return s;
}

Settings parse_settings(const ordered_json& j) {
    if (!j.is_object()) throw ConfigError("settings must be an object");

    Settings s;
    if (j.contains("handshakeTimeoutMs"))
        s.handshake_timeout = require_timeout(j["handshakeTimeoutMs"], "handshakeTimeoutMs");
    if (j.contains("discoveryTimeoutMs"))
        s.discovery_timeout = require_timeout(j["discoveryTimeoutMs"], "discoveryTimeoutMs");
    if (j.contains("invocationTimeoutMs"))
        s.invocation_timeout = require_timeout(j["invocationTimeoutMs"], "invocationTimeoutMs");
    if (j.contains("remoteInvocationTimeoutMs"))
        s.remote_invocation_timeout = require_timeout(j["remoteInvocationTimeoutMs"],
                                                      "remoteInvocationTimeoutMs");
    if (j.contains("cacheConnections")) {
        if (!j["cacheConnections"].is_boolean())
            throw ConfigError("settings.cacheConnections must be a boolean");
        s.cache_connections = j["cacheConnections"].get<bool>();
    }
    return s;
}

} // anonymous namespace

const ServerConfig* ClientConfig::find(const std::string& name) const {
    for (const auto& s : servers) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

ClientConfig parse_config(const std::string& text) {
    ordered_json root;
    try {
        root = ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Configuration is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) throw ConfigError("Configuration must be a JSON object");
    if (!root.contains("mcpServers")) throw ConfigError("Configuration has no mcpServers");

    const auto& servers = root["mcpServers"];
    if (!servers.is_object()) throw ConfigError("mcpServers must be an object");

    ClientConfig config;
    for (auto it = servers.begin(); it != servers.end(); ++it) {
        config.servers.push_back(parse_server(it.key(), it.value()));
    }
    if (root.contains("settings")) {
        config.settings = parse_settings(root["settings"]);
    }
    return config;
}

ClientConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("Cannot open configuration file " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    try {
        return parse_config(ss.str());
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

} // namespace toolbridge
