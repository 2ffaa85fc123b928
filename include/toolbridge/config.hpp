#pragma once
#include "types.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace toolbridge {

/// Timeout policy and connection reuse. Defaults match what tool servers in
/// the wild need: remote (proxied) servers get a longer invocation bound.
struct Settings {
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds discovery_timeout{12000};
    std::chrono::milliseconds invocation_timeout{15000};
    std::chrono::milliseconds remote_invocation_timeout{25000};
    /// false: connect for every tool call and close afterwards.
    bool cache_connections = true;

    [[nodiscard]] std::chrono::milliseconds invocation_timeout_for(const ServerConfig& server) const {
        return server.is_remote() ? remote_invocation_timeout : invocation_timeout;
    }
};

struct ClientConfig {
    /// In declaration order.
    std::vector<ServerConfig> servers;
    Settings settings;

    [[nodiscard]] const ServerConfig* find(const std::string& name) const;
};

/// Parse a configuration document:
///
///   {"mcpServers": {"name": {"command": "...", "args": [...], "env": {...},
///                            "description": "...", "remote": false}},
///    "settings": {"handshakeTimeoutMs": 10000, ...}}
///
/// Throws ConfigError.
[[nodiscard]] ClientConfig parse_config(const std::string& text);

/// Read and parse a configuration file. Throws ConfigError.
[[nodiscard]] ClientConfig load_config(const std::string& path);

} // namespace toolbridge
