#pragma once
#include "config.hpp"
#include "server_connection.hpp"
#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

/// Owns one ServerConnection per configured server.
///
/// Concurrent get_connection() calls for the same server share a single
/// connection attempt: only the first caller spawns, the rest wait on its
/// outcome. Connections that have failed are evicted on the next lookup so
/// that caller starts a fresh attempt.
class ConnectionManager {
public:
    explicit ConnectionManager(ClientConfig config, TransportFactory factory = nullptr);
    ConnectionManager(std::vector<ServerConfig> servers, Settings settings = {},
                      TransportFactory factory = nullptr);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// Return the Ready connection for `name`, connecting if necessary.
    /// Throws ConnectionError for an unknown name or after shutdown(), and
    /// SpawnError / HandshakeError when the attempt fails.
    [[nodiscard]] std::shared_ptr<ServerConnection> get_connection(const std::string& name);

    /// Same, registering `config` first when its name is not known yet.
    [[nodiscard]] std::shared_ptr<ServerConnection> get_connection(const ServerConfig& config);

    /// The connection currently held for `name`, without connecting.
    [[nodiscard]] std::shared_ptr<ServerConnection> find_connection(const std::string& name) const;

    /// Resolve the connection and run tools/list on it. Without connection
    /// caching a short-lived connection is opened for the call.
    [[nodiscard]] std::vector<ToolDefinition> discover_tools(const std::string& server);

    /// Resolve the connection and run one tool call on it.
    [[nodiscard]] ToolResult execute_tool(const std::string& server, const std::string& tool,
                                          const nlohmann::json& arguments);

    /// Configured server names in registration order.
    [[nodiscard]] std::vector<std::string> list_servers() const;
    [[nodiscard]] std::vector<ServerConfig> servers() const;
    [[nodiscard]] std::optional<ServerConfig> server_config(const std::string& name) const;

    /// Connecting while an attempt is in flight, Disconnected when nothing is held.
    [[nodiscard]] ConnectionState connection_state(const std::string& name) const;

    /// Timeouts and transport this manager applies to `server`.
    [[nodiscard]] ServerConnection::Options connection_options(const ServerConfig& server) const;

    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }

    /// Close and forget the connection for `name`, if any.
    void close_connection(const std::string& name);

    /// Close every connection. Errors are logged, never thrown. Idempotent.
    void shutdown();

    /// Number of connection attempts started so far (one process each).
    [[nodiscard]] size_t connection_attempts() const;

private:
    using SharedConnection = std::shared_future<std::shared_ptr<ServerConnection>>;

    std::optional<ServerConfig> lookup_locked(const std::string& name) const;
    ServerConfig require_config(const std::string& name) const;
    template <typename Fn>
    auto with_fresh_connection(const ServerConfig& config, Fn&& fn);
    void evict_if_failed(const std::string& name, const std::shared_ptr<ServerConnection>& conn);

    Settings settings_;
    TransportFactory factory_;

    mutable std::mutex mutex_;
    std::vector<ServerConfig> servers_;
    std::map<std::string, std::shared_ptr<ServerConnection>> connections_;
    std::map<std::string, SharedConnection> in_flight_;
    std::map<std::string, std::shared_ptr<std::mutex>> per_call_locks_;
    size_t attempts_ = 0;
    bool shut_down_ = false;
};

} // namespace toolbridge
