#include "toolbridge/connection_manager.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"

namespace toolbridge {

ConnectionManager::ConnectionManager(ClientConfig config, TransportFactory factory)
    : ConnectionManager(std::move(config.servers), config.settings, std::move(factory)) {}

ConnectionManager::ConnectionManager(std::vector<ServerConfig> servers, Settings settings,
                                     TransportFactory factory)
    : settings_(settings),
      factory_(factory ? std::move(factory) : process_transport_factory()),
      servers_(std::move(servers)) {}

ConnectionManager::~ConnectionManager() {
    shutdown();
}

std::shared_ptr<ServerConnection> ConnectionManager::get_connection(const std::string& name) {
    std::shared_ptr<ServerConnection> evicted;
    std::promise<std::shared_ptr<ServerConnection>> promise;
    SharedConnection pending;
    bool leader = false;
    ServerConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) throw ConnectionError("Connection manager is shut down");

        auto found = lookup_locked(name);
        if (!found) throw ConnectionError("Unknown server: " + name);
        config = std::move(*found);

        auto it = connections_.find(name);
        if (it != connections_.end()) {
            if (it->second->is_ready()) return it->second;
            evicted = std::move(it->second);
            connections_.erase(it);
        }

        auto in = in_flight_.find(name);
        if (in != in_flight_.end()) {
            pending = in->second;
        } else {
            pending = promise.get_future().share();
            in_flight_.emplace(name, pending);
            ++attempts_;
            leader = true;
        }
    }

    if (evicted) {
        TOOLBRIDGE_LOG_DEBUG("Evicting " + name + " connection ("
                             + connection_state_to_string(evicted->state()) + ")");
        // Waits for a teardown still running on another thread, so the old
        // process is reaped before its replacement is spawned.
        evicted->close();
        evicted.reset();
    }

    if (!leader) {
        TOOLBRIDGE_LOG_TRACE("Joining in-flight connection attempt for " + name);
        return pending.get();
    }

    auto conn = std::make_shared<ServerConnection>(config, connection_options(config));
    try {
        conn->connect();
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(name);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    bool closed_meanwhile;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(name);
        closed_meanwhile = shut_down_;
        if (!closed_meanwhile) connections_[name] = conn;
    }
    if (closed_meanwhile) {
        conn->close();
        auto err = std::make_exception_ptr(
            ConnectionError("Connection manager shut down while connecting to " + name));
        promise.set_exception(err);
        std::rethrow_exception(err);
    }

    promise.set_value(conn);
    return conn;
}

std::shared_ptr<ServerConnection> ConnectionManager::get_connection(const ServerConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool known = false;
        for (auto& s : servers_) {
            if (s.name == config.name) {
                s = config;
                known = true;
                break;
            }
        }
        if (!known) servers_.push_back(config);
    }
    return get_connection(config.name);
}

std::shared_ptr<ServerConnection> ConnectionManager::find_connection(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    return it != connections_.end() ? it->second : nullptr;
}

template <typename Fn>
auto ConnectionManager::with_fresh_connection(const ServerConfig& config, Fn&& fn) {
    std::shared_ptr<std::mutex> call_lock;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) throw ConnectionError("Connection manager is shut down");
        auto& slot = per_call_locks_[config.name];
        if (!slot) slot = std::make_shared<std::mutex>();
        call_lock = slot;
    }

    // One process per server at a time, even without caching.
    std::lock_guard<std::mutex> serial(*call_lock);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++attempts_;
    }
    ServerConnection conn(config, connection_options(config));
    conn.connect();
    auto result = fn(conn);
    conn.close();
    return result;
}

std::vector<ToolDefinition> ConnectionManager::discover_tools(const std::string& server) {
    if (!settings_.cache_connections) {
        return with_fresh_connection(require_config(server),
                                     [](ServerConnection& c) { return c.discover_tools(); });
    }
    return get_connection(server)->discover_tools();
}

ToolResult ConnectionManager::execute_tool(const std::string& server, const std::string& tool,
                                           const nlohmann::json& arguments) {
    if (!settings_.cache_connections) {
        return with_fresh_connection(require_config(server), [&](ServerConnection& c) {
            return c.call_tool(tool, arguments);
        });
    }

    auto conn = get_connection(server);
    try {
        return conn->call_tool(tool, arguments);
    } catch (const ToolBridgeError&) {
        evict_if_failed(server, conn);
        throw;
    }
}

void ConnectionManager::evict_if_failed(const std::string& name,
                                        const std::shared_ptr<ServerConnection>& conn) {
    if (conn->state() != ConnectionState::Failed) return;
    std::shared_ptr<ServerConnection> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(name);
        if (it != connections_.end() && it->second == conn) {
            evicted = std::move(it->second);
            connections_.erase(it);
        }
    }
    if (evicted) {
        evicted->close();
        TOOLBRIDGE_LOG_DEBUG("Evicted failed connection to " + name + ": " + evicted->failure_reason());
    }
}

std::vector<std::string> ConnectionManager::list_servers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(servers_.size());
    for (const auto& s : servers_) names.push_back(s.name);
    return names;
}

std::vector<ServerConfig> ConnectionManager::servers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_;
}

std::optional<ServerConfig> ConnectionManager::server_config(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup_locked(name);
}

ConnectionState ConnectionManager::connection_state(const std::string& name) const {
    std::shared_ptr<ServerConnection> conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_.count(name)) return ConnectionState::Connecting;
        auto it = connections_.find(name);
        if (it == connections_.end()) return ConnectionState::Disconnected;
        conn = it->second;
    }
    return conn->state();
}

ServerConnection::Options ConnectionManager::connection_options(const ServerConfig& server) const {
    ServerConnection::Options opts;
    opts.handshake.timeout = settings_.handshake_timeout;
    opts.discovery_timeout = settings_.discovery_timeout;
    opts.invocation_timeout = settings_.invocation_timeout_for(server);
    opts.transport_factory = factory_;
    return opts;
}

void ConnectionManager::close_connection(const std::string& name) {
    std::shared_ptr<ServerConnection> conn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(name);
        if (it == connections_.end()) return;
        conn = std::move(it->second);
        connections_.erase(it);
    }
    conn->close();
}

void ConnectionManager::shutdown() {
    std::map<std::string, std::shared_ptr<ServerConnection>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        closing.swap(connections_);
    }
    for (auto& [name, conn] : closing) {
        try {
            conn->close();
            TOOLBRIDGE_LOG_DEBUG("Closed connection to " + name);
        } catch (const std::exception& e) {
            TOOLBRIDGE_LOG_WARN("Error closing connection to " + name + ": " + e.what());
        }
    }
}

size_t ConnectionManager::connection_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

ServerConfig ConnectionManager::require_config(const std::string& name) const {
    auto config = server_config(name);
    if (!config) throw ConnectionError("Unknown server: " + name);
    return *config;
}

std::optional<ServerConfig> ConnectionManager::lookup_locked(const std::string& name) const {
    for (const auto& s : servers_) {
        if (s.name == name) return s;
    }
    return std::nullopt;
}

} // namespace toolbridge
