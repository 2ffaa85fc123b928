#pragma once
#include "correlator.hpp"
#include "handshake.hpp"
#include "types.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

/// Creates the transport for one connection attempt. Throws SpawnError when
/// the server cannot be started.
using TransportFactory = std::function<std::unique_ptr<ITransport>(const ServerConfig&)>;

/// Spawns the configured command as a child process.
[[nodiscard]] TransportFactory process_transport_factory();

/// One tool server: its process, its request correlation and its handshake.
///
///   Disconnected -> Connecting -> HandshakePending -> Ready
///
/// Any state moves to Failed on spawn failure, handshake failure, process
/// exit or a request timeout. Failed always tears the process down; so does
/// close().
class ServerConnection {
public:
    struct Options {
        HandshakeOptions handshake;
        std::chrono::milliseconds discovery_timeout{12000};
        std::chrono::milliseconds invocation_timeout{15000};
        /// Empty: spawn the configured command.
        TransportFactory transport_factory;
    };

    ServerConnection(ServerConfig config, Options opts);
    ~ServerConnection();

    ServerConnection(const ServerConnection&) = delete;
    ServerConnection& operator=(const ServerConnection&) = delete;

    /// Spawn and handshake. Only valid from Disconnected.
    /// Throws SpawnError or HandshakeError; the connection is Failed afterwards.
    void connect();

    /// tools/list. Returns the server's tools in the order it listed them.
    /// A server that does not answer in time, answers with an error, or dies
    /// is reported as having no tools.
    /// Throws ConnectionError when the connection is not Ready.
    [[nodiscard]] std::vector<ToolDefinition> discover_tools();

    /// tools/call. Throws TimeoutError when the server does not answer in
    /// time, ProtocolError for an error response, TransportError when the
    /// server goes away first, ConnectionError when not Ready.
    [[nodiscard]] ToolResult call_tool(const std::string& name, const nlohmann::json& arguments);

    /// Terminate the server and reject anything outstanding. Idempotent.
    void close();

    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] bool is_ready() const { return state() == ConnectionState::Ready; }
    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }
    [[nodiscard]] std::optional<InitializeResult> server_info() const;
    [[nodiscard]] std::string failure_reason() const;

    /// Tools from the most recent successful discover_tools().
    [[nodiscard]] std::optional<std::vector<ToolDefinition>> last_tools() const;

private:
    /// Move forward unless something already failed the connection.
    bool advance(ConnectionState next);
    void stop_io();
    void require_ready(const std::string& what) const;
    void handle_message(JsonRpcMessage msg);
    void fail(const std::string& reason);

    ServerConfig config_;
    Options opts_;

    mutable std::mutex mutex_;
    ConnectionState state_{ConnectionState::Disconnected};
    std::string failure_reason_;
    std::optional<InitializeResult> server_info_;
    std::optional<std::vector<ToolDefinition>> last_tools_;

    // Serializes transport access from I/O callbacks against teardown.
    std::mutex io_mutex_;
    bool tearing_down_{false};

    std::unique_ptr<ITransport> transport_;
    std::unique_ptr<Correlator> correlator_;
};

} // namespace toolbridge
