#include "toolbridge/server_connection.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include "toolbridge/transport/process_transport.hpp"

#include <set>

namespace toolbridge {

TransportFactory process_transport_factory() {
    return [](const ServerConfig& config) -> std::unique_ptr<ITransport> {
        return ProcessTransport::launch(config);
    };
}

ServerConnection::ServerConnection(ServerConfig config, Options opts)
    : config_(std::move(config)), opts_(std::move(opts)) {
    if (!opts_.transport_factory) {
        opts_.transport_factory = process_transport_factory();
    }
}

ServerConnection::~ServerConnection() {
    stop_io();
    // Joins the transport threads; they may still be inside handle_message.
    transport_.reset();
    correlator_.reset();
}

void ServerConnection::stop_io() {
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        tearing_down_ = true;
    }
    // Joins the watchdog, so no timeout hook can run past this point.
    if (correlator_) correlator_->stop();
    if (transport_) transport_->shutdown();
}

void ServerConnection::connect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Disconnected) {
            throw ConnectionError("Server '" + config_.name + "' cannot connect from state "
                                  + connection_state_to_string(state_));
        }
        state_ = ConnectionState::Connecting;
        failure_reason_.clear();
        server_info_.reset();
        last_tools_.reset();
    }

    // Leftovers from an earlier close().
    stop_io();
    transport_.reset();
    correlator_.reset();
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        tearing_down_ = false;
    }

    TOOLBRIDGE_LOG_DEBUG("Connecting to " + config_.name + " (" + config_.command + ")");
    try {
        transport_ = opts_.transport_factory(config_);
    } catch (const TransportError& e) {
        fail(e.what());
        throw;
    }
    if (!transport_) {
        fail("no transport");
        throw SpawnError("No transport for server '" + config_.name + "'");
    }

    correlator_ = std::make_unique<Correlator>(*transport_);
    correlator_->on_timeout([this](const std::string& method, int64_t id) {
        fail("request " + method + " (id " + std::to_string(id) + ") timed out");
    });

    transport_->start(
        [this](JsonRpcMessage msg) { handle_message(std::move(msg)); },
        [this](const std::string& reason) { fail(reason); });

    if (!advance(ConnectionState::HandshakePending)) {
        throw HandshakeError("Server '" + config_.name + "' failed before initialize: "
                             + failure_reason());
    }

    InitializeResult info;
    try {
        info = HandshakeSequencer(opts_.handshake).run(*correlator_);
    } catch (const HandshakeError& e) {
        fail(e.what());
        throw HandshakeError("Server '" + config_.name + "': " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        server_info_ = info;
    }
    if (!advance(ConnectionState::Ready)) {
        throw HandshakeError("Server '" + config_.name + "' failed during handshake: "
                             + failure_reason());
    }
    TOOLBRIDGE_LOG_INFO("Connected to " + config_.name + " (" + info.server_info.name + " "
                        + info.server_info.version + ")");
}

std::vector<ToolDefinition> ServerConnection::discover_tools() {
    require_ready("discover tools");

    std::vector<ToolDefinition> tools;
    std::set<std::string> seen_cursors;
    std::optional<std::string> cursor;
    try {
        do {
            nlohmann::json params = nlohmann::json::object();
            if (cursor) params["cursor"] = *cursor;

            auto page = correlator_->send("tools/list", std::move(params), opts_.discovery_timeout).get();
            if (!page.is_object() || !page.contains("tools") || !page["tools"].is_array()) {
                TOOLBRIDGE_LOG_WARN(config_.name + " returned a malformed tools/list result");
                return {};
            }
            for (const auto& t : page["tools"]) {
                if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) {
                    TOOLBRIDGE_LOG_DEBUG(config_.name + ": skipping tool entry without a name");
                    continue;
                }
                tools.push_back(t.get<ToolDefinition>());
            }

            cursor.reset();
            if (page.contains("nextCursor") && page["nextCursor"].is_string()) {
                auto next = page["nextCursor"].get<std::string>();
                if (!next.empty() && seen_cursors.insert(next).second) cursor = next;
            }
        } while (cursor);
    } catch (const TimeoutError&) {
        TOOLBRIDGE_LOG_WARN(config_.name + ": tool discovery timed out, treating as no tools");
        fail("tools/list timed out");
        return {};
    } catch (const ProtocolError& e) {
        TOOLBRIDGE_LOG_WARN(config_.name + ": tool discovery failed: " + e.what());
        return {};
    } catch (const TransportError& e) {
        TOOLBRIDGE_LOG_WARN(config_.name + ": tool discovery aborted: " + e.what());
        return {};
    } catch (const nlohmann::json::exception& e) {
        TOOLBRIDGE_LOG_WARN(config_.name + ": malformed tool definition: " + e.what());
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    last_tools_ = tools;
    return tools;
}

ToolResult ServerConnection::call_tool(const std::string& name, const nlohmann::json& arguments) {
    require_ready("call tool " + name);

    nlohmann::json params{
        {"name", name},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };

    nlohmann::json payload;
    try {
        payload = correlator_->send("tools/call", std::move(params), opts_.invocation_timeout).get();
    } catch (const TimeoutError&) {
        fail("tools/call " + name + " timed out");
        throw TimeoutError("Tool '" + name + "' on server '" + config_.name
                           + "' did not respond within "
                           + std::to_string(opts_.invocation_timeout.count()) + " ms");
    }
    return normalize_tool_result(payload);
}

void ServerConnection::close() {
    stop_io();
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Failed) {
        state_ = ConnectionState::Disconnected;
    }
}

ConnectionState ServerConnection::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<InitializeResult> ServerConnection::server_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_;
}

std::string ServerConnection::failure_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_reason_;
}

std::optional<std::vector<ToolDefinition>> ServerConnection::last_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_tools_;
}

bool ServerConnection::advance(ConnectionState next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ConnectionState::Failed) return false;
    state_ = next;
    return true;
}

void ServerConnection::require_ready(const std::string& what) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Ready) {
        throw ConnectionError("Cannot " + what + ": server '" + config_.name + "' is "
                              + connection_state_to_string(state_));
    }
}

void ServerConnection::handle_message(JsonRpcMessage msg) {
    if (std::holds_alternative<JsonRpcResponse>(msg)) {
        correlator_->on_message(msg);
        return;
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        TOOLBRIDGE_LOG_DEBUG(config_.name + " notification: " + notif->method);
        return;
    }

    // Server-to-client request. Only ping is understood.
    const auto& req = std::get<JsonRpcRequest>(msg);
    JsonRpcResponse reply;
    reply.id = req.id;
    if (req.method == "ping") {
        reply.result = nlohmann::json::object();
    } else {
        TOOLBRIDGE_LOG_DEBUG(config_.name + " sent unsupported request " + req.method);
        reply.error = JsonRpcError{error::MethodNotFound, "Method not found: " + req.method, std::nullopt};
    }

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (tearing_down_ || !transport_) return;
    try {
        transport_->send(reply);
    } catch (const TransportError& e) {
        TOOLBRIDGE_LOG_DEBUG(config_.name + ": could not answer " + req.method + ": " + e.what());
    }
}

void ServerConnection::fail(const std::string& reason) {
    std::lock_guard<std::mutex> io_lock(io_mutex_);
    if (tearing_down_) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Failed) return;
    }
    TOOLBRIDGE_LOG_WARN("Server " + config_.name + " failed: " + reason);

    // The process is gone before anyone can observe Failed and replace it.
    if (transport_) transport_->shutdown();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Failed;
        failure_reason_ = reason;
    }
    // Process death is connection death: every sibling request is rejected.
    if (correlator_) correlator_->fail_all(reason);
}

} // namespace toolbridge
