#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbridge {

// ---------- Server configuration ----------

struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> description;
    // Unset: inferred from args (see is_remote()).
    std::optional<bool> remote;

    /// Servers proxied to a remote backend get the longer invocation bound.
    [[nodiscard]] bool is_remote() const;
    [[nodiscard]] std::string display_description() const;

    bool operator==(const ServerConfig& o) const {
        return name == o.name && command == o.command && args == o.args && env == o.env
               && description == o.description && remote == o.remote;
    }
};

// ---------- Tools ----------

/// A tool as reported by one server's tools/list.
struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json::object();

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description && input_schema == o.input_schema;
    }
};

/// A tool as presented to the selection authority, tagged with its server.
struct ToolDescriptor {
    std::string server_name;
    std::string tool_name;
    std::string description;
    nlohmann::json parameter_schema = nlohmann::json::object();

    bool operator==(const ToolDescriptor& o) const {
        return server_name == o.server_name && tool_name == o.tool_name
               && description == o.description && parameter_schema == o.parameter_schema;
    }
};

[[nodiscard]] ToolDescriptor make_descriptor(const std::string& server_name,
                                             const ToolDefinition& tool);

/// Normalized result of a tools/call.
struct ToolResult {
    nlohmann::json content = nlohmann::json::array();
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;
    nlohmann::json raw;

    /// Text items of `content` joined by newlines.
    [[nodiscard]] std::string text() const;

    bool operator==(const ToolResult& o) const {
        return content == o.content && structured_content == o.structured_content
               && is_error == o.is_error && raw == o.raw;
    }
};

/// Accepts {"content": [...]}, a bare content array, a plain string, or any
/// other value (kept in `raw` and rendered as a single text item).
[[nodiscard]] ToolResult normalize_tool_result(const nlohmann::json& payload);

// ---------- Handshake ----------

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> resources;
    std::optional<nlohmann::json> prompts;
    std::optional<nlohmann::json> logging;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && resources == o.resources && prompts == o.prompts
               && logging == o.logging;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
};

// ---------- Connection state ----------

enum class ConnectionState {
    Disconnected,
    Connecting,
    HandshakePending,
    Ready,
    Failed
};

std::string connection_state_to_string(ConnectionState state);

// ---------- Summaries ----------

struct ServerSummary {
    std::string name;
    std::string description;
    bool connected = false;
    std::vector<ToolDescriptor> tools;
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const ToolDescriptor& t);

void to_json(nlohmann::json& j, const ToolResult& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void from_json(const nlohmann::json& j, ServerCapabilities& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

void to_json(nlohmann::json& j, const ServerSummary& t);

} // namespace toolbridge
