#pragma once
#include "connection_manager.hpp"
#include "tool_catalog.hpp"
#include <string>
#include <vector>

namespace toolbridge {

/// Entry point for collaborators that route chat messages or let a model pick
/// tools. Unreachable servers show up as servers without tools; only
/// execute_tool() reports connection failures to its caller.
class ToolHub {
public:
    explicit ToolHub(ConnectionManager& manager);

    [[nodiscard]] std::vector<std::string> list_servers() const;

    /// Tools of one server. Throws ConnectionError for an unknown name only.
    [[nodiscard]] std::vector<ToolDescriptor> get_tools_for_server(const std::string& server);

    /// Throws SpawnError, HandshakeError, TimeoutError, ProtocolError,
    /// TransportError or ConnectionError.
    [[nodiscard]] ToolResult execute_tool(const std::string& server, const std::string& tool,
                                          const nlohmann::json& arguments);

    /// Every tool of every reachable server, in configuration order.
    [[nodiscard]] std::vector<ToolDescriptor> available_tools();

    [[nodiscard]] std::vector<ServerSummary> server_summaries();

    void shutdown();

    [[nodiscard]] ToolCatalog& catalog() noexcept { return catalog_; }

private:
    ConnectionManager& manager_;
    ToolCatalog catalog_;
};

} // namespace toolbridge
