#include "toolbridge/tool_hub.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"

namespace toolbridge {

ToolHub::ToolHub(ConnectionManager& manager)
    : manager_(manager), catalog_(manager) {}

std::vector<std::string> ToolHub::list_servers() const {
    return manager_.list_servers();
}

std::vector<ToolDescriptor> ToolHub::get_tools_for_server(const std::string& server) {
    if (!manager_.server_config(server)) {
        throw ConnectionError("Unknown server: " + server);
    }

    std::vector<ToolDefinition> tools;
    try {
        tools = catalog_.tools_for(server);
    } catch (const ToolBridgeError& e) {
        TOOLBRIDGE_LOG_WARN("Server " + server + " unavailable: " + e.what());
        return {};
    }

    std::string line = server + " |";
    std::vector<ToolDescriptor> out;
    out.reserve(tools.size());
    for (const auto& t : tools) {
        line += " " + t.name;
        out.push_back(make_descriptor(server, t));
    }
    TOOLBRIDGE_LOG_INFO(line);
    return out;
}

ToolResult ToolHub::execute_tool(const std::string& server, const std::string& tool,
                                 const nlohmann::json& arguments) {
    TOOLBRIDGE_LOG_DEBUG("Calling " + server + "/" + tool + " with " + arguments.dump());
    return manager_.execute_tool(server, tool, arguments);
}

std::vector<ToolDescriptor> ToolHub::available_tools() {
    for (const auto& name : manager_.list_servers()) {
        try {
            (void)catalog_.tools_for(name);
        } catch (const ToolBridgeError& e) {
            TOOLBRIDGE_LOG_WARN("Server " + name + " unavailable: " + e.what());
        }
    }
    return catalog_.list_all();
}

std::vector<ServerSummary> ToolHub::server_summaries() {
    std::vector<ServerSummary> out;
    for (const auto& config : manager_.servers()) {
        ServerSummary summary;
        summary.name = config.name;
        summary.description = config.display_description();
        summary.tools = get_tools_for_server(config.name);
        summary.connected = manager_.connection_state(config.name) == ConnectionState::Ready;
        out.push_back(std::move(summary));
    }
    return out;
}

void ToolHub::shutdown() {
    manager_.shutdown();
    catalog_.clear();
}

} // namespace toolbridge
