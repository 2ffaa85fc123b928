#include "toolbridge/tool_catalog.hpp"

namespace toolbridge {

ToolCatalog::ToolCatalog(ConnectionManager& manager)
    : manager_(manager) {}

std::vector<ToolDefinition> ToolCatalog::refresh(const std::string& server) {
    auto tools = manager_.discover_tools(server);

    std::lock_guard<std::mutex> lock(mutex_);
    if (live(server)) {
        entries_[server] = tools;
    } else {
        // Discovery tore the connection down; nothing is known about it.
        entries_.erase(server);
    }
    return tools;
}

std::vector<ToolDefinition> ToolCatalog::tools_for(const std::string& server) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(server);
        if (it != entries_.end() && live(server)) return it->second;
    }
    return refresh(server);
}

std::vector<ToolDescriptor> ToolCatalog::list_all() const {
    std::vector<ToolDescriptor> all;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& name : manager_.list_servers()) {
        auto it = entries_.find(name);
        if (it == entries_.end() || !live(name)) continue;
        for (const auto& tool : it->second) {
            all.push_back(make_descriptor(name, tool));
        }
    }
    return all;
}

void ToolCatalog::invalidate(const std::string& server) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(server);
}

void ToolCatalog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

bool ToolCatalog::live(const std::string& server) const {
    if (!manager_.settings().cache_connections) return true;
    auto conn = manager_.find_connection(server);
    return conn && conn->is_ready();
}

} // namespace toolbridge
