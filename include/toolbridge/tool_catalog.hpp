#pragma once
#include "connection_manager.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace toolbridge {

/// Read-side view of the tools each server offers. Entries follow server
/// registration order; the catalog never changes a connection's state.
class ToolCatalog {
public:
    explicit ToolCatalog(ConnectionManager& manager);

    /// Re-run discovery for one server and replace its entry.
    /// Throws whatever the manager throws when the server cannot be reached.
    std::vector<ToolDefinition> refresh(const std::string& server);

    /// Cached entry for `server`, discovering on first use.
    [[nodiscard]] std::vector<ToolDefinition> tools_for(const std::string& server);

    /// Last-known tools of every Ready server, flattened. Without connection
    /// caching nothing stays Ready, so every discovered entry counts.
    [[nodiscard]] std::vector<ToolDescriptor> list_all() const;

    void invalidate(const std::string& server);
    void clear();

private:
    [[nodiscard]] bool live(const std::string& server) const;

    ConnectionManager& manager_;
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<ToolDefinition>> entries_;
};

} // namespace toolbridge
