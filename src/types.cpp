#include "toolbridge/types.hpp"

namespace toolbridge {

namespace {

nlohmann::json text_item(const std::string& text) {
    return nlohmann::json{{"type", "text"}, {"text", text}};
}

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

} // anonymous namespace

// ---------- ServerConfig ----------

bool ServerConfig::is_remote() const {
    if (remote) return *remote;
    for (const auto& arg : args) {
        if (arg.find("http") != std::string::npos) return true;
    }
    return false;
}

std::string ServerConfig::display_description() const {
    if (description && !description->empty()) return *description;
    return name + " services";
}

// ---------- Tools ----------

ToolDescriptor make_descriptor(const std::string& server_name, const ToolDefinition& tool) {
    ToolDescriptor d;
    d.server_name = server_name;
    d.tool_name = tool.name;
    d.description = tool.description.value_or("");
    d.parameter_schema = tool.input_schema;
    return d;
}

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (t.description) j["description"] = *t.description;
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    if (j.contains("description") && j.at("description").is_string()) {
        t.description = j.at("description").get<std::string>();
    }
    // Older servers publish the schema as "parameters".
    if (j.contains("inputSchema") && !j.at("inputSchema").is_null()) {
        t.input_schema = j.at("inputSchema");
    } else if (j.contains("parameters") && !j.at("parameters").is_null()) {
        t.input_schema = j.at("parameters");
    } else {
        t.input_schema = nlohmann::json::object();
    }
}

void to_json(nlohmann::json& j, const ToolDescriptor& t) {
    j = {{"serverName", t.server_name},
         {"toolName", t.tool_name},
         {"description", t.description},
         {"parameters", t.parameter_schema}};
}

// ---------- ToolResult ----------

std::string ToolResult::text() const {
    std::string out;
    if (!content.is_array()) return out;
    for (const auto& item : content) {
        std::string piece;
        if (item.is_string()) {
            piece = item.get<std::string>();
        } else if (item.is_object() && string_or(item, "type", "") == "text"
                   && item.contains("text") && item.at("text").is_string()) {
            piece = item.at("text").get<std::string>();
        } else {
            continue;
        }
        if (!out.empty()) out += "\n";
        out += piece;
    }
    return out;
}

ToolResult normalize_tool_result(const nlohmann::json& payload) {
    ToolResult r;
    r.raw = payload;

    if (payload.is_null()) return r;

    if (payload.is_string()) {
        r.content.push_back(text_item(payload.get<std::string>()));
        return r;
    }

    if (payload.is_array()) {
        r.content = payload;
        return r;
    }

    if (!payload.is_object()) {
        r.content.push_back(text_item(payload.dump()));
        return r;
    }

    if (payload.contains("content")) {
        const auto& c = payload.at("content");
        if (c.is_array()) {
            r.content = c;
        } else if (c.is_string()) {
            r.content.push_back(text_item(c.get<std::string>()));
        } else if (!c.is_null()) {
            r.content.push_back(c);
        }
    } else if (!payload.contains("structuredContent")) {
        r.content.push_back(text_item(payload.dump()));
    }

    if (payload.contains("structuredContent")) {
        r.structured_content = payload.at("structuredContent");
    }
    if (payload.contains("isError") && payload.at("isError").is_boolean()) {
        r.is_error = payload.at("isError").get<bool>();
    }
    return r;
}

void to_json(nlohmann::json& j, const ToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = t.content;
    if (t.structured_content) j["structuredContent"] = *t.structured_content;
    if (t.is_error) j["isError"] = t.is_error;
}

// ---------- Handshake ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = string_or(j, "name", "unknown");
    t.version = string_or(j, "version", "unknown");
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
    if (j.contains("resources")) t.resources = j.at("resources");
    if (j.contains("prompts")) t.prompts = j.at("prompts");
    if (j.contains("logging")) t.logging = j.at("logging");
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = string_or(j, "protocolVersion", std::string());
    if (j.contains("capabilities") && j.at("capabilities").is_object()) {
        from_json(j.at("capabilities"), t.capabilities);
    }
    if (j.contains("serverInfo") && j.at("serverInfo").is_object()) {
        from_json(j.at("serverInfo"), t.server_info);
    } else {
        t.server_info = {"unknown", "unknown"};
    }
    if (j.contains("instructions") && j.at("instructions").is_string()) {
        t.instructions = j.at("instructions").get<std::string>();
    }
}

// ---------- Connection state ----------

std::string connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:     return "disconnected";
        case ConnectionState::Connecting:       return "connecting";
        case ConnectionState::HandshakePending: return "handshake-pending";
        case ConnectionState::Ready:            return "ready";
        case ConnectionState::Failed:           return "failed";
    }
    return "unknown";
}

// ---------- Summaries ----------

void to_json(nlohmann::json& j, const ServerSummary& t) {
    auto tools = nlohmann::json::array();
    for (const auto& tool : t.tools) {
        tools.push_back({{"name", tool.tool_name}, {"description", tool.description}});
    }
    j = {{"name", t.name},
         {"description", t.description},
         {"connected", t.connected},
         {"toolCount", t.tools.size()},
         {"tools", std::move(tools)}};
}

} // namespace toolbridge
