#include "toolbridge/json_rpc.hpp"
#include "toolbridge/version.hpp"

namespace toolbridge {

std::string request_id_to_string(const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    return std::get<std::string>(id);
}

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.value("code", 0);
    e.message = j.value("message", std::string("Unknown error"));
    if (j.contains("data")) e.data = j.at("data");
}

JsonRpcRequest make_request(int64_t id, std::string method, nlohmann::json params) {
    JsonRpcRequest req;
    req.id = RequestId{id};
    req.method = std::move(method);
    req.params = std::move(params);
    return req;
}

JsonRpcNotification make_notification(std::string method, nlohmann::json params) {
    JsonRpcNotification notif;
    notif.method = std::move(method);
    notif.params = std::move(params);
    return notif;
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.result) j["result"] = *r.result;
    if (r.error) j["error"] = *r.error;
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace toolbridge
