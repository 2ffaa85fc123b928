#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace toolbridge {

/// Outgoing ids are always integers; servers may echo either form back.
using RequestId = std::variant<int64_t, std::string>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be integer or string");
    }
}

std::string request_id_to_string(const RequestId& id);

struct JsonRpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

[[nodiscard]] JsonRpcRequest make_request(int64_t id, std::string method,
                                          nlohmann::json params = nlohmann::json::object());
[[nodiscard]] JsonRpcNotification make_notification(std::string method,
                                                     nlohmann::json params = nlohmann::json::object());

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void to_json(nlohmann::json& j, const JsonRpcMessage& m);

} // namespace toolbridge
