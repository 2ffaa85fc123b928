#include "toolbridge/codec.hpp"
#include "toolbridge/log.hpp"
#include "toolbridge/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace toolbridge {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

bool is_version_ok(const nlohmann::json& j) {
    if (!j.contains("jsonrpc")) return false;
    const auto& v = j.at("jsonrpc");
    return v.is_string() && v.get<std::string>() == JSONRPC_VERSION;
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    if (!is_version_ok(j)) {
        throw ParseError("Missing or invalid 'jsonrpc' field");
    }

    const bool has_id = j.contains("id") && !j.at("id").is_null();
    const bool has_method = j.contains("method") && j.at("method").is_string();

    try {
        if (has_method && has_id) {
            JsonRpcRequest req;
            from_json(j.at("id"), req.id);
            req.method = j.at("method").get<std::string>();
            if (j.contains("params")) req.params = j.at("params");
            return req;
        }
        if (has_method) {
            JsonRpcNotification notif;
            notif.method = j.at("method").get<std::string>();
            if (j.contains("params")) notif.params = j.at("params");
            return notif;
        }
        if (has_id) {
            JsonRpcResponse resp;
            from_json(j.at("id"), resp.id);
            if (j.contains("error") && j.at("error").is_object()) {
                resp.error = j.at("error").get<JsonRpcError>();
            } else if (j.contains("result")) {
                resp.result = j.at("result");
            } else if (j.contains("content")) {
                // Some servers put the tool payload beside the id instead of
                // under "result".
                nlohmann::json payload = j;
                payload.erase("jsonrpc");
                payload.erase("id");
                resp.result = std::move(payload);
            } else {
                throw ParseError("Response carries neither result, error nor content");
            }
            return resp;
        }
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(std::string("Malformed message: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ParseError(e.what());
    }
    throw ParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::value root;
        auto root_error = doc.get_value().get(root);
        if (root_error) {
            throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(root_error));
        }
        j = simdjson_to_nlohmann(root);
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("JSON conversion error: ") + e.what());
    }

    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }
    return parse_object(j);
}

std::optional<JsonRpcMessage> Codec::try_parse(std::string_view raw) {
    try {
        return parse(raw);
    } catch (const ParseError& e) {
        TOOLBRIDGE_LOG_DEBUG(std::string("Ignoring line (") + e.what() + "): " + std::string(raw));
        return std::nullopt;
    }
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

// ---------- LineFramer ----------

void LineFramer::append(std::string_view chunk) {
    // Compact once the consumed prefix dominates the buffer.
    if (pos_ > 0 && pos_ * 2 >= buffer_.size()) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
    buffer_.append(chunk.data(), chunk.size());
}

std::optional<std::string> LineFramer::next_line() {
    while (true) {
        size_t nl = buffer_.find('\n', pos_);
        if (nl == std::string::npos) return std::nullopt;

        std::string line = buffer_.substr(pos_, nl - pos_);
        pos_ = nl + 1;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;
        return line;
    }
}

void LineFramer::clear() noexcept {
    buffer_.clear();
    pos_ = 0;
}

} // namespace toolbridge
