#pragma once
#include "toolbridge/codec.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/server_connection.hpp"
#include "toolbridge/transport/transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace toolbridge::testing {

/// In-memory transport. Everything sent is recorded; an optional responder
/// sees each outgoing message on the sending thread and may answer through
/// deliver() right away.
class MockTransport : public ITransport {
public:
    using Responder = std::function<void(MockTransport&, const JsonRpcMessage&)>;

    void start(MessageCallback on_message, CloseCallback on_close) override {
        std::lock_guard<std::mutex> lock(mutex_);
        on_message_ = std::move(on_message);
        on_close_ = std::move(on_close);
        connected_ = true;
    }

    void send(const JsonRpcMessage& msg) override {
        Responder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_ || !connected_) throw TransportError("mock transport closed");
            sent_.push_back(msg);
            responder = responder_;
        }
        cv_.notify_all();
        if (responder) responder(*this, msg);
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        connected_ = false;
        ++shutdown_count_;
    }

    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    void set_responder(Responder r) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(r);
    }

    /// Hand a message to the owner as if it had arrived from the peer.
    void deliver(const JsonRpcMessage& msg) {
        MessageCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_) return;
            cb = on_message_;
        }
        if (cb) cb(msg);
    }

    void deliver_line(const std::string& line) {
        if (auto msg = Codec::try_parse(line)) deliver(*msg);
    }

    void respond(const RequestId& id, nlohmann::json result) {
        JsonRpcResponse r;
        r.id = id;
        r.result = std::move(result);
        deliver(r);
    }

    void respond_error(const RequestId& id, int code, const std::string& message) {
        JsonRpcResponse r;
        r.id = id;
        r.error = JsonRpcError{code, message, std::nullopt};
        deliver(r);
    }

    /// The peer went away on its own.
    void close_from_peer(const std::string& reason = "peer closed") {
        CloseCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_) return;
            connected_ = false;
            cb = on_close_;
        }
        if (cb) cb(reason);
    }

    [[nodiscard]] std::vector<JsonRpcMessage> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    [[nodiscard]] std::vector<std::string> sent_methods() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& m : sent_) {
            if (const auto* r = std::get_if<JsonRpcRequest>(&m)) out.push_back(r->method);
            else if (const auto* n = std::get_if<JsonRpcNotification>(&m)) out.push_back(n->method);
            else out.push_back("<response>");
        }
        return out;
    }

    /// Last request sent with `method`; throws when there is none.
    [[nodiscard]] JsonRpcRequest last_request(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sent_.rbegin(); it != sent_.rend(); ++it) {
            if (const auto* r = std::get_if<JsonRpcRequest>(&*it)) {
                if (r->method == method) return *r;
            }
        }
        throw std::runtime_error("no " + method + " request was sent");
    }

    bool wait_for_sent(size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return sent_.size() >= count; });
    }

    [[nodiscard]] int shutdown_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_count_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    MessageCallback on_message_;
    CloseCallback on_close_;
    Responder responder_;
    std::vector<JsonRpcMessage> sent_;
    bool connected_ = false;
    bool shut_down_ = false;
    int shutdown_count_ = 0;
};

/// Answers like a well-behaved tool server. Each switch turns one kind of
/// answer off so the request is left hanging.
struct ScriptedServer {
    nlohmann::json tools = nlohmann::json::array();
    bool answer_initialize = true;
    bool answer_tools_list = true;
    bool answer_tools_call = true;
    /// Identity reported in the initialize answer.
    nlohmann::json protocol_version = "2024-11-05";
    nlohmann::json server_info = {{"name", "scripted"}, {"version", "0.0.1"}};
    /// Put tools/call payloads next to "id" instead of under "result".
    bool bare_content = false;
    /// Result payload for a tools/call; defaults to echoing arguments.text.
    std::function<nlohmann::json(const std::string&, const nlohmann::json&)> on_call;

    MockTransport::Responder responder() const {
        auto self = std::make_shared<ScriptedServer>(*this);
        return [self](MockTransport& t, const JsonRpcMessage& msg) {
            const auto* req = std::get_if<JsonRpcRequest>(&msg);
            if (!req) return;
            nlohmann::json params = req->params.value_or(nlohmann::json::object());

            if (req->method == "initialize" && self->answer_initialize) {
                t.respond(req->id, nlohmann::json{
                    {"protocolVersion", self->protocol_version},
                    {"capabilities", {{"tools", nlohmann::json::object()}}},
                    {"serverInfo", self->server_info}
                });
            } else if (req->method == "tools/list" && self->answer_tools_list) {
                t.respond(req->id, nlohmann::json{{"tools", self->tools}});
            } else if (req->method == "tools/call" && self->answer_tools_call) {
                auto name = params.value("name", "");
                auto args = params.value("arguments", nlohmann::json::object());
                nlohmann::json result = self->on_call
                    ? self->on_call(name, args)
                    : nlohmann::json{{"content", nlohmann::json::array({
                          nlohmann::json{{"type", "text"}, {"text", args.value("text", "")}}})}};
                if (self->bare_content) {
                    t.deliver_line(nlohmann::json{{"jsonrpc", "2.0"},
                                                  {"id", std::get<int64_t>(req->id)},
                                                  {"content", result["content"]}}.dump());
                } else {
                    t.respond(req->id, result);
                }
            }
        };
    }
};

/// Transport factory handing out MockTransports wired to one script.
/// Counts every transport it creates; can fail or stall creation.
class MockTransportFactory {
public:
    explicit MockTransportFactory(ScriptedServer script = {})
        : state_(std::make_shared<State>()) {
        state_->script = std::move(script);
    }

    void fail_spawns(bool fail) { state_->fail_spawns = fail; }
    void set_spawn_delay(std::chrono::milliseconds d) { state_->spawn_delay_ms = static_cast<int>(d.count()); }

    [[nodiscard]] int created() const { return state_->created; }

    /// Most recently created transport; only valid while its connection lives.
    [[nodiscard]] MockTransport* last() const { return state_->last; }

    [[nodiscard]] TransportFactory factory() const {
        auto state = state_;
        return [state](const ServerConfig& config) -> std::unique_ptr<ITransport> {
            ++state->created;
            if (state->spawn_delay_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(state->spawn_delay_ms.load()));
            }
            if (state->fail_spawns) {
                throw SpawnError("Could not start '" + config.command + "' for server '"
                                 + config.name + "': No such file or directory");
            }
            auto t = std::make_unique<MockTransport>();
            t->set_responder(state->script.responder());
            state->last = t.get();
            return t;
        };
    }

private:
    struct State {
        ScriptedServer script;
        std::atomic<int> created{0};
        std::atomic<bool> fail_spawns{false};
        std::atomic<int> spawn_delay_ms{0};
        std::atomic<MockTransport*> last{nullptr};
    };
    std::shared_ptr<State> state_;
};

} // namespace toolbridge::testing
