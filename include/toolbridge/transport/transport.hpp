#pragma once
#include "../json_rpc.hpp"
#include <functional>
#include <string>

namespace toolbridge {

/// Callback for incoming messages
using MessageCallback = std::function<void(JsonRpcMessage)>;
/// Called once when the peer goes away without shutdown() having been asked for.
using CloseCallback = std::function<void(const std::string& reason)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Begin delivering incoming messages. Returns immediately; callbacks run
    /// on a transport-owned thread.
    virtual void start(MessageCallback on_message, CloseCallback on_close = nullptr) = 0;

    /// Queue a message for the peer. Throws TransportError once shut down.
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Stop I/O and release the peer. Idempotent, never joins transport threads.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace toolbridge
