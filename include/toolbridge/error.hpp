#pragma once
#include <stdexcept>
#include <string>

namespace toolbridge {

class ToolBridgeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed or irrelevant line from a tool server. Never fatal on its own.
class ParseError : public ToolBridgeError {
public:
    using ToolBridgeError::ToolBridgeError;
};

/// The server answered a request with a JSON-RPC error object.
class ProtocolError : public ToolBridgeError {
public:
    int code;
    ProtocolError(int code, const std::string& msg)
        : ToolBridgeError(msg), code(code) {}
};

class TransportError : public ToolBridgeError {
public:
    using ToolBridgeError::ToolBridgeError;
};

/// The tool server process could not be started.
class SpawnError : public TransportError {
public:
    using TransportError::TransportError;
};

/// initialize was rejected, timed out, or the process died before answering.
class HandshakeError : public ToolBridgeError {
public:
    using ToolBridgeError::ToolBridgeError;
};

class TimeoutError : public ToolBridgeError {
public:
    using ToolBridgeError::ToolBridgeError;
};

/// Operation on a connection that is not Ready, or on an unknown server.
class ConnectionError : public ToolBridgeError {
public:
    using ToolBridgeError::ToolBridgeError;
};

class ConfigError : public ToolBridgeError {
public:
    using ToolBridgeError::ToolBridgeError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace toolbridge
