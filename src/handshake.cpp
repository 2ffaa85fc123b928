#include "toolbridge/handshake.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include "toolbridge/version.hpp"

namespace toolbridge {

HandshakeSequencer::HandshakeSequencer(HandshakeOptions opts)
    : opts_(std::move(opts)) {}

nlohmann::json HandshakeSequencer::initialize_params() const {
    return nlohmann::json{
        {"protocolVersion", std::string(PROTOCOL_VERSION)},
        {"capabilities", opts_.capabilities},
        {"clientInfo", opts_.client_info}
    };
}

InitializeResult HandshakeSequencer::run(Correlator& correlator) const {
    nlohmann::json raw;
    try {
        auto fut = correlator.send("initialize", initialize_params(), opts_.timeout);
        raw = fut.get();
    } catch (const TimeoutError&) {
        throw HandshakeError("No response to initialize within "
                             + std::to_string(opts_.timeout.count()) + " ms");
    } catch (const ProtocolError& e) {
        throw HandshakeError(std::string("initialize rejected: ") + e.what());
    } catch (const TransportError& e) {
        throw HandshakeError(std::string("Server went away during initialize: ") + e.what());
    }

    InitializeResult result;
    if (raw.is_object()) {
        try {
            from_json(raw, result);
        } catch (const nlohmann::json::exception& e) {
            throw HandshakeError(std::string("Malformed initialize result: ") + e.what());
        }
    } else {
        result.server_info = {"unknown", "unknown"};
    }

    try {
        correlator.notify("notifications/initialized");
    } catch (const TransportError& e) {
        throw HandshakeError(std::string("Could not send initialized notification: ") + e.what());
    }

    TOOLBRIDGE_LOG_DEBUG("Handshake complete with " + result.server_info.name + " v"
                         + result.server_info.version + " (protocol "
                         + (result.protocol_version.empty() ? std::string("?") : result.protocol_version)
                         + ")");
    return result;
}

} // namespace toolbridge
