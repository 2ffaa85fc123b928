#pragma once
#include "correlator.hpp"
#include "types.hpp"
#include "version.hpp"
#include <chrono>

namespace toolbridge {

struct HandshakeOptions {
    Implementation client_info{std::string(CLIENT_NAME), std::string(LIBRARY_VERSION)};
    nlohmann::json capabilities = nlohmann::json{{"tools", nlohmann::json::object()}};
    std::chrono::milliseconds timeout{10000};
};

/// Drives initialize -> notifications/initialized. Each step is dispatched
/// only after the previous one has settled; there are no timing gaps to tune.
class HandshakeSequencer {
public:
    explicit HandshakeSequencer(HandshakeOptions opts = {});

    /// Blocks until the server has answered initialize and the initialized
    /// notification has been queued. Throws HandshakeError on any failure.
    InitializeResult run(Correlator& correlator) const;

    [[nodiscard]] nlohmann::json initialize_params() const;

private:
    HandshakeOptions opts_;
};

} // namespace toolbridge
