#pragma once
#include "json_rpc.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace toolbridge {

/// Longest deadline a request may carry; send() clamps anything above it.
constexpr std::chrono::milliseconds MAX_REQUEST_TIMEOUT = std::chrono::hours(24);

struct PendingRequest {
    std::string method;
    std::chrono::steady_clock::time_point deadline;
    std::promise<nlohmann::json> promise;
};

/// Matches responses from one tool server to the requests that asked for
/// them. Every future returned by send() settles exactly once: with the
/// result payload, a ProtocolError for an error response, a TimeoutError when
/// its deadline passes, or a TransportError when the connection goes away.
class Correlator {
public:
    /// Invoked from the watchdog thread after a request has timed out.
    using TimeoutHook = std::function<void(const std::string& method, int64_t id)>;

    explicit Correlator(ITransport& transport);
    ~Correlator();

    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;

    /// Register a request under a fresh id and write it to the transport.
    [[nodiscard]] std::future<nlohmann::json> send(const std::string& method,
                                                   nlohmann::json params,
                                                   std::chrono::milliseconds timeout);

    /// Write a notification; nothing is correlated.
    void notify(const std::string& method, nlohmann::json params = nlohmann::json::object());

    /// Settle the pending request this message answers, if any.
    /// Returns false for notifications, requests and unknown ids.
    bool on_message(const JsonRpcMessage& msg);

    /// Reject everything still outstanding with a TransportError.
    void fail_all(const std::string& reason);

    void on_timeout(TimeoutHook hook);

    /// Reject anything still outstanding and stop the watchdog. When called
    /// from any thread but the watchdog's own, waits for a running timeout
    /// hook to return.
    void stop();

    [[nodiscard]] size_t pending_count() const;

private:
    void watchdog_loop();

    ITransport& transport_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<int64_t, PendingRequest> pending_;
    int64_t next_id_{1};
    bool stopped_{false};
    TimeoutHook timeout_hook_;

    std::mutex join_mutex_;
    std::thread watchdog_;
};

} // namespace toolbridge
