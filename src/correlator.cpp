#include "toolbridge/correlator.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include <algorithm>
#include <vector>

namespace toolbridge {

namespace {

bool numeric_id(const RequestId& id, int64_t& out) {
    if (const auto* i = std::get_if<int64_t>(&id)) {
        out = *i;
        return true;
    }
    const auto& s = std::get<std::string>(id);
    if (s.empty()) return false;
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used != s.size()) return false;
        out = static_cast<int64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // anonymous namespace

Correlator::Correlator(ITransport& transport)
    : transport_(transport) {
    watchdog_ = std::thread([this]() { watchdog_loop(); });
}

Correlator::~Correlator() {
    stop();
    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (watchdog_.joinable()) watchdog_.detach();
}

std::future<nlohmann::json> Correlator::send(const std::string& method,
                                             nlohmann::json params,
                                             std::chrono::milliseconds timeout) {
    int64_t id;
    std::future<nlohmann::json> fut;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            throw TransportError("Connection closed; cannot send " + method);
        }
        id = next_id_++;
        auto& p = pending_[id];
        p.method = method;
        p.deadline = std::chrono::steady_clock::now() + std::min(timeout, MAX_REQUEST_TIMEOUT);
        fut = p.promise.get_future();
    }
    cv_.notify_all();

    // The lock is released: a transport may answer from inside send().
    try {
        transport_.send(make_request(id, method, std::move(params)));
    } catch (const TransportError&) {
        std::promise<nlohmann::json> promise;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id);
            if (it != pending_.end()) {
                promise = std::move(it->second.promise);
                pending_.erase(it);
                found = true;
            }
        }
        if (found) promise.set_exception(std::current_exception());
    }
    return fut;
}

void Correlator::notify(const std::string& method, nlohmann::json params) {
    transport_.send(make_notification(method, std::move(params)));
}

bool Correlator::on_message(const JsonRpcMessage& msg) {
    const auto* resp = std::get_if<JsonRpcResponse>(&msg);
    if (!resp) return false;

    int64_t id = 0;
    if (!numeric_id(resp->id, id)) {
        TOOLBRIDGE_LOG_DEBUG("Ignoring response with foreign id " + request_id_to_string(resp->id));
        return false;
    }

    std::promise<nlohmann::json> promise;
    std::string method;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            TOOLBRIDGE_LOG_DEBUG("Ignoring response for unknown request id " + std::to_string(id));
            return false;
        }
        promise = std::move(it->second.promise);
        method = std::move(it->second.method);
        pending_.erase(it);
    }
    cv_.notify_all();

    if (resp->error) {
        promise.set_exception(std::make_exception_ptr(ProtocolError(
            resp->error->code,
            method + " failed: RPC error " + std::to_string(resp->error->code) + ": "
                + resp->error->message)));
    } else {
        promise.set_value(resp->result.value_or(nlohmann::json::object()));
    }
    return true;
}

void Correlator::fail_all(const std::string& reason) {
    std::map<int64_t, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed.swap(pending_);
    }
    cv_.notify_all();

    for (auto& [id, req] : failed) {
        TOOLBRIDGE_LOG_DEBUG("Rejecting " + req.method + " (id " + std::to_string(id) + "): " + reason);
        req.promise.set_exception(std::make_exception_ptr(
            TransportError(req.method + " aborted: " + reason)));
    }
}

void Correlator::on_timeout(TimeoutHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    timeout_hook_ = std::move(hook);
}

void Correlator::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
    fail_all("connection closed");

    // Once this returns on another thread, no timeout hook is running.
    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (watchdog_.joinable() && watchdog_.get_id() != std::this_thread::get_id()) {
        watchdog_.join();
    }
}

size_t Correlator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void Correlator::watchdog_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopped_) {
        if (pending_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto earliest = std::chrono::steady_clock::time_point::max();
        for (const auto& entry : pending_) {
            if (entry.second.deadline < earliest) earliest = entry.second.deadline;
        }
        if (std::chrono::steady_clock::now() < earliest) {
            cv_.wait_until(lock, earliest);
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        std::vector<std::pair<int64_t, PendingRequest>> expired;
        for (auto it = pending_.begin(); it != pending_.end(); ) {
            if (it->second.deadline <= now) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
        TimeoutHook hook = timeout_hook_;

        lock.unlock();
        for (auto& [id, req] : expired) {
            TOOLBRIDGE_LOG_WARN("Request " + req.method + " (id " + std::to_string(id) + ") timed out");
            req.promise.set_exception(std::make_exception_ptr(
                TimeoutError("Request timed out: " + req.method)));
        }
        for (auto& [id, req] : expired) {
            if (hook) hook(req.method, id);
        }
        lock.lock();
    }
}

} // namespace toolbridge
