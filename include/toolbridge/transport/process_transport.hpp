#pragma once
#include "pipe_transport.hpp"
#include "../types.hpp"
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace toolbridge {

/// Runs a tool server as a child process and talks to it over its stdin and
/// stdout. The child's stderr is forwarded to the debug log.
///
/// The child is terminated and reaped by shutdown(), which the destructor
/// also calls, so no process outlives its transport.
class ProcessTransport : public ITransport {
public:
    /// Spawn `config.command` with `config.args` (PATH lookup, no shell).
    /// Throws SpawnError when the executable cannot be started.
    [[nodiscard]] static std::unique_ptr<ProcessTransport> launch(const ServerConfig& config);

    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    void start(MessageCallback on_message, CloseCallback on_close = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

    /// Child pid, or -1 once reaped.
    [[nodiscard]] pid_t pid() const;

    /// How long the child gets between SIGTERM and SIGKILL.
    void set_kill_grace(std::chrono::milliseconds grace) { kill_grace_ = grace; }

private:
    ProcessTransport(std::string name, pid_t pid, int stdout_fd, int stdin_fd, int stderr_fd);

    void stderr_loop();
    void terminate_child();

    std::string name_;
    std::unique_ptr<PipeTransport> pipe_;

    mutable std::mutex child_mutex_;
    pid_t pid_;

    int stderr_fd_;
    int stderr_wakeup_[2]{-1, -1};
    std::thread stderr_thread_;

    std::atomic<bool> stopped_{false};
    std::chrono::milliseconds kill_grace_{500};
};

} // namespace toolbridge
