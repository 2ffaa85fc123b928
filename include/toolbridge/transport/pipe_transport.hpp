#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>

namespace toolbridge {

/// Newline-delimited JSON over a pair of file descriptors.
/// A reader thread frames and parses incoming lines; a writer thread drains
/// the outgoing queue so send() never blocks on a slow peer.
class PipeTransport : public ITransport {
public:
    /// Takes ownership of both descriptors.
    PipeTransport(int read_fd, int write_fd);
    ~PipeTransport() override;

    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;

    void start(MessageCallback on_message, CloseCallback on_close = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

    /// Lines that were dropped because they did not parse as a message.
    [[nodiscard]] size_t ignored_lines() const noexcept { return ignored_lines_; }

private:
    void read_loop();
    void write_loop();
    void wake_reader();
    void notify_closed(const std::string& reason);

    int read_fd_;
    int write_fd_;

    MessageCallback on_message_;
    CloseCallback on_close_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> close_notified_{false};
    std::atomic<size_t> ignored_lines_{0};

    std::thread reader_thread_;
    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};  // wakes the reader out of poll()
};

} // namespace toolbridge
