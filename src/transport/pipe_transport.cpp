#include "toolbridge/transport/pipe_transport.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace toolbridge {

PipeTransport::PipeTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd) {
}

PipeTransport::~PipeTransport() {
    shutdown();
    // A callback may drop the last owner from inside the reader thread.
    if (reader_thread_.joinable()) {
        if (reader_thread_.get_id() == std::this_thread::get_id()) reader_thread_.detach();
        else reader_thread_.join();
    }
    if (writer_thread_.joinable()) {
        if (writer_thread_.get_id() == std::this_thread::get_id()) writer_thread_.detach();
        else writer_thread_.join();
    }
    if (read_fd_ >= 0)  ::close(read_fd_);
    if (write_fd_ >= 0) ::close(write_fd_);
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void PipeTransport::start(MessageCallback on_message, CloseCallback on_close) {
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    if (running_.exchange(true)) {
        return; // already running
    }

    if (pipe(wakeup_pipe_) < 0) {
        running_ = false;
        throw TransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    on_message_ = std::move(on_message);
    on_close_ = std::move(on_close);
    connected_ = true;

    writer_thread_ = std::thread([this]() { write_loop(); });
    reader_thread_ = std::thread([this]() { read_loop(); });
}

void PipeTransport::notify_closed(const std::string& reason) {
    connected_ = false;
    running_ = false;
    write_cv_.notify_all();
    if (shutdown_requested_.load()) return;
    if (close_notified_.exchange(true)) return;
    TOOLBRIDGE_LOG_DEBUG("Transport closed: " + reason);
    if (on_close_) on_close_(reason);
}

void PipeTransport::read_loop() {
    LineFramer framer;
    char chunk[4096];

    while (running_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            notify_closed(std::string("poll failed: ") + strerror(errno));
            return;
        }

        // shutdown() was called
        if (fds[1].revents & POLLIN) return;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            notify_closed(std::string("read error: ") + strerror(errno));
            return;
        }
        if (n == 0) {
            notify_closed("end of stream");
            return;
        }

        framer.append(std::string_view(chunk, static_cast<size_t>(n)));
        while (auto line = framer.next_line()) {
            auto msg = Codec::try_parse(*line);
            if (!msg) {
                ++ignored_lines_;
                continue;
            }
            if (on_message_) on_message_(std::move(*msg));
        }
    }
}

void PipeTransport::write_loop() {
    while (true) {
        std::string msg_to_write;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || !running_;
            });

            if (!running_) break;
            msg_to_write = std::move(write_queue_.front());
            write_queue_.pop();
        }

        msg_to_write += '\n';
        const char* data = msg_to_write.data();
        size_t remaining = msg_to_write.size();

        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                TOOLBRIDGE_LOG_WARN(std::string("Write to peer failed: ") + strerror(errno));
                connected_ = false;
                return;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void PipeTransport::send(const JsonRpcMessage& msg) {
    if (shutdown_requested_.load() || (running_.load() && !connected_.load())) {
        throw TransportError("Transport not connected");
    }
    std::string serialized = Codec::serialize(msg);
    TOOLBRIDGE_LOG_TRACE("--> " + serialized);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(serialized));
    }
    write_cv_.notify_one();
}

void PipeTransport::wake_reader() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
        (void)ignored;
    }
}

void PipeTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    connected_ = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        running_ = false;
    }
    write_cv_.notify_all();
    wake_reader();
}

bool PipeTransport::is_connected() const {
    return connected_;
}

} // namespace toolbridge
