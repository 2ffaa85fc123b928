#include "toolbridge/transport/process_transport.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <vector>

extern char** environ;

namespace toolbridge {

namespace {

std::once_flag g_sigpipe_once;

void ignore_sigpipe() {
    // Writes to a dead child must surface as EPIPE, not kill us.
    std::call_once(g_sigpipe_once, []() {
        struct sigaction sa {};
        sa.sa_handler = SIG_IGN;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGPIPE, &sa, nullptr);
    });
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

} // anonymous namespace

std::unique_ptr<ProcessTransport> ProcessTransport::launch(const ServerConfig& config) {
    if (config.command.empty()) {
        throw SpawnError("Server '" + config.name + "' has no command");
    }
    ignore_sigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_status[2] = {-1, -1};
    if (pipe2(in_pipe, O_CLOEXEC) < 0 || pipe2(out_pipe, O_CLOEXEC) < 0
        || pipe2(err_pipe, O_CLOEXEC) < 0 || pipe2(exec_status, O_CLOEXEC) < 0) {
        int saved = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_status);
        throw SpawnError(std::string("Failed to create pipes: ") + strerror(saved));
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> argv_store;
    argv_store.push_back(config.command);
    for (const auto& a : config.args) argv_store.push_back(a);
    std::vector<char*> argv_vec;
    for (auto& a : argv_store) argv_vec.push_back(a.data());
    argv_vec.push_back(nullptr);

    std::vector<std::string> env_store;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto key = entry.substr(0, entry.find('='));
        if (config.env.count(key) == 0) env_store.push_back(std::move(entry));
    }
    for (const auto& [key, value] : config.env) env_store.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& e : env_store) envp.push_back(e.data());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_status);
        throw SpawnError(std::string("Failed to fork: ") + strerror(saved));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        struct sigaction sa {};
        sa.sa_handler = SIG_DFL;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGPIPE, &sa, nullptr);

        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        environ = envp.data();
        execvp(argv_vec[0], argv_vec.data());

        int err = errno;
        ssize_t ignored = ::write(exec_status[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_status[1]);

    // The status pipe closes on a successful exec (O_CLOEXEC) and carries
    // errno otherwise.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_status[0]);

    if (n > 0) {
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        throw SpawnError("Could not start '" + config.command + "' for server '" + config.name
                         + "': " + strerror(exec_errno));
    }

    TOOLBRIDGE_LOG_INFO("Started tool server '" + config.name + "' (pid " + std::to_string(pid) + ")");
    return std::unique_ptr<ProcessTransport>(
        new ProcessTransport(config.name, pid, out_pipe[0], in_pipe[1], err_pipe[0]));
}

ProcessTransport::ProcessTransport(std::string name, pid_t pid, int stdout_fd, int stdin_fd,
                                   int stderr_fd)
    : name_(std::move(name)),
      pipe_(std::make_unique<PipeTransport>(stdout_fd, stdin_fd)),
      pid_(pid),
      stderr_fd_(stderr_fd) {
    if (pipe2(stderr_wakeup_, O_CLOEXEC) == 0) {
        stderr_thread_ = std::thread([this]() { stderr_loop(); });
    } else {
        TOOLBRIDGE_LOG_WARN("Not forwarding stderr of '" + name_ + "': " + strerror(errno));
    }
}

ProcessTransport::~ProcessTransport() {
    shutdown();
    pipe_.reset();
    if (stderr_thread_.joinable()) {
        if (stderr_thread_.get_id() == std::this_thread::get_id()) stderr_thread_.detach();
        else stderr_thread_.join();
    }
    if (stderr_fd_ >= 0) ::close(stderr_fd_);
    close_pair(stderr_wakeup_);
}

void ProcessTransport::start(MessageCallback on_message, CloseCallback on_close) {
    pipe_->start(std::move(on_message), std::move(on_close));
}

void ProcessTransport::send(const JsonRpcMessage& msg) {
    pipe_->send(msg);
}

bool ProcessTransport::is_connected() const {
    return !stopped_.load() && pipe_->is_connected();
}

pid_t ProcessTransport::pid() const {
    std::lock_guard<std::mutex> lock(child_mutex_);
    return pid_;
}

void ProcessTransport::shutdown() {
    if (stopped_.exchange(true)) return;
    pipe_->shutdown();
    if (stderr_wakeup_[1] >= 0) {
        char b = 1;
        ssize_t ignored = ::write(stderr_wakeup_[1], &b, 1);
        (void)ignored;
    }
    terminate_child();
}

void ProcessTransport::terminate_child() {
    std::lock_guard<std::mutex> lock(child_mutex_);
    if (pid_ <= 0) return;

    int status = 0;
    if (waitpid(pid_, &status, WNOHANG) == pid_) {
        TOOLBRIDGE_LOG_DEBUG("Tool server '" + name_ + "' had already exited");
        pid_ = -1;
        return;
    }

    kill(pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + kill_grace_;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = waitpid(pid_, &status, WNOHANG);
        if (r == pid_ || (r < 0 && errno == ECHILD)) {
            pid_ = -1;
            TOOLBRIDGE_LOG_DEBUG("Tool server '" + name_ + "' terminated");
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    TOOLBRIDGE_LOG_WARN("Tool server '" + name_ + "' ignored SIGTERM, killing");
    kill(pid_, SIGKILL);
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    pid_ = -1;
}

void ProcessTransport::stderr_loop() {
    LineFramer framer;
    char chunk[4096];

    while (true) {
        struct pollfd fds[2];
        fds[0].fd = stderr_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = stderr_wakeup_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return;
        }
        if (fds[1].revents & POLLIN) return;
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(stderr_fd_, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;

        framer.append(std::string_view(chunk, static_cast<size_t>(n)));
        while (auto line = framer.next_line()) {
            TOOLBRIDGE_LOG_DEBUG(name_ + " stderr: " + *line);
        }
    }
}

} // namespace toolbridge
