#include <mcpcmd/upstream/upstream_process.h>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcpcmd::upstream {

namespace {

constexpr int kPollIntervalMs = 200;

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

class UpstreamProcess::Impl {
public:
    explicit Impl(UpstreamProcessConfig config);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    [[nodiscard]] ProcessState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool is_alive() const noexcept;
    [[nodiscard]] int64_t pid() const noexcept { return process_id_; }
    Result<void> write_stdin(std::string_view data);
    void terminate(std::chrono::milliseconds timeout);
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

private:
    void setup_pipes();
    void spawn_process();
    void start_io_threads();
    void stop_io_threads();
    void read_stdout_loop(std::stop_token stop);
    void read_stderr_loop(std::stop_token stop);
    bool reap(int options) const noexcept;

    UpstreamProcessConfig config_;
    std::atomic<ProcessState> state_{ProcessState::Unstarted};

    mutable std::mutex exit_mutex_;
    mutable std::optional<int> exit_code_;
    mutable std::mutex stdin_mutex_;

    std::jthread stdout_thread_;
    std::jthread stderr_thread_;

    pid_t process_id_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
    // Child ends, closed in the parent right after fork
    std::array<int, 3> child_fds_{-1, -1, -1};
};

UpstreamProcess::Impl::Impl(UpstreamProcessConfig config) : config_{std::move(config)} {
    spdlog::debug("UpstreamProcess: spawning {}", config_.executable);

    // A server that exits mid-write must not take the worker down
    ::signal(SIGPIPE, SIG_IGN);

    try {
        setup_pipes();
        spawn_process();
        start_io_threads();
        state_.store(ProcessState::Running, std::memory_order_release);
    } catch (...) {
        state_.store(ProcessState::Failed, std::memory_order_release);
        for (int& fd : child_fds_)
            close_fd(fd);
        close_fd(stdin_fd_);
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
        throw;
    }
}

UpstreamProcess::Impl::~Impl() {
    if (is_alive()) {
        terminate(std::chrono::seconds{5});
    }
    stop_io_threads();
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void UpstreamProcess::Impl::setup_pipes() {
    int stdin_pipe[2], stdout_pipe[2], stderr_pipe[2];
    if (::pipe2(stdin_pipe, O_CLOEXEC) < 0) {
        throw std::runtime_error("Failed to create pipes: " + std::string(strerror(errno)));
    }
    child_fds_[0] = stdin_pipe[0];
    stdin_fd_ = stdin_pipe[1];
    if (::pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        throw std::runtime_error("Failed to create pipes: " + std::string(strerror(errno)));
    }
    stdout_fd_ = stdout_pipe[0];
    child_fds_[1] = stdout_pipe[1];
    if (::pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        throw std::runtime_error("Failed to create pipes: " + std::string(strerror(errno)));
    }
    stderr_fd_ = stderr_pipe[0];
    child_fds_[2] = stderr_pipe[1];
}

void UpstreamProcess::Impl::spawn_process() {
    // Everything the child touches is prepared before fork
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(config_.executable.c_str()));
    for (const auto& arg : config_.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStrings;
    envStrings.reserve(config_.env.size());
    for (const auto& [key, value] : config_.env) {
        envStrings.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : envStrings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::string workdir = config_.workdir ? config_.workdir->string() : std::string{};

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error("fork() failed: " + std::string(strerror(errno)));
    }

    if (pid == 0) {
        ::dup2(child_fds_[0], STDIN_FILENO);
        ::dup2(child_fds_[1], STDOUT_FILENO);
        ::dup2(child_fds_[2], STDERR_FILENO);

        if (!workdir.empty() && ::chdir(workdir.c_str()) < 0) {
            _exit(127);
        }

        // execvp resolves the command against the PATH of the new environment
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    process_id_ = pid;
    for (int& fd : child_fds_)
        close_fd(fd);

    spdlog::info("UpstreamProcess: spawned {} (pid={})", config_.executable, process_id_);
}

void UpstreamProcess::Impl::start_io_threads() {
    stdout_thread_ = std::jthread{[this](std::stop_token stop) { read_stdout_loop(stop); }};
    stderr_thread_ = std::jthread{[this](std::stop_token stop) { read_stderr_loop(stop); }};
}

void UpstreamProcess::Impl::stop_io_threads() {
    stdout_thread_.request_stop();
    stderr_thread_.request_stop();
    if (stdout_thread_.joinable()) {
        stdout_thread_.join();
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
}

void UpstreamProcess::Impl::read_stdout_loop(std::stop_token stop) {
    std::array<char, 8192> buffer;
    while (!stop.stop_requested()) {
        pollfd pfd{stdout_fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            spdlog::error("UpstreamProcess: poll on stdout failed: {}", strerror(errno));
            break;
        }
        if (rc == 0)
            continue;

        ssize_t n = ::read(stdout_fd_, buffer.data(), buffer.size());
        if (n > 0) {
            if (config_.on_stdout) {
                config_.on_stdout(std::string_view(buffer.data(), static_cast<size_t>(n)));
            }
            continue;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN))
            continue;
        break;
    }

    if (!stop.stop_requested()) {
        spdlog::warn("UpstreamProcess: stdout of pid {} closed", process_id_);
    }
    if (config_.on_exit) {
        config_.on_exit();
    }
}

void UpstreamProcess::Impl::read_stderr_loop(std::stop_token stop) {
    std::array<char, 4096> buffer;
    std::string pending;
    auto flush_lines = [&pending](bool all) {
        std::size_t start = 0;
        std::size_t nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            if (nl > start) {
                spdlog::info("Upstream stderr: {}",
                             std::string_view(pending).substr(start, nl - start));
            }
            start = nl + 1;
        }
        pending.erase(0, start);
        if (all && !pending.empty()) {
            spdlog::info("Upstream stderr: {}", pending);
            pending.clear();
        }
    };

    while (!stop.stop_requested()) {
        pollfd pfd{stderr_fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        if (rc == 0)
            continue;

        ssize_t n = ::read(stderr_fd_, buffer.data(), buffer.size());
        if (n > 0) {
            pending.append(buffer.data(), static_cast<size_t>(n));
            flush_lines(false);
            continue;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN))
            continue;
        break;
    }
    flush_lines(true);
}

bool UpstreamProcess::Impl::reap(int options) const noexcept {
    std::lock_guard lock{exit_mutex_};
    if (exit_code_)
        return true;
    if (process_id_ <= 0)
        return false;

    int status = 0;
    pid_t result = ::waitpid(process_id_, &status, options);
    if (result == process_id_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            exit_code_ = -1;
        }
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        exit_code_ = -1;
        return true;
    }
    return false;
}

bool UpstreamProcess::Impl::is_alive() const noexcept {
    auto current = state();
    if (current != ProcessState::Running && current != ProcessState::ShuttingDown) {
        return false;
    }
    return !reap(WNOHANG);
}

std::optional<int> UpstreamProcess::Impl::exit_code() const noexcept {
    std::lock_guard lock{exit_mutex_};
    return exit_code_;
}

Result<void> UpstreamProcess::Impl::write_stdin(std::string_view data) {
    std::lock_guard lock{stdin_mutex_};
    if (stdin_fd_ < 0) {
        return Error{ErrorCode::IOError, "Upstream stdin is closed"};
    }

    std::size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE) {
                spdlog::warn("UpstreamProcess: broken pipe writing to pid {}", process_id_);
            }
            return Error{ErrorCode::IOError,
                         "Failed to write to upstream stdin: " + std::string(strerror(errno))};
        }
        offset += static_cast<std::size_t>(written);
    }
    return {};
}

void UpstreamProcess::Impl::terminate(std::chrono::milliseconds timeout) {
    if (!is_alive()) {
        state_.store(ProcessState::Terminated, std::memory_order_release);
        return;
    }

    spdlog::info("UpstreamProcess: terminating {} (pid={})", config_.executable, process_id_);
    state_.store(ProcessState::ShuttingDown, std::memory_order_release);

    // EOF on stdin is the stdio transport's shutdown request
    {
        std::lock_guard lock{stdin_mutex_};
        close_fd(stdin_fd_);
    }

    if (::kill(process_id_, SIGTERM) == 0 && wait_for_exit(timeout)) {
        state_.store(ProcessState::Terminated, std::memory_order_release);
        return;
    }

    spdlog::warn("UpstreamProcess: forcefully killing pid {}", process_id_);
    ::kill(process_id_, SIGKILL);
    if (!wait_for_exit(std::chrono::seconds{1})) {
        spdlog::error("UpstreamProcess: pid {} did not exit after SIGKILL", process_id_);
    }
    state_.store(ProcessState::Terminated, std::memory_order_release);
}

bool UpstreamProcess::Impl::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(WNOHANG))
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return reap(WNOHANG);
}

// ============================================================================
// Public interface (delegates to Impl)
// ============================================================================

UpstreamProcess::UpstreamProcess(UpstreamProcessConfig config)
    : impl_{std::make_unique<Impl>(std::move(config))} {}

UpstreamProcess::~UpstreamProcess() = default;

ProcessState UpstreamProcess::state() const noexcept {
    return impl_->state();
}

bool UpstreamProcess::is_alive() const noexcept {
    return impl_->is_alive();
}

int64_t UpstreamProcess::pid() const noexcept {
    return impl_->pid();
}

Result<void> UpstreamProcess::write_stdin(std::string_view data) {
    return impl_->write_stdin(data);
}

void UpstreamProcess::terminate(std::chrono::milliseconds timeout) {
    impl_->terminate(timeout);
}

bool UpstreamProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    return impl_->wait_for_exit(timeout);
}

std::optional<int> UpstreamProcess::exit_code() const noexcept {
    return impl_->exit_code();
}

} // namespace mcpcmd::upstream
