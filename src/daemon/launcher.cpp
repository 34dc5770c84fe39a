#include <mcpcmd/config/settings.h>
#include <mcpcmd/daemon/ipc/line_framer.h>
#include <mcpcmd/daemon/ipc/rpc_protocol.h>
#include <mcpcmd/daemon/launcher.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcpcmd::daemon {

namespace {

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

std::vector<std::string> Launcher::worker_arguments(const std::string& name,
                                                    const registry::LaunchSpec& spec,
                                                    int controlFd) const {
    std::vector<std::string> args = options_.workerGlobalArgs;
    args.emplace_back(kWorkerSubcommand);
    args.push_back(name);
    args.push_back(registry::launch_spec_to_json(spec).dump());
    args.emplace_back("--control-fd");
    args.push_back(std::to_string(controlFd));
    return args;
}

Result<registry::Entry> Launcher::launch(const std::string& name,
                                         const registry::LaunchSpec& spec) {
    auto current = store_.load();
    if (!current) {
        return current.error();
    }
    if (current.value().contains(name)) {
        return Error{ErrorCode::AlreadyRunning, "Server \"" + name + "\" is already running"};
    }

    auto spawned = spawn(name, spec);
    if (!spawned) {
        return spawned.error();
    }
    auto worker = spawned.value();

    auto ready = await_ready(worker);
    close_fd(worker.controlFd);
    if (!ready) {
        kill_and_reap(worker.pid);
        return ready.error();
    }

    registry::Entry entry;
    entry.name = name;
    entry.launchSpec = spec;
    entry.pid = worker.pid;
    entry.socketAddress = ready.value();
    entry.startedAt = registry::format_timestamp(std::chrono::system_clock::now());

    // Re-read under the lock: another invocation may have changed the file meanwhile
    auto lock = store_.lock();
    if (!lock) {
        kill_and_reap(worker.pid);
        return lock.error();
    }
    auto latest = store_.load();
    if (!latest) {
        kill_and_reap(worker.pid);
        return latest.error();
    }
    auto registry = std::move(latest).value();
    registry[name] = entry;
    if (auto saved = store_.save(registry); !saved) {
        kill_and_reap(worker.pid);
        return saved.error();
    }

    spdlog::info("Launcher: server '{}' ready (pid={}, socket={})", name, entry.pid,
                 entry.socketAddress.string());
    return entry;
}

Result<Launcher::SpawnedWorker> Launcher::spawn(const std::string& name,
                                                const registry::LaunchSpec& spec) {
    std::filesystem::path exe = options_.workerExecutable;
    if (exe.empty()) {
        exe = config::current_executable();
    }
    if (exe.empty()) {
        return Error{ErrorCode::SpawnFailed, "Cannot determine the worker executable"};
    }

    int control[2];
    if (::pipe2(control, O_CLOEXEC) < 0) {
        return Error{ErrorCode::SpawnFailed,
                     "Failed to create control pipe: " + std::string(strerror(errno))};
    }
    int execError[2];
    if (::pipe2(execError, O_CLOEXEC) < 0) {
        int err = errno;
        ::close(control[0]);
        ::close(control[1]);
        return Error{ErrorCode::SpawnFailed,
                     "Failed to create exec pipe: " + std::string(strerror(err))};
    }

    // Everything the child needs is built before fork
    const std::string exeStr = exe.string();
    const auto args = worker_arguments(name, spec, control[1]);
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(exeStr.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {control[0], control[1], execError[0], execError[1]})
            ::close(fd);
        return Error{ErrorCode::SpawnFailed, "Failed to fork: " + std::string(strerror(err))};
    }

    if (pid == 0) {
        ::setsid();
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            (void)::dup2(devnull, STDIN_FILENO);
            (void)::dup2(devnull, STDOUT_FILENO);
            (void)::dup2(devnull, STDERR_FILENO);
            if (devnull > 2)
                ::close(devnull);
        }
        // The control write end survives exec; everything else is close-on-exec
        ::fcntl(control[1], F_SETFD, 0);
        ::execv(argv[0], argv.data());

        int err = errno;
        (void)!::write(execError[1], &err, sizeof(err));
        _exit(127);
    }

    ::close(control[1]);
    ::close(execError[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execError[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    ::close(execError[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        ::close(control[0]);
        int status = 0;
        ::waitpid(pid, &status, 0);
        return Error{ErrorCode::SpawnFailed,
                     "Failed to execute " + exeStr + ": " + std::string(strerror(childErrno))};
    }

    spdlog::debug("Launcher: spawned worker for '{}' (pid={})", name, pid);
    return SpawnedWorker{pid, control[0]};
}

Result<std::filesystem::path> Launcher::await_ready(const SpawnedWorker& worker) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + options_.startupTimeout;

    LineFramer framer;
    std::array<char, 4096> buffer;
    for (;;) {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) {
            return Error{ErrorCode::StartupTimeout, "Server startup timeout"};
        }

        pollfd pfd{worker.controlFd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            return Error{ErrorCode::SpawnFailed,
                         "Waiting for worker failed: " + std::string(strerror(errno))};
        }
        if (rc == 0) {
            return Error{ErrorCode::StartupTimeout, "Server startup timeout"};
        }

        ssize_t n = ::read(worker.controlFd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return Error{ErrorCode::SpawnFailed,
                         "Reading from worker failed: " + std::string(strerror(errno))};
        }
        if (n == 0) {
            return Error{ErrorCode::SpawnFailed, "Worker exited before it was ready"};
        }

        auto lines = framer.feed(std::string_view(buffer.data(), static_cast<size_t>(n)));
        if (!lines) {
            return Error{ErrorCode::SpawnFailed, lines.error().message};
        }
        for (const auto& line : lines.value()) {
            if (is_blank_line(line))
                continue;
            auto message = ipc::parse_control_message(line);
            if (!message) {
                spdlog::warn("Launcher: ignoring control line: {}", message.error().message);
                continue;
            }
            if (message.value().type == ipc::ControlMessage::Type::Error) {
                return Error{ErrorCode::SpawnFailed, message.value().message};
            }
            return message.value().socketAddress;
        }
    }
}

void Launcher::kill_and_reap(pid_t pid) {
    if (pid <= 0)
        return;
    // The worker leads its own session; its upstream server shares the process group
    if (::kill(-pid, SIGKILL) != 0) {
        spdlog::debug("Launcher: kill(-{}) failed: {}", pid, strerror(errno));
        if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
            spdlog::warn("Launcher: kill({}) failed: {}", pid, strerror(errno));
        }
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace mcpcmd::daemon
