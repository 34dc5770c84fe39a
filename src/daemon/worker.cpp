#include <mcpcmd/daemon/components/RequestDispatcher.h>
#include <mcpcmd/daemon/components/SocketServer.h>
#include <mcpcmd/daemon/ipc/rpc_protocol.h>
#include <mcpcmd/daemon/ipc/socket_utils.h>
#include <mcpcmd/daemon/worker.h>

#include <spdlog/spdlog.h>
#include <boost/asio/post.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace mcpcmd::daemon {

const char* to_string(WorkerState state) noexcept {
    switch (state) {
        case WorkerState::Connecting:
            return "Connecting";
        case WorkerState::Serving:
            return "Serving";
        case WorkerState::ShuttingDown:
            return "ShuttingDown";
        case WorkerState::Terminated:
            return "Terminated";
    }
    return "Unknown";
}

bool write_control_line(int fd, std::string_view line) {
    std::size_t offset = 0;
    while (offset < line.size()) {
        ssize_t n = ::write(fd, line.data() + offset, line.size() - offset);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        offset += static_cast<std::size_t>(n);
    }
    return true;
}

Worker::Worker(WorkerOptions options) : options_(std::move(options)) {
    socketPath_ = options_.socketPath.empty()
                      ? socket_utils::resolve_socket_path(options_.name)
                      : options_.socketPath;
}

Worker::~Worker() {
    close_control();
}

void Worker::transition(WorkerState next) {
    auto previous = state_.exchange(next);
    spdlog::info("Worker[{}]: {} -> {}", options_.name, to_string(previous), to_string(next));
}

void Worker::send_control(std::string_view line) {
    if (options_.controlFd < 0)
        return;
    if (!write_control_line(options_.controlFd, line)) {
        // The launcher gave up waiting; nothing else to tell
        spdlog::warn("Worker[{}]: control channel write failed: {}", options_.name,
                     std::strerror(errno));
    }
}

void Worker::close_control() {
    if (options_.controlFd >= 0) {
        ::close(options_.controlFd);
        options_.controlFd = -1;
    }
}

int Worker::fail(std::string_view message) {
    spdlog::error("Worker[{}]: {}", options_.name, message);
    send_control(ipc::encode_error_message(message));
    close_control();
    transition(WorkerState::Terminated);
    return 1;
}

int Worker::run() {
    // A client hanging up mid-response must not kill the worker
    std::signal(SIGPIPE, SIG_IGN);
    // Children spawned for the upstream must not hold the control pipe open
    if (options_.controlFd >= 0) {
        ::fcntl(options_.controlFd, F_SETFD, FD_CLOEXEC);
    }

    spdlog::info("Worker[{}]: connecting upstream", options_.name);
    UpstreamFactory factory = options_.upstreamFactory;
    if (!factory) {
        factory = &upstream::connect;
    }
    auto connection = factory(options_.launchSpec, options_.upstreamOptions);
    if (!connection) {
        return fail(connection.error().message);
    }
    upstream_ = std::shared_ptr<upstream::IUpstreamConnection>(std::move(connection).value());
    dispatcher_ = std::make_unique<RequestDispatcher>(upstream_);

    SocketServer::Config config;
    config.socketPath = socketPath_;
    config.dispatchThreads = options_.dispatchThreads;
    server_ = std::make_unique<SocketServer>(io_, config, dispatcher_.get());
    if (auto started = server_->start(); !started) {
        upstream_->close();
        return fail(started.error().message);
    }
    socketPath_ = server_->socketPath();

    signals_.emplace(io_, SIGTERM, SIGINT);
    signals_->async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec)
            return;
        spdlog::info("Worker[{}]: received signal {}", options_.name, signo);
        shutdown();
    });

    transition(WorkerState::Serving);
    send_control(ipc::encode_ready_message(socketPath_));
    close_control();

    int status = 0;
    try {
        io_.run();
    } catch (const std::exception& e) {
        spdlog::error("Worker[{}]: event loop failed: {}", options_.name, e.what());
        shutdown();
        status = 1;
    }

    if (state_.load() != WorkerState::Terminated) {
        transition(WorkerState::Terminated);
    }
    return status;
}

void Worker::requestShutdown() {
    boost::asio::post(io_, [this] { shutdown(); });
}

void Worker::shutdown() {
    auto current = state_.load();
    if (current == WorkerState::ShuttingDown || current == WorkerState::Terminated) {
        return;
    }
    transition(WorkerState::ShuttingDown);

    if (server_) {
        if (auto stopped = server_->stop(); !stopped) {
            spdlog::debug("Worker[{}]: {}", options_.name, stopped.error().message);
        }
    }
    // Fails in-flight upstream calls so dispatch threads can finish
    if (upstream_) {
        upstream_->close();
    }
    if (signals_) {
        boost::system::error_code ec;
        signals_->cancel(ec);
    }
    io_.stop();
}

} // namespace mcpcmd::daemon
