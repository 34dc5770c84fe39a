#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <mcpcmd/core/types.h>
#include <mcpcmd/registry/entry.h>
#include <mcpcmd/upstream/upstream_connection.h>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpcmd::daemon {

class RequestDispatcher;
class SocketServer;

enum class WorkerState { Connecting, Serving, ShuttingDown, Terminated };

const char* to_string(WorkerState state) noexcept;

// Writes all of `line` to the launcher's control pipe. False when the launcher stopped listening.
bool write_control_line(int fd, std::string_view line);

using UpstreamFactory = std::function<Result<std::unique_ptr<upstream::IUpstreamConnection>>(
    const registry::LaunchSpec&, const upstream::ConnectOptions&)>;

struct WorkerOptions {
    std::string name;
    registry::LaunchSpec launchSpec;
    // Write end of the launcher's control pipe; -1 when nobody is waiting for readiness.
    int controlFd{-1};
    // Defaults to the resolved socket address for `name`.
    std::filesystem::path socketPath;
    upstream::ConnectOptions upstreamOptions;
    size_t dispatchThreads{4};
    // Defaults to upstream::connect.
    UpstreamFactory upstreamFactory;
};

/**
 * The background process owning one upstream MCP session.
 *
 * Connecting -> Serving -> ShuttingDown -> Terminated. A failed connect or bind is reported
 * as an error line on the control channel and run() returns 1; after the ready line has been
 * written the worker serves until SIGTERM/SIGINT or requestShutdown(), then returns 0.
 */
class Worker {
public:
    explicit Worker(WorkerOptions options);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Blocks for the worker's whole life. Returns the process exit status.
    int run();

    // Safe from any thread.
    void requestShutdown();

    WorkerState state() const noexcept { return state_.load(); }
    const std::filesystem::path& socketPath() const noexcept { return socketPath_; }

private:
    void transition(WorkerState next);
    void shutdown();
    int fail(std::string_view message);
    void send_control(std::string_view line);
    void close_control();

    WorkerOptions options_;
    std::filesystem::path socketPath_;
    std::atomic<WorkerState> state_{WorkerState::Connecting};

    boost::asio::io_context io_;
    std::shared_ptr<upstream::IUpstreamConnection> upstream_;
    std::unique_ptr<RequestDispatcher> dispatcher_;
    std::unique_ptr<SocketServer> server_;
    std::optional<boost::asio::signal_set> signals_;
};

} // namespace mcpcmd::daemon
