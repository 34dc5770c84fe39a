#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <mcpcmd/core/types.h>
#include <mcpcmd/daemon/ipc/line_framer.h>
#include <mcpcmd/daemon/ipc/rpc_protocol.h>

#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcpcmd::daemon {

class RequestDispatcher;

/**
 * Line-delimited JSON-RPC server on a Unix domain socket.
 *
 * The acceptor and connection reads run on the caller's io_context; each connection gets its
 * own strand. Requests are dispatched on a separate thread pool so a slow upstream call holds
 * up neither the acceptor, other connections, nor later requests on the same connection.
 * Responses are written in completion order.
 */
class SocketServer {
public:
    struct Config {
        std::filesystem::path socketPath;
        size_t dispatchThreads = 4;
        size_t maxLineBytes = LineFramer::kDefaultMaxLineBytes;
    };

    SocketServer(boost::asio::io_context& io, const Config& config, RequestDispatcher* dispatcher);
    ~SocketServer();

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Binds and listens; the accept loop runs once the io_context does.
    Result<void> start();
    // Stops accepting, closes live connections and removes the socket file.
    Result<void> stop();
    bool isRunning() const { return running_.load(); }

    const std::filesystem::path& socketPath() const noexcept { return actualSocketPath_; }

    size_t activeConnections() const { return activeConnections_->load(); }
    uint64_t totalConnections() const { return totalConnections_.load(); }

private:
    using local = boost::asio::local::stream_protocol;
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    struct Connection {
        explicit Connection(Strand s) : strand(std::move(s)), socket(strand) {}

        Strand strand;
        local::socket socket;
        // Everything below is only touched on `strand`
        std::deque<std::string> writeQueue;
        bool writing{false};
        bool readDone{false};
        size_t inflight{0};

        void close();
    };

    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> handle_connection(std::shared_ptr<Connection> conn);
    // Static: these may still run on a strand after the server is gone
    static boost::asio::awaitable<void> drain_writes(std::shared_ptr<Connection> conn);

    void dispatch_request(std::shared_ptr<Connection> conn, ipc::RpcRequest request);
    static void enqueue_write(const std::shared_ptr<Connection>& conn, std::string frame);
    static void close_if_idle(const std::shared_ptr<Connection>& conn);
    void register_connection(const std::shared_ptr<Connection>& conn);
    void close_acceptor();

    boost::asio::io_context& io_;
    Config config_;
    RequestDispatcher* dispatcher_;

    std::unique_ptr<local::acceptor> acceptor_;
    std::unique_ptr<boost::asio::thread_pool> dispatchPool_;
    std::filesystem::path actualSocketPath_;

    // Shared with connection coroutines, which may be destroyed after the server
    std::shared_ptr<std::atomic<size_t>> activeConnections_ =
        std::make_shared<std::atomic<size_t>>(0);
    std::atomic<uint64_t> totalConnections_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::mutex connectionsMutex_;
    std::vector<std::weak_ptr<Connection>> connections_;
};

} // namespace mcpcmd::daemon
