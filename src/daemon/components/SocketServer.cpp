#include <mcpcmd/daemon/components/RequestDispatcher.h>
#include <mcpcmd/daemon/components/SocketServer.h>
#include <mcpcmd/daemon/ipc/socket_utils.h>

#include <spdlog/spdlog.h>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <array>
#include <future>

namespace mcpcmd::daemon {

using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

namespace {

using stream_protocol = boost::asio::local::stream_protocol;

// A path that still accepts connections belongs to a live worker; anything else is stale.
Result<void> clear_stale_socket(const std::filesystem::path& path) {
    boost::asio::io_context probeIo;
    stream_protocol::socket probe(probeIo);
    boost::system::error_code ec;
    probe.connect(stream_protocol::endpoint(path.string()), ec);
    if (!ec) {
        probe.close(ec);
        return Error{ErrorCode::AlreadyRunning,
                     "Socket " + path.string() + " is in use by a live worker"};
    }
    if (ec != boost::asio::error::connection_refused &&
        ec != boost::system::errc::no_such_file_or_directory) {
        return Error{ErrorCode::IOError,
                     "Cannot check existing socket " + path.string() + ": " + ec.message()};
    }

    std::error_code removeEc;
    std::filesystem::remove(path, removeEc);
    if (removeEc && removeEc != std::errc::no_such_file_or_directory) {
        spdlog::warn("SocketServer: failed to remove stale socket: {}", removeEc.message());
    }
    return {};
}

} // namespace

void SocketServer::Connection::close() {
    boost::system::error_code ec;
    if (socket.is_open()) {
        socket.shutdown(local::socket::shutdown_both, ec);
        socket.close(ec);
    }
    writeQueue.clear();
}

SocketServer::SocketServer(boost::asio::io_context& io, const Config& config,
                           RequestDispatcher* dispatcher)
    : io_(io), config_(config), dispatcher_(dispatcher) {}

SocketServer::~SocketServer() {
    if (running_.load()) {
        (void)stop();
    }
    // In-flight dispatches finish (or fail once upstream is closed) before the pool goes away
    if (dispatchPool_) {
        dispatchPool_->join();
    }
}

Result<void> SocketServer::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Socket server already running"};
    }
    stopping_.store(false, std::memory_order_relaxed);

    try {
        std::filesystem::path sockPath = config_.socketPath;
        if (!sockPath.is_absolute()) {
            sockPath = std::filesystem::absolute(sockPath);
        }

        const auto maxLen = socket_utils::max_socket_path_length();
        if (sockPath.native().size() > maxLen) {
            running_ = false;
            return Error{ErrorCode::InvalidArgument,
                         "Socket path too long for AF_UNIX (" +
                             std::to_string(sockPath.native().size()) + "/" +
                             std::to_string(maxLen) + "): '" + sockPath.string() + "'"};
        }

        if (auto cleared = clear_stale_socket(sockPath); !cleared) {
            running_ = false;
            return cleared.error();
        }

        auto parent = sockPath.parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }

        if (config_.dispatchThreads == 0) {
            config_.dispatchThreads = 1;
            spdlog::warn("SocketServer: dispatchThreads was 0; coercing to 1");
        }

        acceptor_ = std::make_unique<local::acceptor>(io_);
        local::endpoint endpoint(sockPath.string());
        acceptor_->open(endpoint.protocol());
        acceptor_->bind(endpoint);
        acceptor_->listen(boost::asio::socket_base::max_listen_connections);

        std::filesystem::permissions(sockPath, std::filesystem::perms::owner_read |
                                                   std::filesystem::perms::owner_write |
                                                   std::filesystem::perms::group_read |
                                                   std::filesystem::perms::group_write);
        actualSocketPath_ = sockPath;

        dispatchPool_ = std::make_unique<boost::asio::thread_pool>(config_.dispatchThreads);

        co_spawn(
            io_,
            [this]() -> awaitable<void> {
                co_await accept_loop();
                co_return;
            },
            detached);

        spdlog::info("SocketServer: listening on {} ({} dispatch threads)", sockPath.string(),
                     config_.dispatchThreads);
        return {};
    } catch (const std::exception& e) {
        running_ = false;
        acceptor_.reset();
        spdlog::error("SocketServer::start exception: {}", e.what());
        return Error{ErrorCode::IOError, std::string("Failed to start socket server: ") + e.what()};
    }
}

Result<void> SocketServer::stop() {
    if (!running_.exchange(false)) {
        return Error{ErrorCode::InvalidState, "Socket server not running"};
    }
    spdlog::info("SocketServer: stopping");
    stopping_.store(true, std::memory_order_relaxed);

    // Acceptor lives on the io_context; close it there unless we already are
    if (io_.get_executor().running_in_this_thread() || io_.stopped()) {
        close_acceptor();
    } else {
        auto done = std::make_shared<std::promise<void>>();
        auto closed = done->get_future();
        boost::asio::post(io_, [this, done] {
            close_acceptor();
            done->set_value();
        });
        closed.wait();
    }

    std::vector<std::shared_ptr<Connection>> live;
    {
        std::lock_guard<std::mutex> lk(connectionsMutex_);
        for (auto& weak : connections_) {
            if (auto conn = weak.lock())
                live.push_back(std::move(conn));
        }
        connections_.clear();
    }
    for (auto& conn : live) {
        boost::asio::post(conn->strand, [conn] { conn->close(); });
    }
    spdlog::info("SocketServer: closing {} active connection(s)", live.size());

    // Unstarted dispatches are abandoned
    if (dispatchPool_) {
        dispatchPool_->stop();
    }

    if (!actualSocketPath_.empty()) {
        std::error_code ec;
        std::filesystem::remove(actualSocketPath_, ec);
        if (ec) {
            spdlog::debug("SocketServer: socket removal failed: {}", ec.message());
        }
    }

    spdlog::info("SocketServer: stopped (total_conn={})", totalConnections_.load());
    return {};
}

void SocketServer::close_acceptor() {
    if (acceptor_ && acceptor_->is_open()) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }
}

awaitable<void> SocketServer::accept_loop() {
    spdlog::debug("SocketServer: accept loop started");

    while (running_ && !stopping_) {
        auto conn = std::make_shared<Connection>(boost::asio::make_strand(io_));
        auto [ec] = co_await acceptor_->async_accept(conn->socket,
                                                     boost::asio::as_tuple(use_awaitable));
        if (ec) {
            if (!running_ || stopping_ || ec == boost::asio::error::operation_aborted) {
                break;
            }
            spdlog::warn("SocketServer: accept error: {} ({})", ec.message(), ec.value());
            continue;
        }

        auto current = activeConnections_->fetch_add(1) + 1;
        totalConnections_.fetch_add(1);
        spdlog::debug("SocketServer: accepted connection, active={} total={}", current,
                      totalConnections_.load());

        register_connection(conn);
        co_spawn(conn->strand, handle_connection(conn), detached);
    }

    spdlog::debug("SocketServer: accept loop ended");
}

awaitable<void> SocketServer::handle_connection(std::shared_ptr<Connection> conn) {
    struct CleanupGuard {
        std::shared_ptr<std::atomic<size_t>> active;
        ~CleanupGuard() {
            auto current = active->fetch_sub(1) - 1;
            spdlog::debug("SocketServer: connection closed, active={}", current);
        }
    } guard{activeConnections_};

    LineFramer framer(config_.maxLineBytes);
    std::array<char, 8192> buffer;
    bool malformed = false;

    while (!malformed) {
        auto [ec, n] = co_await conn->socket.async_read_some(
            boost::asio::buffer(buffer), boost::asio::as_tuple(use_awaitable));
        if (ec) {
            if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted &&
                ec != boost::asio::error::bad_descriptor) {
                spdlog::debug("SocketServer: read error: {}", ec.message());
            }
            break;
        }

        auto lines = framer.feed(std::string_view(buffer.data(), n));
        if (!lines) {
            spdlog::warn("SocketServer: closing connection: {}", lines.error().message);
            malformed = true;
            break;
        }

        for (auto& line : lines.value()) {
            if (is_blank_line(line))
                continue;
            auto request = ipc::parse_request(line);
            if (!request) {
                spdlog::warn("SocketServer: closing connection after malformed request: {}",
                             request.error().message);
                malformed = true;
                break;
            }
            dispatch_request(conn, std::move(request).value());
        }
    }

    if (malformed) {
        conn->close();
        co_return;
    }
    conn->readDone = true;
    close_if_idle(conn);
}

void SocketServer::dispatch_request(std::shared_ptr<Connection> conn, ipc::RpcRequest request) {
    ++conn->inflight;
    boost::asio::post(*dispatchPool_, [this, conn = std::move(conn),
                                       request = std::move(request)]() mutable {
        auto response = dispatcher_
                            ? dispatcher_->dispatch(request)
                            : ipc::RpcResponse::failure(request.id, "No dispatcher configured");
        auto frame = ipc::encode_response(response);
        auto strand = conn->strand;
        boost::asio::post(strand, [conn = std::move(conn),
                                   frame = std::move(frame)]() mutable {
            --conn->inflight;
            enqueue_write(conn, std::move(frame));
        });
    });
}

void SocketServer::enqueue_write(const std::shared_ptr<Connection>& conn, std::string frame) {
    if (!conn->socket.is_open()) {
        close_if_idle(conn);
        return;
    }
    conn->writeQueue.push_back(std::move(frame));
    if (!conn->writing) {
        conn->writing = true;
        co_spawn(conn->strand, drain_writes(conn), detached);
    }
}

awaitable<void> SocketServer::drain_writes(std::shared_ptr<Connection> conn) {
    while (!conn->writeQueue.empty()) {
        const std::string& frame = conn->writeQueue.front();
        auto [ec, n] = co_await boost::asio::async_write(conn->socket, boost::asio::buffer(frame),
                                                         boost::asio::as_tuple(use_awaitable));
        if (ec) {
            spdlog::debug("SocketServer: write failed: {}", ec.message());
            conn->close();
            break;
        }
        conn->writeQueue.pop_front();
    }
    conn->writing = false;
    close_if_idle(conn);
}

void SocketServer::close_if_idle(const std::shared_ptr<Connection>& conn) {
    // The peer stopped sending; close once every answer it is owed has been written
    if (conn->readDone && conn->inflight == 0 && !conn->writing) {
        conn->close();
    }
}

void SocketServer::register_connection(const std::shared_ptr<Connection>& conn) {
    std::lock_guard<std::mutex> lk(connectionsMutex_);
    connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                      [](const auto& weak) { return weak.expired(); }),
                       connections_.end());
    connections_.push_back(conn);
}

} // namespace mcpcmd::daemon
