#include <mcpcmd/daemon/client/rpc_client.h>
#include <mcpcmd/daemon/ipc/rpc_protocol.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <random>

namespace mcpcmd::daemon {

using boost::asio::as_tuple;
using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::use_awaitable;
using namespace boost::asio::experimental::awaitable_operators;
using stream_protocol = boost::asio::local::stream_protocol;

namespace {

// Reads until a complete response for `id` parses or the peer hangs up. Always fills `outcome`.
awaitable<void> exchange(stream_protocol::socket& socket, const std::string& frame,
                         const std::string& id, std::optional<Result<ipc::json>>& outcome) {
    auto [wec, written] = co_await boost::asio::async_write(socket, boost::asio::buffer(frame),
                                                            as_tuple(use_awaitable));
    if (wec || written != frame.size()) {
        outcome.emplace(Error{ErrorCode::NetworkError, "Write failed: " + wec.message()});
        co_return;
    }

    std::string received;
    std::array<char, 8192> buffer;
    for (;;) {
        auto [ec, n] = co_await socket.async_read_some(boost::asio::buffer(buffer),
                                                       as_tuple(use_awaitable));
        if (n > 0) {
            received.append(buffer.data(), n);
            auto parsed = ipc::try_parse_response(received);
            if (parsed) {
                if (!*parsed) {
                    outcome.emplace(parsed->error());
                    co_return;
                }
                auto& response = parsed->value();
                if (response.id.is_string() && response.id.get<std::string>() == id) {
                    if (response.error) {
                        outcome.emplace(Error{ErrorCode::UpstreamDispatchFailed, *response.error});
                    } else {
                        outcome.emplace(response.result.value_or(ipc::json()));
                    }
                    co_return;
                }
                // A stray response for someone else; keep reading after it
                spdlog::debug("RpcClient: ignoring response with unexpected id {}",
                              response.id.dump());
                received.clear();
            }
        }
        if (ec) {
            if (ec != boost::asio::error::eof) {
                spdlog::debug("RpcClient: read ended: {}", ec.message());
            }
            outcome.emplace(Error{ErrorCode::ConnectionClosedPrematurely,
                                  "Connection closed without response"});
            co_return;
        }
    }
}

awaitable<void> run_call(const std::filesystem::path& socketPath, std::string frame,
                         std::string id, std::chrono::milliseconds timeout,
                         std::optional<Result<ipc::json>>& outcome) {
    auto executor = co_await boost::asio::this_coro::executor;
    stream_protocol::socket socket(executor);
    stream_protocol::endpoint endpoint(socketPath.string());

    auto [cec] = co_await socket.async_connect(endpoint, as_tuple(use_awaitable));
    if (cec) {
        outcome.emplace(Error{ErrorCode::NetworkError, "Failed to connect to " +
                                                           socketPath.string() + ": " +
                                                           cec.message()});
        co_return;
    }

    if (timeout.count() <= 0) {
        co_await exchange(socket, frame, id, outcome);
    } else {
        boost::asio::steady_timer timer(executor);
        timer.expires_after(timeout);
        auto which = co_await (exchange(socket, frame, id, outcome) ||
                               timer.async_wait(use_awaitable));
        if (which.index() == 1) {
            outcome.emplace(Error{ErrorCode::Timeout, "No response within " +
                                                          std::to_string(timeout.count()) +
                                                          "ms"});
        }
    }

    boost::system::error_code ignored;
    socket.shutdown(stream_protocol::socket::shutdown_both, ignored);
    socket.close(ignored);
}

} // namespace

std::string generate_request_id() {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 35);
    std::string id(9, '0');
    for (auto& c : id) {
        c = kAlphabet[pick(rng)];
    }
    return id;
}

Result<RpcClient::json> RpcClient::call(const std::filesystem::path& socketPath,
                                        std::string_view method,
                                        std::optional<json> params) const {
    ipc::RpcRequest request;
    const std::string id = generate_request_id();
    request.id = id;
    request.method = std::string(method);
    request.params = std::move(params);
    std::string frame = ipc::encode_request(request);

    spdlog::debug("RpcClient: {} -> {} (id={})", method, socketPath.string(), id);

    boost::asio::io_context io;
    std::optional<Result<json>> outcome;
    std::exception_ptr failure;
    co_spawn(io, run_call(socketPath, std::move(frame), id, options_.timeout, outcome),
             [&failure](std::exception_ptr ep) { failure = ep; });
    io.run();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            return Error{ErrorCode::InternalError, e.what()};
        }
    }
    if (!outcome) {
        return Error{ErrorCode::InternalError, "RPC call finished without an outcome"};
    }
    return std::move(*outcome);
}

} // namespace mcpcmd::daemon
