// One-shot RPC client against scripted worker sockets

#include <catch2/catch_test_macros.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include <chrono>
#include <functional>
#include <set>
#include <thread>

#include <mcpcmd/daemon/client/rpc_client.h>
#include <mcpcmd/daemon/ipc/rpc_protocol.h>
#include "utils/test_helpers.h"

using namespace mcpcmd;
using namespace mcpcmd::daemon;
using namespace std::chrono_literals;
using ipc::json;
using stream_protocol = boost::asio::local::stream_protocol;

namespace {

// Accepts one connection, reads one request line and hands it to `script`.
class ScriptedWorker {
public:
    using Script = std::function<void(stream_protocol::socket&, const json& request)>;

    ScriptedWorker(const std::filesystem::path& path, Script script)
        : acceptor_(io_, stream_protocol::endpoint(path.string())) {
        thread_ = std::thread([this, script = std::move(script)] {
            stream_protocol::socket socket(io_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec)
                return;
            std::string buffer;
            auto n = boost::asio::read_until(socket, boost::asio::dynamic_buffer(buffer), '\n',
                                             ec);
            if (ec)
                return;
            request = json::parse(buffer.substr(0, n - 1));
            script(socket, request);
        });
    }

    ~ScriptedWorker() {
        if (thread_.joinable())
            thread_.join();
    }

    json request;

private:
    boost::asio::io_context io_;
    stream_protocol::acceptor acceptor_;
    std::thread thread_;
};

void send(stream_protocol::socket& socket, std::string_view text) {
    boost::asio::write(socket, boost::asio::buffer(text));
}

} // namespace

TEST_CASE("generate_request_id gives short base-36 ids", "[daemon][client]") {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = generate_request_id();
        CHECK(id.size() == 9);
        CHECK(id.find_first_not_of("0123456789abcdefghijklmnopqrstuvwxyz") == std::string::npos);
        seen.insert(id);
    }
    CHECK(seen.size() == 200);
}

TEST_CASE("RpcClient returns the result for its id", "[daemon][client]") {
    test::TempDir dir("mcpcmd_rpc_");
    auto path = dir / "w.sock";
    ScriptedWorker worker(path, [](stream_protocol::socket& s, const json& req) {
        json response = {{"id", req["id"]}, {"result", {{"tools", json::array()}}}};
        send(s, response.dump() + "\n");
    });

    RpcClient client;
    auto result = client.call(path, ipc::kMethodListTools);
    REQUIRE(result);
    CHECK(result.value()["tools"].is_array());
}

TEST_CASE("RpcClient sends params only when given", "[daemon][client]") {
    test::TempDir dir("mcpcmd_rpc_");
    auto path = dir / "w.sock";
    json seen;
    {
        ScriptedWorker worker(path, [&seen](stream_protocol::socket& s, const json& req) {
            seen = req;
            send(s, json{{"id", req["id"]}, {"result", nullptr}}.dump() + "\n");
        });
        RpcClient client;
        auto result = client.call(path, ipc::kMethodCallTool,
                                  json{{"name", "echo"}, {"arguments", json::object()}});
        REQUIRE(result);
        CHECK(result.value().is_null());
    }
    CHECK(seen["method"] == "callTool");
    CHECK(seen["params"]["name"] == "echo");
    CHECK(seen["id"].is_string());
}

TEST_CASE("RpcClient reassembles a response split across writes", "[daemon][client]") {
    test::TempDir dir("mcpcmd_rpc_");
    auto path = dir / "w.sock";
    ScriptedWorker worker(path, [](stream_protocol::socket& s, const json& req) {
        std::string text = json{{"id", req["id"]}, {"result", {{"value", 42}}}}.dump() + "\n";
        for (char c : text) {
            send(s, std::string_view(&c, 1));
            std::this_thread::sleep_for(1ms);
        }
    });

    RpcClient client;
    auto result = client.call(path, ipc::kMethodListTools);
    REQUIRE(result);
    CHECK(result.value()["value"] == 42);
}

TEST_CASE("RpcClient surfaces the worker's error string", "[daemon][client]") {
    test::TempDir dir("mcpcmd_rpc_");
    auto path = dir / "w.sock";
    ScriptedWorker worker(path, [](stream_protocol::socket& s, const json& req) {
        send(s, json{{"id", req["id"]}, {"error", "Error: MCP error -32602: bad"}}.dump() + "\n");
    });

    RpcClient client;
    auto result = client.call(path, ipc::kMethodListTools);
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::UpstreamDispatchFailed);
    CHECK(result.error().message == "Error: MCP error -32602: bad");
}

TEST_CASE("RpcClient reports a hang-up before any response", "[daemon][client]") {
    test::TempDir dir("mcpcmd_rpc_");
    auto path = dir / "w.sock";
    ScriptedWorker worker(path, [](stream_protocol::socket& s, const json&) {
        boost::system::error_code ec;
        s.close(ec);
    });

    RpcClient client;
    auto result = client.call(path, ipc::kMethodListTools);
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::ConnectionClosedPrematurely);
    CHECK(result.error().message == "Connection closed without response");
}

TEST_CASE("RpcClient cannot connect to a missing socket", "[daemon][client]") {
    test::TempDir dir("mcpcmd_rpc_");
    RpcClient client;
    auto result = client.call(dir / "absent.sock", ipc::kMethodListTools);
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::NetworkError);
}

TEST_CASE("RpcClient gives up after its timeout", "[daemon][client]") {
    test::TempDir dir("mcpcmd_rpc_");
    auto path = dir / "w.sock";
    ScriptedWorker worker(path, [](stream_protocol::socket& s, const json&) {
        // Hold the connection open without answering until the client leaves
        char byte;
        boost::system::error_code ec;
        s.read_some(boost::asio::buffer(&byte, 1), ec);
    });

    RpcClient client(RpcClient::Options{150ms});
    auto start = std::chrono::steady_clock::now();
    auto result = client.call(path, ipc::kMethodListTools);
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::Timeout);
    CHECK(std::chrono::steady_clock::now() - start < 5s);
}
