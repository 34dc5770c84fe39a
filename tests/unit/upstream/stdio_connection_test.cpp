#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <filesystem>

#include <mcpcmd/upstream/stdio_connection.h>
#include "utils/test_helpers.h"

using namespace mcpcmd;
using namespace mcpcmd::upstream;
using Catch::Matchers::ContainsSubstring;

namespace {

const std::filesystem::path kMockServer =
    std::filesystem::path(MCPCMD_TEST_FIXTURES_DIR) / "mock_mcp_server.py";

ConnectOptions fast_options() {
    ConnectOptions options;
    options.requestTimeout = std::chrono::seconds(10);
    options.initTimeout = std::chrono::seconds(10);
    options.clientVersion = "test";
    return options;
}

registry::LaunchSpec mock_spec(std::map<std::string, std::string> env = {}) {
    return registry::make_launch_spec({"python3", kMockServer.string()}, "/tmp", std::move(env))
        .value();
}

} // namespace

TEST_CASE("Stdio session against the mock server", "[upstream][stdio]") {
    if (!test::python3_available()) {
        SKIP("python3 is not available");
    }

    auto spec = mock_spec({{"MCPCMD_TEST_MARKER", "marked"}});
    auto opened = StdioConnection::open(*spec.local(), spec, fast_options());
    REQUIRE(opened);
    auto& connection = *opened.value();
    CHECK(connection.is_open());
    CHECK(connection.pid() > 0);
    CHECK(connection.server_info()["name"] == "mock-mcp-server");

    SECTION("tools/list") {
        auto tools = connection.list_tools();
        REQUIRE(tools);
        REQUIRE(tools.value()["tools"].is_array());
        CHECK(tools.value()["tools"][0]["name"] == "echo");
    }

    SECTION("tools/call with arguments") {
        auto echoed = connection.call_tool("echo", json{{"text", "hello"}});
        REQUIRE(echoed);
        CHECK(echoed.value()["content"][0]["text"] == "hello");
    }

    SECTION("tool errors keep the session usable") {
        auto failed = connection.call_tool("fail", json::object());
        REQUIRE_FALSE(failed);
        CHECK(failed.error().message == "MCP error -32603: tool failed");
        CHECK(connection.call_tool("echo", json{{"text", "still here"}}));
    }

    SECTION("launch environment and working directory reach the server") {
        auto env = connection.call_tool("env", json{{"key", "MCPCMD_TEST_MARKER"}});
        REQUIRE(env);
        CHECK(env.value()["content"][0]["text"] == "marked");
        auto cwd = connection.call_tool("cwd", json::object());
        REQUIRE(cwd);
        CHECK(std::filesystem::equivalent(
            cwd.value()["content"][0]["text"].get<std::string>(), "/tmp"));
    }

    SECTION("close fails later calls") {
        connection.close();
        CHECK_FALSE(connection.is_open());
        auto after = connection.list_tools();
        REQUIRE_FALSE(after);
        CHECK_THAT(after.error().message, ContainsSubstring("-32000"));
    }
}

TEST_CASE("A command that cannot run fails the handshake", "[upstream][stdio]") {
    auto spec =
        registry::make_launch_spec({"mcpcmd-no-such-command-xyz"}, "/tmp", {}).value();
    auto options = fast_options();
    options.initTimeout = std::chrono::seconds(5);
    auto opened = StdioConnection::open(*spec.local(), spec, options);
    REQUIRE_FALSE(opened);
}

TEST_CASE("A server that exits during the handshake fails it", "[upstream][stdio]") {
    test::TempDir dir;
    auto script = test::write_script(dir / "quits.sh", "read line\nexit 0\n");
    auto spec = registry::make_launch_spec({script.string()}, dir.path(), {}).value();
    auto opened = StdioConnection::open(*spec.local(), spec, fast_options());
    REQUIRE_FALSE(opened);
    CHECK(opened.error().code == ErrorCode::UpstreamDispatchFailed);
}
