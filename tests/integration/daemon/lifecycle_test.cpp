#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <csignal>
#include <filesystem>
#include <string>

#include <sys/wait.h>

#include <nlohmann/json.hpp>

#include <mcpcmd/registry/registry_store.h>
#include "utils/cli_runner.h"
#include "utils/test_helpers.h"

using namespace mcpcmd;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using mcpcmd::test::run_cli;
using json = nlohmann::ordered_json;

namespace {

const std::string kMockServer =
    (std::filesystem::path(MCPCMD_TEST_FIXTURES_DIR) / "mock_mcp_server.py").string();

// Workers are children of the test process; reap them so they do not linger as zombies.
bool reaped(pid_t pid) {
    int status = 0;
    return ::waitpid(pid, &status, WNOHANG) == pid;
}

} // namespace

TEST_CASE("Full lifecycle against a stdio MCP server", "[integration][lifecycle]") {
    if (!test::python3_available()) {
        SKIP("python3 is not available");
    }

    test::TempDir dir("mcpcmd_it_");
    test::ScopedEnvVar registryEnv("MCPCMD_REGISTRY", (dir / ".mcp-cmd.json").string());
    test::ScopedEnvVar socketEnv("MCPCMD_SOCKET_DIR", dir.path().string());
    test::ScopedEnvVar workerEnv("MCPCMD_WORKER_BIN", std::string(MCPCMD_CLI_PATH));
    test::ScopedEnvVar startupEnv("MCPCMD_STARTUP_TIMEOUT_MS", std::string("20000"));
    test::ScopedEnvVar rpcEnv("MCPCMD_RPC_TIMEOUT_MS", std::string("20000"));
    test::ScopedEnvVar levelEnv("MCPCMD_LOG_LEVEL", std::nullopt);

    auto started =
        run_cli({"start", "--env", "MOCK_FLAG=on", "mock", "python3", kMockServer});
    REQUIRE(started.status == 0);
    CHECK_THAT(started.out, StartsWith("Started server \"mock\" with PID "));

    registry::RegistryStore store(dir / ".mcp-cmd.json");
    auto entries = store.load();
    REQUIRE(entries);
    REQUIRE(entries.value().contains("mock"));
    const auto entry = entries.value().at("mock");
    CHECK(std::filesystem::exists(entry.socketAddress));
    CHECK(entry.socketAddress.parent_path() == dir.path());

    auto ps = run_cli({"ps", "mock"});
    CHECK(ps.status == 0);
    CHECK_THAT(ps.out, StartsWith("mock\n"));
    CHECK_THAT(ps.out, ContainsSubstring("\"command\": \"python3\""));
    CHECK_THAT(ps.out, ContainsSubstring("\"MOCK_FLAG\": \"on\""));

    auto tools = run_cli({"tools", "mock"});
    REQUIRE(tools.status == 0);
    auto toolsDoc = json::parse(tools.out);
    REQUIRE(toolsDoc["tools"].is_array());
    CHECK(toolsDoc["tools"][0]["name"] == "echo");

    auto echoed = run_cli({"call", "mock", "echo", "--text", "hello"});
    REQUIRE(echoed.status == 0);
    CHECK(json::parse(echoed.out)["content"][0]["text"] == "hello");

    auto fromJson = run_cli({"call", "mock", "echo", R"({"text": "from json"})"});
    REQUIRE(fromJson.status == 0);
    CHECK(json::parse(fromJson.out)["content"][0]["text"] == "from json");

    auto env = run_cli({"call", "mock", "env", "--key", "MOCK_FLAG"});
    REQUIRE(env.status == 0);
    CHECK(json::parse(env.out)["content"][0]["text"] == "on");

    auto failed = run_cli({"call", "mock", "fail"});
    CHECK(failed.status == 1);
    CHECK(failed.err == "Operation failed for \"mock\": MCP error -32603: tool failed\n");

    auto again = run_cli({"start", "mock", "python3", kMockServer});
    CHECK(again.status == 1);
    CHECK(again.err == "Server \"mock\" is already running\n");

    auto stopped = run_cli({"stop", "mock"});
    CHECK(stopped.status == 0);
    CHECK(stopped.out == "Stopped server \"mock\"\n");
    CHECK(test::wait_until([&] { return reaped(static_cast<pid_t>(entry.pid)); },
                           std::chrono::seconds(10)));
    CHECK_FALSE(std::filesystem::exists(entry.socketAddress));

    auto after = run_cli({"tools", "mock"});
    CHECK(after.status == 1);
    CHECK(after.err == "Server \"mock\" is not running\n");
    CHECK(run_cli({"ps"}).out == "No servers running\n");
}

TEST_CASE("A worker killed out of band is pruned and its name reused",
          "[integration][lifecycle]") {
    if (!test::python3_available()) {
        SKIP("python3 is not available");
    }

    test::TempDir dir("mcpcmd_it_");
    test::ScopedEnvVar registryEnv("MCPCMD_REGISTRY", (dir / ".mcp-cmd.json").string());
    test::ScopedEnvVar socketEnv("MCPCMD_SOCKET_DIR", dir.path().string());
    test::ScopedEnvVar workerEnv("MCPCMD_WORKER_BIN", std::string(MCPCMD_CLI_PATH));
    test::ScopedEnvVar startupEnv("MCPCMD_STARTUP_TIMEOUT_MS", std::string("20000"));
    test::ScopedEnvVar rpcEnv("MCPCMD_RPC_TIMEOUT_MS", std::string("20000"));
    registry::RegistryStore store(dir / ".mcp-cmd.json");

    REQUIRE(run_cli({"start", "mock", "python3", kMockServer}).status == 0);
    const auto first = store.load().value().at("mock");

    REQUIRE(::kill(static_cast<pid_t>(first.pid), SIGKILL) == 0);
    REQUIRE(test::wait_until([&] { return reaped(static_cast<pid_t>(first.pid)); }));

    auto tools = run_cli({"tools", "mock"});
    CHECK(tools.status == 1);
    CHECK(tools.err == "Server \"mock\" process is no longer running\n");
    CHECK_FALSE(store.load().value().contains("mock"));

    // The dead worker's socket file is still there; a new worker replaces it
    auto restarted = run_cli({"start", "mock", "python3", kMockServer});
    REQUIRE(restarted.status == 0);
    const auto second = store.load().value().at("mock");
    CHECK(second.pid != first.pid);

    auto listed = run_cli({"tools", "mock"});
    CHECK(listed.status == 0);

    CHECK(run_cli({"stop", "mock"}).status == 0);
    CHECK(test::wait_until([&] { return reaped(static_cast<pid_t>(second.pid)); },
                           std::chrono::seconds(10)));
}

TEST_CASE("A server that fails to start leaves no trace", "[integration][lifecycle]") {
    test::TempDir dir("mcpcmd_it_");
    test::ScopedEnvVar registryEnv("MCPCMD_REGISTRY", (dir / ".mcp-cmd.json").string());
    test::ScopedEnvVar socketEnv("MCPCMD_SOCKET_DIR", dir.path().string());
    test::ScopedEnvVar workerEnv("MCPCMD_WORKER_BIN", std::string(MCPCMD_CLI_PATH));
    test::ScopedEnvVar startupEnv("MCPCMD_STARTUP_TIMEOUT_MS", std::string("20000"));

    auto started = run_cli({"start", "broken", "mcpcmd-no-such-command-xyz"});
    CHECK(started.status == 1);
    CHECK_FALSE(started.err.empty());

    auto entries = registry::RegistryStore(dir / ".mcp-cmd.json").load();
    REQUIRE(entries);
    CHECK(entries.value().empty());
    CHECK(run_cli({"ps"}).out == "No servers running\n");
}
