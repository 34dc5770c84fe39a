#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <csignal>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include <mcpcmd/cli/mcp_cmd_cli.h>
#include <mcpcmd/registry/registry_store.h>
#include "utils/cli_runner.h"
#include "utils/test_helpers.h"

using namespace mcpcmd;
using mcpcmd::test::run_cli;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

// Temporary registry selected through the environment for the lifetime of the fixture.
class RegistryFixture {
public:
    RegistryFixture()
        : registryEnv_("MCPCMD_REGISTRY", (dir_ / ".mcp-cmd.json").string()),
          socketEnv_("MCPCMD_SOCKET_DIR", dir_.path().string()),
          levelEnv_("MCPCMD_LOG_LEVEL", std::string("off")),
          store_(dir_ / ".mcp-cmd.json") {}

    void seed(const std::string& name, pid_t pid, const std::string& socket = "") {
        auto registry = store_.load().value();
        registry::Entry entry;
        entry.name = name;
        entry.launchSpec =
            registry::make_launch_spec({"python3", "server.py"}, "/work", {{"K", "V"}}).value();
        entry.pid = pid;
        entry.socketAddress =
            socket.empty() ? (dir_ / (name + ".sock")) : std::filesystem::path(socket);
        entry.startedAt = "2026-10-18T09:30:00.000Z";
        registry[name] = entry;
        REQUIRE(store_.save(registry));
    }

    registry::Registry load() { return store_.load().value(); }
    const test::TempDir& dir() const { return dir_; }

private:
    test::TempDir dir_;
    test::ScopedEnvVar registryEnv_;
    test::ScopedEnvVar socketEnv_;
    test::ScopedEnvVar levelEnv_;
    registry::RegistryStore store_;
};

pid_t dead_pid() {
    pid_t pid = ::fork();
    if (pid == 0)
        _exit(0);
    int status = 0;
    ::waitpid(pid, &status, 0);
    return pid;
}

} // namespace

TEST_CASE("A subcommand is required", "[cli]") {
    RegistryFixture fixture;
    auto run = run_cli({});
    CHECK(run.status != 0);
}

TEST_CASE("--version prints the version", "[cli]") {
    RegistryFixture fixture;
    auto run = run_cli({"--version"});
    CHECK(run.status == 0);
    CHECK_FALSE(run.out.empty());
}

TEST_CASE("ps with an empty registry", "[cli][ps]") {
    RegistryFixture fixture;
    auto run = run_cli({"ps"});
    CHECK(run.status == 0);
    CHECK(run.out == "No servers running\n");
}

TEST_CASE("ps lists every server with its record", "[cli][ps]") {
    RegistryFixture fixture;
    fixture.seed("alpha", 101);
    fixture.seed("beta", 202);

    auto run = run_cli({"ps"});
    CHECK(run.status == 0);
    CHECK_THAT(run.out, StartsWith("alpha\n  {\n"));
    CHECK_THAT(run.out, ContainsSubstring("\nbeta\n"));
    CHECK_THAT(run.out, ContainsSubstring("    \"pid\": 202"));
    CHECK_THAT(run.out, ContainsSubstring("\"started\": \"2026-10-18T09:30:00.000Z\""));
    // Blank line after each server
    CHECK_THAT(run.out, ContainsSubstring("  }\n\nbeta"));
}

TEST_CASE("ps for one server", "[cli][ps]") {
    RegistryFixture fixture;
    fixture.seed("alpha", 101);
    fixture.seed("beta", 202);

    auto run = run_cli({"ps", "beta"});
    CHECK(run.status == 0);
    CHECK_THAT(run.out, StartsWith("beta\n"));
    CHECK_FALSE(run.out.find("alpha") != std::string::npos);

    auto missing = run_cli({"ps", "gamma"});
    CHECK(missing.status == 1);
    CHECK(missing.err == "Server \"gamma\" is not running\n");
}

TEST_CASE("Commands on an unknown server fail", "[cli]") {
    RegistryFixture fixture;
    for (const char* command : {"stop", "tools"}) {
        auto run = run_cli({command, "ghost"});
        CHECK(run.status == 1);
        CHECK(run.err == "Server \"ghost\" is not running\n");
    }
    auto call = run_cli({"call", "ghost", "echo"});
    CHECK(call.status == 1);
    CHECK(call.err == "Server \"ghost\" is not running\n");
}

TEST_CASE("A dead worker is pruned by the first command to find it", "[cli]") {
    RegistryFixture fixture;
    fixture.seed("stale", dead_pid());

    auto run = run_cli({"tools", "stale"});
    CHECK(run.status == 1);
    CHECK(run.err == "Server \"stale\" process is no longer running\n");
    CHECK_FALSE(fixture.load().contains("stale"));
}

TEST_CASE("RPC failures name the server", "[cli]") {
    RegistryFixture fixture;
    // Live pid, but nothing listens on the socket
    fixture.seed("mute", ::getpid());

    auto run = run_cli({"tools", "mute"});
    CHECK(run.status == 1);
    CHECK_THAT(run.err, StartsWith("Operation failed for \"mute\": "));
    CHECK(fixture.load().contains("mute"));
}

TEST_CASE("call rejects positional input that is not a JSON object", "[cli][call]") {
    RegistryFixture fixture;
    fixture.seed("srv", ::getpid());
    auto run = run_cli({"call", "srv", "echo", "[1,2]"});
    CHECK(run.status == 1);
    CHECK_THAT(run.err, ContainsSubstring("JSON object"));
}

TEST_CASE("stop terminates the worker and forgets it", "[cli][stop]") {
    RegistryFixture fixture;
    pid_t child = ::fork();
    if (child == 0) {
        ::signal(SIGTERM, SIG_DFL);
        for (;;)
            ::pause();
    }
    auto socket = fixture.dir() / "srv.sock";
    test::write_file(socket, "");
    fixture.seed("srv", child, socket.string());

    auto run = run_cli({"stop", "srv"});
    CHECK(run.status == 0);
    CHECK(run.out == "Stopped server \"srv\"\n");
    CHECK_FALSE(fixture.load().contains("srv"));
    CHECK_FALSE(std::filesystem::exists(socket));

    int status = 0;
    REQUIRE(::waitpid(child, &status, 0) == child);
    CHECK(WIFSIGNALED(status));
    CHECK(WTERMSIG(status) == SIGTERM);
}

TEST_CASE("stop on a vanished worker still forgets it", "[cli][stop]") {
    RegistryFixture fixture;
    fixture.seed("gone", dead_pid());

    auto run = run_cli({"stop", "gone"});
    CHECK(run.status == 0);
    CHECK(run.out == "Server \"gone\" was already stopped\n");
    CHECK_FALSE(fixture.load().contains("gone"));
}

TEST_CASE("start needs a command or URL", "[cli][start]") {
    RegistryFixture fixture;
    auto run = run_cli({"start", "lonely"});
    CHECK(run.status == 1);
    CHECK(run.err == "Missing server command or URL for \"lonely\"\n");
    CHECK(fixture.load().empty());
}

TEST_CASE("start refuses a name already in use", "[cli][start]") {
    RegistryFixture fixture;
    fixture.seed("dup", ::getpid());
    auto run = run_cli({"start", "dup", "python3", "server.py"});
    CHECK(run.status == 1);
    CHECK(run.err == "Server \"dup\" is already running\n");
}
