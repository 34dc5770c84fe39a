#include <catch2/catch_test_macros.hpp>

#include <mcpcmd/config/settings.h>
#include "utils/test_helpers.h"

using namespace mcpcmd;
using mcpcmd::test::ScopedEnvVar;

TEST_CASE("Settings defaults", "[config]") {
    ScopedEnvVar registry("MCPCMD_REGISTRY", std::nullopt);
    ScopedEnvVar startup("MCPCMD_STARTUP_TIMEOUT_MS", std::nullopt);
    ScopedEnvVar rpc("MCPCMD_RPC_TIMEOUT_MS", std::nullopt);
    ScopedEnvVar level("MCPCMD_LOG_LEVEL", std::nullopt);

    auto settings = config::Settings::from_environment();
    REQUIRE(settings);
    CHECK(settings.value().registryPath ==
          std::filesystem::current_path() / config::kRegistryFileName);
    CHECK(settings.value().startupTimeout == std::chrono::seconds(60));
    CHECK(settings.value().rpcTimeout.count() == 0);
    CHECK_FALSE(settings.value().logLevel.has_value());
}

TEST_CASE("Environment overrides", "[config]") {
    ScopedEnvVar registry("MCPCMD_REGISTRY", std::string("/tmp/reg.json"));
    ScopedEnvVar startup("MCPCMD_STARTUP_TIMEOUT_MS", std::string("1500"));
    ScopedEnvVar rpc("MCPCMD_RPC_TIMEOUT_MS", std::string("250"));
    ScopedEnvVar level("MCPCMD_LOG_LEVEL", std::string("DEBUG"));
    ScopedEnvVar worker("MCPCMD_WORKER_BIN", std::string("/opt/mcp-cmd"));

    auto settings = config::Settings::from_environment();
    REQUIRE(settings);
    CHECK(settings.value().registryPath == std::filesystem::path("/tmp/reg.json"));
    CHECK(settings.value().startupTimeout == std::chrono::milliseconds(1500));
    CHECK(settings.value().rpcTimeout == std::chrono::milliseconds(250));
    CHECK(settings.value().logLevel == spdlog::level::debug);
    CHECK(settings.value().workerExecutable == std::filesystem::path("/opt/mcp-cmd"));
}

TEST_CASE("Invalid numbers are rejected", "[config]") {
    ScopedEnvVar startup("MCPCMD_STARTUP_TIMEOUT_MS", std::string("soon"));
    auto settings = config::Settings::from_environment();
    REQUIRE_FALSE(settings);
    CHECK(settings.error().code == ErrorCode::InvalidArgument);

    CHECK_FALSE(config::parse_duration_ms("X", "-5"));
    CHECK_FALSE(config::parse_duration_ms("X", "10ms"));
    CHECK(config::parse_duration_ms("X", "0").value().count() == 0);
}

TEST_CASE("Log levels", "[config]") {
    CHECK(config::parse_log_level("warning").value() == spdlog::level::warn);
    CHECK(config::parse_log_level("off").value() == spdlog::level::off);
    CHECK_FALSE(config::parse_log_level("loud"));
}
