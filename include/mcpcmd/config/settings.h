#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

#include <mcpcmd/core/types.h>

namespace mcpcmd::config {

inline constexpr const char* kRegistryFileName = ".mcp-cmd.json";

// Runtime settings shared by the CLI and the background worker.
// Resolution order: CLI flag > MCPCMD_* environment variable > built-in default.
struct Settings {
    std::filesystem::path registryPath;
    std::filesystem::path socketDir;
    std::chrono::milliseconds startupTimeout{60'000};
    // Zero means the RPC client waits indefinitely for a response.
    std::chrono::milliseconds rpcTimeout{0};
    std::chrono::milliseconds upstreamTimeout{60'000};
    std::optional<spdlog::level::level_enum> logLevel;
    std::filesystem::path workerExecutable;

    static Result<Settings> from_environment();
};

Result<spdlog::level::level_enum> parse_log_level(std::string_view value);

Result<std::chrono::milliseconds> parse_duration_ms(std::string_view key, std::string_view value);

// Path of the running executable (/proc/self/exe), empty when it cannot be read.
std::filesystem::path current_executable();

} // namespace mcpcmd::config
