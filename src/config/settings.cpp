#include <mcpcmd/config/settings.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>

#include <unistd.h>

namespace mcpcmd::config {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> env_value(const char* key) {
    if (const char* raw = std::getenv(key)) {
        if (*raw)
            return std::string(raw);
    }
    return std::nullopt;
}

} // namespace

Result<spdlog::level::level_enum> parse_log_level(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")
        return spdlog::level::trace;
    if (lower == "debug")
        return spdlog::level::debug;
    if (lower == "info")
        return spdlog::level::info;
    if (lower == "warn" || lower == "warning")
        return spdlog::level::warn;
    if (lower == "error" || lower == "err")
        return spdlog::level::err;
    if (lower == "critical")
        return spdlog::level::critical;
    if (lower == "off")
        return spdlog::level::off;
    return Error{ErrorCode::InvalidArgument, "Unknown log level: " + std::string(value)};
}

Result<std::chrono::milliseconds> parse_duration_ms(std::string_view key, std::string_view value) {
    long long parsed = 0;
    const auto* begin = value.data();
    const auto* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed < 0) {
        return Error{ErrorCode::InvalidArgument, std::string(key) +
                                                     " must be a non-negative integer number of "
                                                     "milliseconds, got '" +
                                                     std::string(value) + "'"};
    }
    return std::chrono::milliseconds{parsed};
}

fs::path current_executable() {
    char buf[4096];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0)
        return {};
    buf[n] = '\0';
    return fs::path(buf);
}

Result<Settings> Settings::from_environment() {
    Settings settings;

    if (auto registry = env_value("MCPCMD_REGISTRY")) {
        settings.registryPath = fs::path(*registry);
    } else {
        std::error_code ec;
        auto cwd = fs::current_path(ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Unable to determine working directory: " + ec.message()};
        }
        settings.registryPath = cwd / kRegistryFileName;
    }

    if (auto dir = env_value("MCPCMD_SOCKET_DIR"))
        settings.socketDir = fs::path(*dir);

    if (auto raw = env_value("MCPCMD_STARTUP_TIMEOUT_MS")) {
        auto parsed = parse_duration_ms("MCPCMD_STARTUP_TIMEOUT_MS", *raw);
        if (!parsed)
            return parsed.error();
        settings.startupTimeout = parsed.value();
    }

    if (auto raw = env_value("MCPCMD_RPC_TIMEOUT_MS")) {
        auto parsed = parse_duration_ms("MCPCMD_RPC_TIMEOUT_MS", *raw);
        if (!parsed)
            return parsed.error();
        settings.rpcTimeout = parsed.value();
    }

    if (auto raw = env_value("MCPCMD_UPSTREAM_TIMEOUT_MS")) {
        auto parsed = parse_duration_ms("MCPCMD_UPSTREAM_TIMEOUT_MS", *raw);
        if (!parsed)
            return parsed.error();
        settings.upstreamTimeout = parsed.value();
    }

    if (auto raw = env_value("MCPCMD_LOG_LEVEL")) {
        auto level = parse_log_level(*raw);
        if (!level)
            return level.error();
        settings.logLevel = level.value();
    }

    if (auto bin = env_value("MCPCMD_WORKER_BIN"))
        settings.workerExecutable = fs::path(*bin);

    return settings;
}

} // namespace mcpcmd::config
