#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <mcpcmd/core/types.h>

namespace mcpcmd::daemon {

/**
 * One-shot client for a worker socket: connect, send one request line, read until the
 * matching response parses, close.
 *
 * Errors:
 *  - NetworkError: the socket could not be connected or written.
 *  - ConnectionClosedPrematurely: the worker hung up before a complete response.
 *  - UpstreamDispatchFailed: the response carried an error string.
 *  - Timeout: Options::timeout elapsed (only when non-zero).
 */
class RpcClient {
public:
    using json = nlohmann::ordered_json;

    struct Options {
        // Zero waits indefinitely.
        std::chrono::milliseconds timeout{0};
    };

    RpcClient() = default;
    explicit RpcClient(Options options) : options_(options) {}

    Result<json> call(const std::filesystem::path& socketPath, std::string_view method,
                      std::optional<json> params = std::nullopt) const;

    const Options& options() const noexcept { return options_; }

private:
    Options options_;
};

// Nine random base-36 characters.
std::string generate_request_id();

} // namespace mcpcmd::daemon
