#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <mcpcmd/core/types.h>
#include <mcpcmd/registry/entry.h>

namespace mcpcmd::upstream {

using json = nlohmann::ordered_json;

inline constexpr const char* kProtocolVersion = "2025-06-18";

struct ConnectOptions {
    std::chrono::milliseconds requestTimeout{60'000};
    std::chrono::milliseconds initTimeout{30'000};
    std::string clientName{"mcp-cmd"};
    std::string clientVersion;
};

/**
 * @brief A live MCP client session with one server.
 *
 * Implementations are safe to call from several threads at once; concurrent requests are
 * correlated by JSON-RPC id. Failures carry ErrorCode::UpstreamDispatchFailed with the text
 * "MCP error <code>: <message>" when the server answered with an error object.
 */
class IUpstreamConnection {
public:
    virtual ~IUpstreamConnection() = default;

    // Result of `tools/list`.
    virtual Result<json> list_tools() = 0;

    // Result of `tools/call` with {name, arguments}.
    virtual Result<json> call_tool(std::string_view name, const json& arguments) = 0;

    virtual void close() = 0;
    virtual bool is_open() const noexcept = 0;
};

/**
 * @brief Shared MCP handshake and method mapping over an abstract request channel.
 */
class McpSession : public IUpstreamConnection {
public:
    explicit McpSession(ConnectOptions options) : options_(std::move(options)) {}

    // `initialize` followed by `notifications/initialized`.
    Result<void> initialize();

    Result<json> list_tools() override;
    Result<json> call_tool(std::string_view name, const json& arguments) override;

    const json& server_info() const noexcept { return serverInfo_; }

protected:
    virtual Result<json> request(std::string_view method, json params,
                                 std::chrono::milliseconds timeout) = 0;
    virtual Result<void> notify(std::string_view method, json params) = 0;

    const ConnectOptions& options() const noexcept { return options_; }

private:
    ConnectOptions options_;
    json serverInfo_;
};

// Environment variables a spawned server inherits before the launch spec's overrides apply.
std::map<std::string, std::string> default_environment();

// JSON-RPC error object to Error{UpstreamDispatchFailed, "MCP error <code>: <message>"}.
Error make_mcp_error(const json& errorObject);

// Opens a stdio or HTTP session depending on the launch spec, handshake included.
Result<std::unique_ptr<IUpstreamConnection>> connect(const registry::LaunchSpec& spec,
                                                     const ConnectOptions& options);

} // namespace mcpcmd::upstream
