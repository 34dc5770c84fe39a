#pragma once

#include <memory>

#include <mcpcmd/upstream/jsonrpc_client.h>
#include <mcpcmd/upstream/upstream_connection.h>
#include <mcpcmd/upstream/upstream_process.h>

namespace mcpcmd::upstream {

// MCP over the stdin/stdout of a spawned server process.
class StdioConnection final : public McpSession {
public:
    StdioConnection(UpstreamProcessConfig processConfig, ConnectOptions options);
    ~StdioConnection() override;

    // Spawns the process and runs the MCP handshake.
    static Result<std::unique_ptr<StdioConnection>> open(const registry::LocalSpawn& spawn,
                                                         const registry::LaunchSpec& spec,
                                                         const ConnectOptions& options);

    void close() override;
    bool is_open() const noexcept override;

    int64_t pid() const noexcept { return process_ ? process_->pid() : -1; }

protected:
    Result<json> request(std::string_view method, json params,
                         std::chrono::milliseconds timeout) override;
    Result<void> notify(std::string_view method, json params) override;

private:
    // Declared before process_: the process's reader thread calls into it until joined
    JsonRpcClient rpc_;
    std::unique_ptr<UpstreamProcess> process_;
};

} // namespace mcpcmd::upstream
