#pragma once

#include <memory>

#include <mcpcmd/core/types.h>
#include <mcpcmd/daemon/ipc/rpc_protocol.h>
#include <mcpcmd/upstream/upstream_connection.h>

namespace mcpcmd::daemon {

/**
 * Maps local RPC requests onto the upstream MCP session.
 *
 * `listTools` -> tools/list, `callTool` -> tools/call. Every failure, including an unknown
 * method or bad params, becomes an error response; dispatch() never throws and never closes
 * anything.
 */
class RequestDispatcher {
public:
    explicit RequestDispatcher(std::shared_ptr<upstream::IUpstreamConnection> upstream)
        : upstream_(std::move(upstream)) {}

    ipc::RpcResponse dispatch(const ipc::RpcRequest& request) const;

private:
    Result<ipc::json> handle_list_tools() const;
    Result<ipc::json> handle_call_tool(const std::optional<ipc::json>& params) const;

    std::shared_ptr<upstream::IUpstreamConnection> upstream_;
};

} // namespace mcpcmd::daemon
