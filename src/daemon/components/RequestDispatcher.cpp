#include <mcpcmd/daemon/components/RequestDispatcher.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace mcpcmd::daemon {

ipc::RpcResponse RequestDispatcher::dispatch(const ipc::RpcRequest& request) const {
    Result<ipc::json> result = Error{ErrorCode::InternalError, "unhandled"};
    try {
        if (request.method == ipc::kMethodListTools) {
            result = handle_list_tools();
        } else if (request.method == ipc::kMethodCallTool) {
            result = handle_call_tool(request.params);
        } else {
            result = Error{ErrorCode::InvalidArgument, "Unknown method: " + request.method};
        }
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, e.what()};
    }

    if (!result) {
        spdlog::warn("RequestDispatcher: {} (id={}) failed: {}", request.method,
                     request.id.dump(), result.error().message);
        return ipc::RpcResponse::failure(request.id, result.error().message);
    }
    return ipc::RpcResponse::success(request.id, std::move(result).value());
}

Result<ipc::json> RequestDispatcher::handle_list_tools() const {
    if (!upstream_) {
        return Error{ErrorCode::UpstreamDispatchFailed, "Upstream connection not available"};
    }
    return upstream_->list_tools();
}

Result<ipc::json>
RequestDispatcher::handle_call_tool(const std::optional<ipc::json>& params) const {
    if (!params || !params->is_object()) {
        return Error{ErrorCode::InvalidArgument, "callTool requires params {name, arguments}"};
    }
    auto name = params->find("name");
    if (name == params->end() || !name->is_string() || name->get<std::string>().empty()) {
        return Error{ErrorCode::InvalidArgument, "callTool params.name must be a string"};
    }

    ipc::json arguments = ipc::json::object();
    if (auto args = params->find("arguments"); args != params->end() && !args->is_null()) {
        if (!args->is_object()) {
            return Error{ErrorCode::InvalidArgument, "callTool params.arguments must be an object"};
        }
        arguments = *args;
    }

    if (!upstream_) {
        return Error{ErrorCode::UpstreamDispatchFailed, "Upstream connection not available"};
    }
    spdlog::debug("RequestDispatcher: callTool {}", name->get<std::string>());
    return upstream_->call_tool(name->get<std::string>(), arguments);
}

} // namespace mcpcmd::daemon
