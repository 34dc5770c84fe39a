#include <mcpcmd/upstream/upstream_connection.h>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace mcpcmd::upstream {

namespace {

constexpr const char* kInheritedVariables[] = {"HOME", "LOGNAME", "PATH", "SHELL", "TERM", "USER"};

} // namespace

std::map<std::string, std::string> default_environment() {
    std::map<std::string, std::string> env;
    for (const char* key : kInheritedVariables) {
        const char* value = std::getenv(key);
        // Exported shell functions are skipped
        if (value == nullptr || std::string_view(value).starts_with("()"))
            continue;
        env[key] = value;
    }
    return env;
}

Error make_mcp_error(const json& errorObject) {
    if (!errorObject.is_object()) {
        return Error{ErrorCode::UpstreamDispatchFailed, "MCP error: " + errorObject.dump()};
    }
    std::string code = "unknown";
    if (auto it = errorObject.find("code"); it != errorObject.end() && it->is_number()) {
        code = it->dump();
    }
    std::string message;
    if (auto it = errorObject.find("message"); it != errorObject.end() && it->is_string()) {
        message = it->get<std::string>();
    }
    return Error{ErrorCode::UpstreamDispatchFailed, "MCP error " + code + ": " + message};
}

Result<void> McpSession::initialize() {
    json clientInfo = json::object();
    clientInfo["name"] = options_.clientName;
    clientInfo["version"] = options_.clientVersion;

    json params = json::object();
    params["protocolVersion"] = kProtocolVersion;
    params["capabilities"] = json::object();
    params["clientInfo"] = std::move(clientInfo);

    auto result = request("initialize", std::move(params), options_.initTimeout);
    if (!result) {
        return result.error();
    }
    const auto& init = result.value();
    if (!init.is_object() || !init.contains("protocolVersion")) {
        return Error{ErrorCode::UpstreamDispatchFailed,
                     "Server sent an invalid initialize result: " + init.dump()};
    }
    if (auto info = init.find("serverInfo"); info != init.end()) {
        serverInfo_ = *info;
    }
    spdlog::info("McpSession: connected to {} (protocol {})",
                 serverInfo_.is_object() ? serverInfo_.value("name", std::string{"server"})
                                         : std::string{"server"},
                 init["protocolVersion"].dump());

    return notify("notifications/initialized", nullptr);
}

Result<json> McpSession::list_tools() {
    return request("tools/list", json::object(), options_.requestTimeout);
}

Result<json> McpSession::call_tool(std::string_view name, const json& arguments) {
    json params = json::object();
    params["name"] = name;
    params["arguments"] = arguments.is_null() ? json::object() : arguments;
    return request("tools/call", std::move(params), options_.requestTimeout);
}

} // namespace mcpcmd::upstream
