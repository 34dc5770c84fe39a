#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <mcpcmd/core/types.h>

namespace mcpcmd::daemon::ipc {

// Key order inside objects is preserved end to end.
using json = nlohmann::ordered_json;

inline constexpr std::string_view kMethodListTools = "listTools";
inline constexpr std::string_view kMethodCallTool = "callTool";

// {"id": string, "method": "listTools"|"callTool", "params"?: {"name", "arguments"}}
struct RpcRequest {
    json id;
    std::string method;
    std::optional<json> params;
};

// {"id": string, "result"?: any, "error"?: string}
struct RpcResponse {
    json id;
    std::optional<json> result;
    std::optional<std::string> error;

    static RpcResponse success(json id, json result) {
        return RpcResponse{std::move(id), std::move(result), std::nullopt};
    }
    static RpcResponse failure(json id, std::string message) {
        return RpcResponse{std::move(id), std::nullopt, std::move(message)};
    }
};

// Parses one framed line. Anything that is not a JSON object with a string or integer `id`
// and a string `method` is a MalformedMessage.
Result<RpcRequest> parse_request(std::string_view line);

// Serialized forms carry the trailing '\n' frame delimiter.
std::string encode_request(const RpcRequest& request);
std::string encode_response(const RpcResponse& response);

// Attempts to read `text` as one complete response object. Returns std::nullopt while the
// text is not yet a complete JSON value; MalformedMessage when it is complete JSON but not a
// response object.
std::optional<Result<RpcResponse>> try_parse_response(std::string_view text);

// Control channel between launcher and worker: one line per message.
struct ControlMessage {
    enum class Type { Ready, Error };
    Type type{Type::Ready};
    std::filesystem::path socketAddress;
    std::string message;
};

std::string encode_ready_message(const std::filesystem::path& socketAddress);
std::string encode_error_message(std::string_view message);
Result<ControlMessage> parse_control_message(std::string_view line);

} // namespace mcpcmd::daemon::ipc
