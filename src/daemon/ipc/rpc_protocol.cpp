#include <mcpcmd/daemon/ipc/rpc_protocol.h>

namespace mcpcmd::daemon::ipc {

namespace {

bool valid_id(const json& id) {
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

} // namespace

Result<RpcRequest> parse_request(std::string_view line) {
    json doc = json::parse(line.begin(), line.end(), nullptr, false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::MalformedMessage, "Request is not valid JSON"};
    }
    if (!doc.is_object()) {
        return Error{ErrorCode::MalformedMessage, "Request must be a JSON object"};
    }

    auto id_it = doc.find("id");
    if (id_it == doc.end() || !valid_id(*id_it)) {
        return Error{ErrorCode::MalformedMessage, "Request id must be a string or integer"};
    }

    auto method_it = doc.find("method");
    if (method_it == doc.end() || !method_it->is_string()) {
        return Error{ErrorCode::MalformedMessage, "Request method must be a string"};
    }

    RpcRequest request{*id_it, method_it->get<std::string>(), std::nullopt};
    auto params_it = doc.find("params");
    if (params_it != doc.end() && !params_it->is_null()) {
        request.params = std::move(*params_it);
    }
    return request;
}

std::string encode_request(const RpcRequest& request) {
    json doc = json::object();
    doc["id"] = request.id;
    doc["method"] = request.method;
    if (request.params) {
        doc["params"] = *request.params;
    }
    return doc.dump() + '\n';
}

std::string encode_response(const RpcResponse& response) {
    json doc = json::object();
    doc["id"] = response.id;
    if (response.result) {
        doc["result"] = *response.result;
    }
    if (response.error) {
        doc["error"] = *response.error;
    }
    // Replace invalid UTF-8 from upstream rather than failing the whole response
    return doc.dump(-1, ' ', false, json::error_handler_t::replace) + '\n';
}

std::optional<Result<RpcResponse>> try_parse_response(std::string_view text) {
    json doc = json::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded()) {
        return std::nullopt;
    }
    if (!doc.is_object() || !doc.contains("id")) {
        return Result<RpcResponse>(
            Error{ErrorCode::MalformedMessage, "Response must be a JSON object with an id"});
    }

    RpcResponse response{doc["id"], std::nullopt, std::nullopt};
    if (auto it = doc.find("result"); it != doc.end()) {
        response.result = std::move(*it);
    }
    if (auto it = doc.find("error"); it != doc.end() && !it->is_null()) {
        if (it->is_string()) {
            response.error = it->get<std::string>();
        } else if (it->is_object() && it->contains("message") && (*it)["message"].is_string()) {
            response.error = (*it)["message"].get<std::string>();
        } else {
            response.error = it->dump();
        }
    }
    return Result<RpcResponse>(std::move(response));
}

std::string encode_ready_message(const std::filesystem::path& socketAddress) {
    json doc = json::object();
    doc["type"] = "ready";
    doc["socketAddress"] = socketAddress.string();
    return doc.dump() + '\n';
}

std::string encode_error_message(std::string_view message) {
    json doc = json::object();
    doc["type"] = "error";
    doc["message"] = std::string(message);
    return doc.dump(-1, ' ', false, json::error_handler_t::replace) + '\n';
}

Result<ControlMessage> parse_control_message(std::string_view line) {
    json doc = json::parse(line.begin(), line.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::MalformedMessage, "Control message is not a JSON object"};
    }
    auto typeIt = doc.find("type");
    const std::string type =
        typeIt != doc.end() && typeIt->is_string() ? typeIt->get<std::string>() : std::string{};
    if (type == "ready") {
        auto it = doc.find("socketAddress");
        if (it == doc.end() || !it->is_string() || it->get<std::string>().empty()) {
            return Error{ErrorCode::MalformedMessage, "Ready message is missing socketAddress"};
        }
        return ControlMessage{ControlMessage::Type::Ready,
                              std::filesystem::path(it->get<std::string>()), {}};
    }
    if (type == "error") {
        auto message = doc.find("message");
        return ControlMessage{ControlMessage::Type::Error, {},
                              message != doc.end() && message->is_string()
                                  ? message->get<std::string>()
                                  : std::string{"worker failed to start"}};
    }
    return Error{ErrorCode::MalformedMessage, "Unknown control message type: " + type};
}

} // namespace mcpcmd::daemon::ipc
