#include <mcpcmd/upstream/jsonrpc_client.h>
#include <mcpcmd/upstream/upstream_connection.h>

#include <spdlog/spdlog.h>

#include <vector>

namespace mcpcmd::upstream {

namespace {

constexpr int kConnectionClosed = -32000;
constexpr int kRequestTimeout = -32001;
constexpr int kMethodNotFound = -32601;

Error transport_error(int code, std::string_view message) {
    return Error{ErrorCode::UpstreamDispatchFailed,
                 "MCP error " + std::to_string(code) + ": " + std::string(message)};
}

std::string encode(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

} // namespace

json build_request(int64_t id, std::string_view method, const json& params) {
    json request = json::object();
    request["jsonrpc"] = "2.0";
    request["id"] = id;
    request["method"] = method;
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

json build_notification(std::string_view method, const json& params) {
    json notification = json::object();
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

JsonRpcClient::JsonRpcClient(Writer writer) : writer_(std::move(writer)) {}

Result<json> JsonRpcClient::call(std::string_view method, json params,
                                 std::chrono::milliseconds timeout) {
    const int64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
    auto promise = std::make_shared<Promise>();
    auto future = promise->get_future();
    {
        std::lock_guard lock{mutex_};
        if (closed()) {
            return transport_error(kConnectionClosed, closeReason_);
        }
        pending_.emplace(id, promise);
    }

    spdlog::debug("JsonRpcClient: sending request id={} method='{}'", id, method);
    if (auto written = writer_(encode(build_request(id, method, params))); !written) {
        std::lock_guard lock{mutex_};
        pending_.erase(id);
        return transport_error(kConnectionClosed, written.error().message);
    }

    if (future.wait_for(timeout) == std::future_status::timeout) {
        {
            std::lock_guard lock{mutex_};
            pending_.erase(id);
        }
        spdlog::warn("JsonRpcClient: timeout after {}ms waiting for '{}' (id={})",
                     timeout.count(), method, id);
        json cancel = json::object();
        cancel["requestId"] = id;
        cancel["reason"] = "Request timed out";
        if (auto sent = notify("notifications/cancelled", std::move(cancel)); !sent) {
            spdlog::debug("JsonRpcClient: cancel notification not sent: {}",
                          sent.error().message);
        }
        return transport_error(kRequestTimeout, "Request timed out");
    }
    return future.get();
}

Result<void> JsonRpcClient::notify(std::string_view method, json params) {
    if (closed()) {
        return Error{ErrorCode::IOError, "Connection closed"};
    }
    return writer_(encode(build_notification(method, params)));
}

void JsonRpcClient::on_bytes(std::string_view bytes) {
    std::vector<std::string> lines;
    {
        std::lock_guard lock{mutex_};
        auto fed = framer_.feed(bytes);
        if (!fed) {
            spdlog::error("JsonRpcClient: {}", fed.error().message);
            framer_.reset();
            return;
        }
        lines = std::move(fed).value();
    }

    for (auto& line : lines) {
        if (daemon::is_blank_line(line))
            continue;
        json message = json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            spdlog::warn("JsonRpcClient: ignoring non-JSON output line: {}", line);
            continue;
        }
        handle_message(std::move(message));
    }
}

void JsonRpcClient::handle_message(json message) {
    if (message.contains("method")) {
        if (message.contains("id")) {
            handle_server_request(message);
        } else {
            spdlog::debug("JsonRpcClient: notification '{}'",
                          message["method"].is_string() ? message["method"].get<std::string>()
                                                        : std::string{"?"});
        }
        return;
    }

    auto idIt = message.find("id");
    if (idIt == message.end() || !idIt->is_number_integer()) {
        spdlog::warn("JsonRpcClient: response without a usable id: {}", message.dump());
        return;
    }
    const int64_t id = idIt->get<int64_t>();

    std::shared_ptr<Promise> promise;
    {
        std::lock_guard lock{mutex_};
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            // Late response for a request that already timed out
            spdlog::debug("JsonRpcClient: discarding response for id={}", id);
            return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }

    if (auto err = message.find("error"); err != message.end() && !err->is_null()) {
        promise->set_value(Result<json>(make_mcp_error(*err)));
        return;
    }
    auto result = message.find("result");
    promise->set_value(
        Result<json>(result != message.end() ? std::move(*result) : json(nullptr)));
}

void JsonRpcClient::handle_server_request(const json& message) {
    json reply = json::object();
    reply["jsonrpc"] = "2.0";
    reply["id"] = message["id"];
    const auto method = message["method"].is_string() ? message["method"].get<std::string>()
                                                      : std::string{};
    if (method == "ping") {
        reply["result"] = json::object();
    } else {
        json error = json::object();
        error["code"] = kMethodNotFound;
        error["message"] = "Method not found: " + method;
        reply["error"] = std::move(error);
    }
    if (auto sent = writer_(encode(reply)); !sent) {
        spdlog::warn("JsonRpcClient: failed to answer server request '{}': {}", method,
                     sent.error().message);
    }
}

void JsonRpcClient::on_closed(std::string reason) {
    std::unordered_map<int64_t, std::shared_ptr<Promise>> pending;
    {
        std::lock_guard lock{mutex_};
        if (closed())
            return;
        closeReason_ = std::move(reason);
        closed_.store(true, std::memory_order_release);
        pending.swap(pending_);
    }
    for (auto& [id, promise] : pending) {
        promise->set_value(Result<json>(transport_error(kConnectionClosed, closeReason_)));
    }
}

} // namespace mcpcmd::upstream
