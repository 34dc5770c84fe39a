#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include <mcpcmd/core/types.h>
#include <mcpcmd/daemon/ipc/line_framer.h>

namespace mcpcmd::upstream {

using json = nlohmann::ordered_json;

/**
 * @brief JSON-RPC 2.0 client over a newline-delimited byte stream
 *
 * The transport pushes received bytes with on_bytes() and reports the end of the stream with
 * on_closed(); outgoing frames go through the writer. Any number of threads may call() at
 * once: each waits on its own future, resolved when the response with its id arrives.
 *
 * Requests coming from the server are answered here: `ping` gets an empty result, anything
 * else a -32601 error. Notifications are logged and dropped.
 */
class JsonRpcClient {
public:
    using Writer = std::function<Result<void>(std::string_view)>;

    explicit JsonRpcClient(Writer writer);

    // Sends a request and blocks until its response, the stream's end, or `timeout`.
    Result<json> call(std::string_view method, json params, std::chrono::milliseconds timeout);

    Result<void> notify(std::string_view method, json params = nullptr);

    void on_bytes(std::string_view bytes);
    void on_closed(std::string reason = "Connection closed");

    [[nodiscard]] bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }

    // Resolve one decoded message. Exposed for transports that deliver whole documents.
    void handle_message(json message);

private:
    using Promise = std::promise<Result<json>>;

    void handle_server_request(const json& message);

    Writer writer_;
    std::atomic<int64_t> next_id_{1};
    std::atomic<bool> closed_{false};
    std::string closeReason_;

    std::mutex mutex_; ///< Protects pending_, framer_ and closeReason_
    std::unordered_map<int64_t, std::shared_ptr<Promise>> pending_;
    daemon::LineFramer framer_;
};

json build_request(int64_t id, std::string_view method, const json& params);
json build_notification(std::string_view method, const json& params);

} // namespace mcpcmd::upstream
