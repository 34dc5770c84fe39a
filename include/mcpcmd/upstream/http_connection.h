#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <mcpcmd/upstream/upstream_connection.h>

namespace mcpcmd::upstream {

/**
 * MCP Streamable HTTP transport.
 *
 * Every JSON-RPC message is POSTed to the endpoint URL. The server answers with either a
 * JSON body or an SSE stream whose `data:` events carry JSON-RPC messages; the one whose id
 * matches the request is the response. The `Mcp-Session-Id` header returned by `initialize`
 * is echoed on later requests and the session is DELETEd on close.
 */
class HttpConnection final : public McpSession {
public:
    HttpConnection(std::string url, ConnectOptions options);
    ~HttpConnection() override;

    static Result<std::unique_ptr<HttpConnection>> open(const registry::RemoteEndpoint& endpoint,
                                                        const ConnectOptions& options);

    void close() override;
    bool is_open() const noexcept override { return open_.load(std::memory_order_acquire); }

    std::string session_id() const;

protected:
    Result<json> request(std::string_view method, json params,
                         std::chrono::milliseconds timeout) override;
    Result<void> notify(std::string_view method, json params) override;

private:
    struct HttpReply {
        long status{0};
        std::string contentType;
        std::string sessionId;
        std::string body;
    };

    Result<HttpReply> post(const json& message, std::chrono::milliseconds timeout);

    std::string url_;
    std::atomic<bool> open_{true};
    std::atomic<int64_t> nextId_{1};
    mutable std::mutex sessionMutex_;
    std::string sessionId_;
};

// Decodes the `data:` payloads of an SSE body; each event's data lines are joined with '\n'.
// Events whose data is not a JSON object are skipped.
std::vector<json> parse_sse_messages(std::string_view body);

} // namespace mcpcmd::upstream
