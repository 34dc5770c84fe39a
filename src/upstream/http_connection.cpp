/*
 * http_connection.cpp
 *
 * Notes
 * - One libcurl easy handle per request; the connection is safe to use from several threads.
 * - Curl failures map onto NetworkError/Timeout, wrapped as UpstreamDispatchFailed for callers.
 */

#include <mcpcmd/upstream/http_connection.h>
#include <mcpcmd/upstream/jsonrpc_client.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace mcpcmd::upstream {

namespace {

std::once_flag g_curlInit;

void ensure_curl_initialized() {
    std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::OperationFailed;
            break;
    }
    return err;
}

struct ReplyContext {
    std::string body;
    std::string contentType;
    std::string sessionId;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<ReplyContext*>(userdata)->body.append(ptr, total);
    return total;
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<ReplyContext*>(userdata);
    std::string_view line(buffer, total);
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));
    if (key == "content-type") {
        ctx->contentType = to_lower(val);
    } else if (key == "mcp-session-id") {
        ctx->sessionId = val;
    }
    return total;
}

// RAII holders for the curl easy API
struct CurlDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};
struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

HeaderList append_header(HeaderList list, const std::string& header) {
    curl_slist* raw = curl_slist_append(list.get(), header.c_str());
    if (raw != nullptr) {
        (void)list.release();
        return HeaderList{raw};
    }
    return list;
}

Error dispatch_error(const Error& cause) {
    return Error{ErrorCode::UpstreamDispatchFailed, cause.message};
}

} // namespace

std::vector<json> parse_sse_messages(std::string_view body) {
    std::vector<json> messages;
    std::string data;
    bool hasData = false;

    auto dispatch = [&] {
        if (hasData) {
            json doc = json::parse(data, nullptr, false);
            if (!doc.is_discarded() && doc.is_object()) {
                messages.push_back(std::move(doc));
            }
        }
        data.clear();
        hasData = false;
    };

    std::size_t start = 0;
    while (start <= body.size()) {
        auto nl = body.find('\n', start);
        std::string_view line =
            body.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        if (line.empty()) {
            dispatch();
        } else if (line.starts_with("data:")) {
            auto value = line.substr(5);
            if (!value.empty() && value.front() == ' ')
                value.remove_prefix(1);
            if (hasData)
                data.push_back('\n');
            data.append(value);
            hasData = true;
        }

        if (nl == std::string_view::npos)
            break;
        start = nl + 1;
    }
    dispatch();
    return messages;
}

HttpConnection::HttpConnection(std::string url, ConnectOptions options)
    : McpSession(std::move(options)), url_(std::move(url)) {
    ensure_curl_initialized();
}

HttpConnection::~HttpConnection() {
    close();
}

Result<std::unique_ptr<HttpConnection>>
HttpConnection::open(const registry::RemoteEndpoint& endpoint, const ConnectOptions& options) {
    auto connection = std::make_unique<HttpConnection>(endpoint.url, options);
    if (auto init = connection->initialize(); !init) {
        connection->open_.store(false, std::memory_order_release);
        return init.error();
    }
    return connection;
}

std::string HttpConnection::session_id() const {
    std::lock_guard lock{sessionMutex_};
    return sessionId_;
}

Result<HttpConnection::HttpReply> HttpConnection::post(const json& message,
                                                       std::chrono::milliseconds timeout) {
    CurlHandle curl{curl_easy_init()};
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    const std::string payload = message.dump(-1, ' ', false, json::error_handler_t::replace);
    ReplyContext ctx;

    HeaderList headers;
    headers = append_header(std::move(headers), "Content-Type: application/json");
    headers = append_header(std::move(headers), "Accept: application/json, text/event-stream");
    headers = append_header(std::move(headers),
                            std::string("MCP-Protocol-Version: ") + kProtocolVersion);
    if (auto session = session_id(); !session.empty()) {
        headers = append_header(std::move(headers), "Mcp-Session-Id: " + session);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &header_cb);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (timeout.count() > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    }

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return makeCurlError(rc, "POST " + url_);
    }

    HttpReply reply;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &reply.status);
    reply.contentType = std::move(ctx.contentType);
    reply.sessionId = std::move(ctx.sessionId);
    reply.body = std::move(ctx.body);

    if (!reply.sessionId.empty()) {
        std::lock_guard lock{sessionMutex_};
        sessionId_ = reply.sessionId;
    }
    return reply;
}

Result<json> HttpConnection::request(std::string_view method, json params,
                                     std::chrono::milliseconds timeout) {
    if (!is_open()) {
        return Error{ErrorCode::UpstreamDispatchFailed, "MCP error -32000: Connection closed"};
    }
    const int64_t id = nextId_.fetch_add(1, std::memory_order_relaxed);
    auto reply = post(build_request(id, method, params), timeout);
    if (!reply) {
        return dispatch_error(reply.error());
    }

    const auto& r = reply.value();
    if (r.status < 200 || r.status >= 300) {
        return Error{ErrorCode::UpstreamDispatchFailed,
                     "HTTP " + std::to_string(r.status) + " from " + url_ + ": " + trim(r.body)};
    }

    std::vector<json> messages;
    if (r.contentType.starts_with("text/event-stream")) {
        messages = parse_sse_messages(r.body);
    } else {
        json doc = json::parse(r.body, nullptr, false);
        if (doc.is_array()) {
            for (auto& item : doc)
                messages.push_back(std::move(item));
        } else if (doc.is_object()) {
            messages.push_back(std::move(doc));
        }
    }

    for (auto& message : messages) {
        auto idIt = message.find("id");
        if (message.contains("method") || idIt == message.end() || *idIt != json(id))
            continue;
        if (auto err = message.find("error"); err != message.end() && !err->is_null()) {
            return make_mcp_error(*err);
        }
        auto result = message.find("result");
        return result != message.end() ? std::move(*result) : json(nullptr);
    }
    return Error{ErrorCode::UpstreamDispatchFailed,
                 "No response for '" + std::string(method) + "' in HTTP reply from " + url_};
}

Result<void> HttpConnection::notify(std::string_view method, json params) {
    auto reply = post(build_notification(method, params), options().requestTimeout);
    if (!reply) {
        return dispatch_error(reply.error());
    }
    if (reply.value().status >= 400) {
        return Error{ErrorCode::UpstreamDispatchFailed,
                     "HTTP " + std::to_string(reply.value().status) + " for notification '" +
                         std::string(method) + "'"};
    }
    return {};
}

void HttpConnection::close() {
    if (!open_.exchange(false))
        return;

    auto session = session_id();
    if (session.empty())
        return;

    CurlHandle curl{curl_easy_init()};
    if (!curl)
        return;
    HeaderList headers;
    headers = append_header(std::move(headers), "Mcp-Session-Id: " + session);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, 5000L);
    ReplyContext sink;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    if (CURLcode rc = curl_easy_perform(curl.get()); rc != CURLE_OK) {
        spdlog::debug("HttpConnection: session DELETE failed: {}", curl_easy_strerror(rc));
    }
}

} // namespace mcpcmd::upstream
