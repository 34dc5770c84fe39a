#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <mcpcmd/upstream/upstream_connection.h>

namespace mcpcmd::test {

/**
 * @brief In-memory upstream with three tools.
 *
 *   echo  returns {"content":[{"type":"text","text":<arguments.text>}]}
 *   fail  fails with "MCP error -32603: tool failed"
 *   sleep waits arguments.ms milliseconds, then returns {"slept": ms}
 */
class FakeUpstream : public upstream::IUpstreamConnection {
public:
    using json = upstream::json;

    Result<json> list_tools() override {
        ++listCalls;
        if (!open_) {
            return Error{ErrorCode::UpstreamDispatchFailed, "MCP error -32000: Connection closed"};
        }
        json tools = json::array();
        for (const char* name : {"echo", "fail", "sleep"}) {
            json tool = json::object();
            tool["name"] = name;
            tool["inputSchema"] = json{{"type", "object"}};
            tools.push_back(std::move(tool));
        }
        json result = json::object();
        result["tools"] = std::move(tools);
        return result;
    }

    Result<json> call_tool(std::string_view name, const json& arguments) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.emplace_back(name);
        }
        if (!open_) {
            return Error{ErrorCode::UpstreamDispatchFailed, "MCP error -32000: Connection closed"};
        }
        if (name == "echo") {
            json content = json::array();
            content.push_back(json{{"type", "text"}, {"text", arguments.value("text", "")}});
            return json{{"content", std::move(content)}};
        }
        if (name == "sleep") {
            auto ms = arguments.value("ms", 0);
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            return json{{"slept", ms}};
        }
        if (name == "fail") {
            return Error{ErrorCode::UpstreamDispatchFailed, "MCP error -32603: tool failed"};
        }
        return Error{ErrorCode::UpstreamDispatchFailed,
                     "MCP error -32602: Unknown tool: " + std::string(name)};
    }

    void close() override {
        open_ = false;
        ++closeCalls;
    }
    bool is_open() const noexcept override { return open_.load(); }

    std::vector<std::string> recorded_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::atomic<int> listCalls{0};
    std::atomic<int> closeCalls{0};

private:
    std::atomic<bool> open_{true};
    std::mutex mutex_;
    std::vector<std::string> calls_;
};

} // namespace mcpcmd::test
