#pragma once

#include <mcpcmd/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpcmd::upstream {

/**
 * @brief Lifecycle state of a spawned MCP server process
 */
enum class ProcessState : uint8_t {
    Unstarted,
    Running,
    ShuttingDown,
    Terminated,
    Failed
};

struct UpstreamProcessConfig {
    std::string executable; ///< Looked up on the child's PATH when it has no slash
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Complete child environment
    std::optional<std::filesystem::path> workdir;

    // Called from the reader thread with every chunk read from the child's stdout.
    std::function<void(std::string_view)> on_stdout;
    // Called once from the reader thread when stdout reaches EOF.
    std::function<void()> on_exit;
};

/**
 * @brief RAII wrapper for an MCP server spoken to over stdio
 *
 * Spawns the child with stdin/stdout/stderr pipes. A reader thread delivers stdout chunks to
 * `on_stdout`; stderr is forwarded line by line to the log. Destruction terminates the child
 * (SIGTERM, then SIGKILL after the grace period).
 *
 * **Thread Safety:** write_stdin() may be called from any thread.
 */
class UpstreamProcess {
public:
    /**
     * @brief Construct and spawn the process
     * @throws std::runtime_error if pipes cannot be created or fork fails
     */
    explicit UpstreamProcess(UpstreamProcessConfig config);
    ~UpstreamProcess();

    UpstreamProcess(const UpstreamProcess&) = delete;
    UpstreamProcess& operator=(const UpstreamProcess&) = delete;

    [[nodiscard]] ProcessState state() const noexcept;
    [[nodiscard]] bool is_alive() const noexcept;
    [[nodiscard]] int64_t pid() const noexcept;

    // Writes all bytes or fails with IOError (EPIPE when the child has gone).
    Result<void> write_stdin(std::string_view data);

    // Closes stdin, sends SIGTERM and escalates to SIGKILL once `timeout` expires.
    void terminate(std::chrono::milliseconds timeout = std::chrono::seconds{5});

    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpcmd::upstream
