#include <mcpcmd/upstream/stdio_connection.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace mcpcmd::upstream {

StdioConnection::StdioConnection(UpstreamProcessConfig processConfig, ConnectOptions options)
    : McpSession(std::move(options)), rpc_([this](std::string_view frame) -> Result<void> {
          if (!process_) {
              return Error{ErrorCode::IOError, "Upstream process not started"};
          }
          return process_->write_stdin(frame);
      }) {
    processConfig.on_stdout = [this](std::string_view bytes) { rpc_.on_bytes(bytes); };
    processConfig.on_exit = [this] { rpc_.on_closed("Connection closed"); };
    process_ = std::make_unique<UpstreamProcess>(std::move(processConfig));
}

StdioConnection::~StdioConnection() {
    close();
}

Result<std::unique_ptr<StdioConnection>> StdioConnection::open(const registry::LocalSpawn& spawn,
                                                               const registry::LaunchSpec& spec,
                                                               const ConnectOptions& options) {
    UpstreamProcessConfig config;
    config.executable = spawn.command;
    config.args = spawn.args;
    config.env = default_environment();
    for (const auto& [key, value] : spec.env) {
        config.env[key] = value;
    }
    if (!spec.cwd.empty()) {
        config.workdir = spec.cwd;
    }

    std::unique_ptr<StdioConnection> connection;
    try {
        connection = std::make_unique<StdioConnection>(std::move(config), options);
    } catch (const std::exception& e) {
        return Error{ErrorCode::SpawnFailed,
                     "Failed to spawn '" + spawn.command + "': " + e.what()};
    }

    if (auto init = connection->initialize(); !init) {
        connection->close();
        return init.error();
    }
    return connection;
}

void StdioConnection::close() {
    rpc_.on_closed("Connection closed");
    if (process_ && process_->is_alive()) {
        process_->terminate(std::chrono::seconds{2});
    }
}

bool StdioConnection::is_open() const noexcept {
    return !rpc_.closed() && process_ && process_->is_alive();
}

Result<json> StdioConnection::request(std::string_view method, json params,
                                      std::chrono::milliseconds timeout) {
    return rpc_.call(method, std::move(params), timeout);
}

Result<void> StdioConnection::notify(std::string_view method, json params) {
    return rpc_.notify(method, std::move(params));
}

} // namespace mcpcmd::upstream
