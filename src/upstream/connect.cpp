#include <mcpcmd/upstream/http_connection.h>
#include <mcpcmd/upstream/stdio_connection.h>
#include <mcpcmd/upstream/upstream_connection.h>

#include <spdlog/spdlog.h>

namespace mcpcmd::upstream {

Result<std::unique_ptr<IUpstreamConnection>> connect(const registry::LaunchSpec& spec,
                                                     const ConnectOptions& options) {
    if (const auto* remote = spec.remote()) {
        spdlog::info("Upstream: connecting to {}", remote->url);
        auto connection = HttpConnection::open(*remote, options);
        if (!connection) {
            return connection.error();
        }
        return std::unique_ptr<IUpstreamConnection>(std::move(connection).value());
    }

    const auto* local = spec.local();
    if (local == nullptr || local->command.empty()) {
        return Error{ErrorCode::InvalidArgument, "Launch spec has no command or URL"};
    }
    spdlog::info("Upstream: spawning '{}' with {} argument(s)", local->command,
                 local->args.size());
    auto connection = StdioConnection::open(*local, spec, options);
    if (!connection) {
        return connection.error();
    }
    return std::unique_ptr<IUpstreamConnection>(std::move(connection).value());
}

} // namespace mcpcmd::upstream
