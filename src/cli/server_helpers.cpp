#include <mcpcmd/cli/mcp_cmd_cli.h>
#include <mcpcmd/cli/server_helpers.h>
#include <mcpcmd/daemon/liveness_supervisor.h>

namespace mcpcmd::cli {

Result<nlohmann::ordered_json> call_live_server(McpCmdCli* cli, const std::string& name,
                                                std::string_view method,
                                                std::optional<nlohmann::ordered_json> params) {
    auto store = cli->registryStore();
    daemon::LivenessSupervisor supervisor(store);
    auto client = cli->rpcClient();

    auto result = supervisor.with_live_entry(
        name, [&](const registry::Entry& entry) -> Result<nlohmann::ordered_json> {
            auto response = client.call(entry.socketAddress, method, std::move(params));
            if (!response) {
                return Error{response.error().code, "Operation failed for \"" + name +
                                                        "\": " + response.error().message};
            }
            return response;
        });
    return result;
}

void print_json(std::ostream& out, const nlohmann::ordered_json& value) {
    out << value.dump(2) << "\n";
}

} // namespace mcpcmd::cli
