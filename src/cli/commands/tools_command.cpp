#include <mcpcmd/cli/command.h>
#include <mcpcmd/cli/mcp_cmd_cli.h>
#include <mcpcmd/cli/server_helpers.h>
#include <mcpcmd/daemon/ipc/rpc_protocol.h>

#include <memory>
#include <string>

namespace mcpcmd::cli {

class ToolsCommand : public ICommand {
public:
    std::string getName() const override { return "tools"; }

    std::string getDescription() const override {
        return "List the tools offered by a running server";
    }

    void registerCommand(CLI::App& app, McpCmdCli* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("tools", getDescription());
        cmd->add_option("name", name_, "Server name")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto result =
            call_live_server(cli_, name_, daemon::ipc::kMethodListTools, std::nullopt);
        if (!result) {
            return result.error();
        }
        print_json(cli_->out(), result.value());
        return Result<void>();
    }

private:
    McpCmdCli* cli_{nullptr};
    std::string name_;
};

std::unique_ptr<ICommand> createToolsCommand() {
    return std::make_unique<ToolsCommand>();
}

} // namespace mcpcmd::cli
