#include <mcpcmd/cli/call_arguments.h>
#include <mcpcmd/cli/command.h>
#include <mcpcmd/cli/mcp_cmd_cli.h>
#include <mcpcmd/cli/server_helpers.h>
#include <mcpcmd/daemon/ipc/rpc_protocol.h>

#include <memory>
#include <string>
#include <vector>

namespace mcpcmd::cli {

class CallCommand : public ICommand {
public:
    std::string getName() const override { return "call"; }

    std::string getDescription() const override {
        return "Call a tool on a running server. Pass arguments as JSON or named arguments";
    }

    void registerCommand(CLI::App& app, McpCmdCli* cli) override {
        cli_ = cli;

        cmd_ = app.add_subcommand("call", getDescription());
        cmd_->add_option("name", name_, "Server name")->required();
        cmd_->add_option("tool", tool_, "Tool name")->required();
        // Tool arguments are not known to the parser
        cmd_->allow_extras();
        cmd_->footer("Examples:\n"
                     "  mcp-cmd call everything echo --message hello\n"
                     "  mcp-cmd call everything add '{\"a\": 1, \"b\": 2}'");
        cmd_->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto arguments = build_call_arguments(cmd_->remaining());
        if (!arguments) {
            return arguments.error();
        }

        json params = json::object();
        params["name"] = tool_;
        params["arguments"] = std::move(arguments).value();

        auto result = call_live_server(cli_, name_, daemon::ipc::kMethodCallTool,
                                       std::move(params));
        if (!result) {
            return result.error();
        }
        print_json(cli_->out(), result.value());
        return Result<void>();
    }

private:
    McpCmdCli* cli_{nullptr};
    CLI::App* cmd_{nullptr};
    std::string name_;
    std::string tool_;
};

std::unique_ptr<ICommand> createCallCommand() {
    return std::make_unique<CallCommand>();
}

} // namespace mcpcmd::cli
