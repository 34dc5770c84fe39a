#include <mcpcmd/cli/command.h>
#include <mcpcmd/cli/mcp_cmd_cli.h>
#include <mcpcmd/daemon/launcher.h>
#include <mcpcmd/registry/entry.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mcpcmd::cli {

namespace fs = std::filesystem;

class StartCommand : public ICommand {
public:
    std::string getName() const override { return "start"; }

    std::string getDescription() const override {
        return "Start an MCP server (command line or URL) in the background";
    }

    void registerCommand(CLI::App& app, McpCmdCli* cli) override {
        cli_ = cli;

        cmd_ = app.add_subcommand("start", getDescription());
        cmd_->add_option("name", name_, "Name to refer to the server by")->required();
        cmd_->add_option("--cwd", cwd_, "Working directory of the server (default: current)");
        cmd_->add_option("--env", envAssignments_, "Set an environment variable KEY=VALUE")
            ->allow_extra_args(false);
        // Everything after the name belongs to the server command line
        cmd_->prefix_command();
        cmd_->footer("Example: mcp-cmd start everything npx -y "
                     "@modelcontextprotocol/server-everything");

        cmd_->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        std::vector<std::string> target = cmd_->remaining();
        if (target.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "Missing server command or URL for \"" + name_ + "\""};
        }

        auto env = registry::parse_env_assignments(envAssignments_);
        if (!env) {
            return env.error();
        }

        std::error_code ec;
        fs::path cwd = cwd_.empty() ? fs::current_path(ec) : fs::absolute(cwd_, ec);
        if (ec) {
            return Error{ErrorCode::InvalidArgument, "Invalid working directory: " + ec.message()};
        }

        auto spec = registry::make_launch_spec(target, cwd, std::move(env).value());
        if (!spec) {
            return spec.error();
        }

        auto store = cli_->registryStore();
        daemon::Launcher launcher(store, cli_->launcherOptions());
        auto entry = launcher.launch(name_, spec.value());
        if (!entry) {
            return entry.error();
        }

        cli_->out() << "Started server \"" << name_ << "\" with PID " << entry.value().pid
                    << "\n";
        return Result<void>();
    }

private:
    McpCmdCli* cli_{nullptr};
    CLI::App* cmd_{nullptr};
    std::string name_;
    std::string cwd_;
    std::vector<std::string> envAssignments_;
};

std::unique_ptr<ICommand> createStartCommand() {
    return std::make_unique<StartCommand>();
}

} // namespace mcpcmd::cli
