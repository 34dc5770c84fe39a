#include <mcpcmd/cli/command.h>
#include <mcpcmd/cli/mcp_cmd_cli.h>
#include <mcpcmd/daemon/liveness_supervisor.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>

namespace mcpcmd::cli {

class StopCommand : public ICommand {
public:
    std::string getName() const override { return "stop"; }

    std::string getDescription() const override { return "Stop a background MCP server"; }

    void registerCommand(CLI::App& app, McpCmdCli* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("stop", getDescription());
        cmd->add_option("name", name_, "Server name")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto store = cli_->registryStore();
        auto loaded = store.load();
        if (!loaded) {
            return loaded.error();
        }
        auto it = loaded.value().find(name_);
        if (it == loaded.value().end()) {
            return Error{ErrorCode::NotRunning, "Server \"" + name_ + "\" is not running"};
        }
        const auto entry = it->second;
        daemon::LivenessSupervisor supervisor(store);

        if (::kill(static_cast<pid_t>(entry.pid), SIGTERM) != 0) {
            int err = errno;
            if (err != ESRCH) {
                return Error{ErrorCode::OperationFailed, "Failed to stop server \"" + name_ +
                                                             "\": " + std::strerror(err)};
            }
            if (auto forgotten = supervisor.forget(name_); !forgotten) {
                return forgotten.error();
            }
            cli_->out() << "Server \"" << name_ << "\" was already stopped\n";
            return Result<void>();
        }

        // The worker removes its own socket too; whoever is first wins
        if (!entry.socketAddress.empty()) {
            std::error_code ec;
            std::filesystem::remove(entry.socketAddress, ec);
            if (ec) {
                spdlog::debug("stop: could not remove {}: {}", entry.socketAddress.string(),
                              ec.message());
            }
        }

        if (auto forgotten = supervisor.forget(name_); !forgotten) {
            return forgotten.error();
        }
        cli_->out() << "Stopped server \"" << name_ << "\"\n";
        return Result<void>();
    }

private:
    McpCmdCli* cli_{nullptr};
    std::string name_;
};

std::unique_ptr<ICommand> createStopCommand() {
    return std::make_unique<StopCommand>();
}

} // namespace mcpcmd::cli
