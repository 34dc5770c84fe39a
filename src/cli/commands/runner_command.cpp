#include <mcpcmd/cli/command.h>
#include <mcpcmd/cli/mcp_cmd_cli.h>
#include <mcpcmd/core/logging.h>
#include <mcpcmd/daemon/ipc/rpc_protocol.h>
#include <mcpcmd/daemon/ipc/socket_utils.h>
#include <mcpcmd/daemon/launcher.h>
#include <mcpcmd/daemon/worker.h>
#include <mcpcmd/registry/entry.h>
#include <mcpcmd/version.h>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

#include <unistd.h>

namespace mcpcmd::cli {

class RunnerCommand : public ICommand {
public:
    std::string getName() const override { return daemon::kWorkerSubcommand; }

    std::string getDescription() const override {
        return "Run the background worker for a server (internal)";
    }

    void registerCommand(CLI::App& app, McpCmdCli* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(daemon::kWorkerSubcommand, getDescription());
        // Hidden from help output
        cmd->group("");
        cmd->add_option("name", name_, "Server name")->required();
        cmd->add_option("launch-spec", specJson_, "Launch spec as JSON")->required();
        cmd->add_option("--control-fd", controlFd_, "Inherited pipe for the readiness line");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto& settings = cli_->settings();
        auto logPath = daemon::socket_utils::resolve_log_path(name_, settings.socketDir);
        if (auto logged = logging::init_worker_logging(logPath, cli_->workerLogLevel());
            !logged) {
            // Keep going without a log file
            spdlog::warn("{}", logged.error().message);
        }

        auto doc = registry::json::parse(specJson_, nullptr, false);
        if (doc.is_discarded()) {
            return fail("Launch spec is not valid JSON");
        }
        auto spec = registry::launch_spec_from_json(doc);
        if (!spec) {
            return fail(spec.error().message);
        }

        daemon::WorkerOptions options;
        options.name = name_;
        options.launchSpec = std::move(spec).value();
        options.controlFd = controlFd_;
        controlFd_ = -1;
        options.socketPath = daemon::socket_utils::resolve_socket_path(name_, settings.socketDir);
        options.upstreamOptions.requestTimeout = settings.upstreamTimeout;
        options.upstreamOptions.clientVersion = kVersion;

        spdlog::info("Worker[{}]: mcp-cmd {} starting (pid={})", name_, kVersion, ::getpid());
        daemon::Worker worker(std::move(options));
        if (int status = worker.run(); status != 0) {
            return Error{ErrorCode::OperationFailed,
                         "Worker for \"" + name_ + "\" exited with status " +
                             std::to_string(status)};
        }
        return Result<void>();
    }

private:
    // Errors before the worker exists still have to reach the waiting launcher.
    Result<void> fail(const std::string& message) {
        spdlog::error("Worker[{}]: {}", name_, message);
        if (controlFd_ >= 0) {
            if (!daemon::write_control_line(controlFd_,
                                            daemon::ipc::encode_error_message(message))) {
                spdlog::warn("Worker[{}]: launcher is no longer listening", name_);
            }
            ::close(controlFd_);
            controlFd_ = -1;
        }
        return Error{ErrorCode::InvalidArgument, message};
    }

    McpCmdCli* cli_{nullptr};
    std::string name_;
    std::string specJson_;
    int controlFd_{-1};
};

std::unique_ptr<ICommand> createRunnerCommand() {
    return std::make_unique<RunnerCommand>();
}

} // namespace mcpcmd::cli
