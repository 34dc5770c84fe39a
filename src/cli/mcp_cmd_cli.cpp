#include <mcpcmd/cli/command_registry.h>
#include <mcpcmd/cli/mcp_cmd_cli.h>
#include <mcpcmd/core/logging.h>
#include <mcpcmd/version.h>

#include <spdlog/spdlog.h>

namespace mcpcmd::cli {

McpCmdCli::McpCmdCli(std::ostream& out, std::ostream& err) : out_(out), err_(err) {
    app_ = std::make_unique<CLI::App>("Keep MCP servers running in the background and call "
                                      "their tools from the command line",
                                      kProgramName);
    app_->set_version_flag("--version", std::string(kVersion));
    app_->require_subcommand(1);

    app_->add_option("--log-level", logLevelFlag_,
                     "Log level (trace, debug, info, warn, error, off)");
    timeoutOpt_ = app_->add_option("--timeout", timeoutFlagMs_,
                                   "Milliseconds to wait for a server response (0 waits forever)")
                      ->check(CLI::NonNegativeNumber);
}

McpCmdCli::~McpCmdCli() = default;

void McpCmdCli::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

Result<void> McpCmdCli::resolveSettings() {
    auto settings = config::Settings::from_environment();
    if (!settings) {
        return settings.error();
    }
    settings_ = std::move(settings).value();

    // Flags override the environment
    if (!logLevelFlag_.empty()) {
        auto level = config::parse_log_level(logLevelFlag_);
        if (!level) {
            return level.error();
        }
        settings_.logLevel = level.value();
    }
    if (timeoutOpt_ && timeoutOpt_->count() > 0) {
        settings_.rpcTimeout = std::chrono::milliseconds{timeoutFlagMs_};
    }
    return Result<void>();
}

daemon::LauncherOptions McpCmdCli::launcherOptions() const {
    daemon::LauncherOptions options;
    options.workerExecutable = settings_.workerExecutable;
    options.startupTimeout = settings_.startupTimeout;
    if (!logLevelFlag_.empty()) {
        options.workerGlobalArgs = {"--log-level", logLevelFlag_};
    }
    return options;
}

daemon::RpcClient McpCmdCli::rpcClient() const {
    daemon::RpcClient::Options options;
    options.timeout = settings_.rpcTimeout;
    return daemon::RpcClient(options);
}

spdlog::level::level_enum McpCmdCli::workerLogLevel() const {
    return settings_.logLevel.value_or(spdlog::level::info);
}

int McpCmdCli::run(int argc, char* argv[]) {
    try {
        CommandRegistry::registerAllCommands(this);
        app_->parse(argc, argv);

        if (auto resolved = resolveSettings(); !resolved) {
            err_ << resolved.error().message << "\n";
            return 1;
        }
        logging::init_cli_logging(settings_.logLevel.value_or(spdlog::level::warn));

        if (!pendingCommand_) {
            return 0;
        }
        auto result = pendingCommand_->execute();
        if (!result) {
            spdlog::debug("{} failed: {} ({})", pendingCommand_->getName(),
                          result.error().message, errorToString(result.error().code));
            err_ << result.error().message << "\n";
            return 1;
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e, out_, err_);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        err_ << "Unexpected error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace mcpcmd::cli
