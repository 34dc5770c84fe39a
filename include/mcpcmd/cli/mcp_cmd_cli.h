#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <mcpcmd/cli/command.h>
#include <mcpcmd/config/settings.h>
#include <mcpcmd/daemon/client/rpc_client.h>
#include <mcpcmd/daemon/launcher.h>
#include <mcpcmd/registry/registry_store.h>

namespace mcpcmd::cli {

/**
 * Main CLI application class
 */
class McpCmdCli {
public:
    explicit McpCmdCli(std::ostream& out = std::cout, std::ostream& err = std::cerr);
    ~McpCmdCli();

    /**
     * Run the CLI with given arguments. Returns the process exit status.
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing and settings resolution.
     */
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    const config::Settings& settings() const { return settings_; }

    /**
     * Registry file named by the resolved settings
     */
    registry::RegistryStore registryStore() const {
        return registry::RegistryStore(settings_.registryPath);
    }

    daemon::LauncherOptions launcherOptions() const;
    daemon::RpcClient rpcClient() const;

    // Level the worker should log at; info unless configured.
    spdlog::level::level_enum workerLogLevel() const;

    std::ostream& out() { return out_; }
    std::ostream& err() { return err_; }

private:
    Result<void> resolveSettings();

    std::ostream& out_;
    std::ostream& err_;
    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    config::Settings settings_;
    std::string logLevelFlag_;
    long long timeoutFlagMs_{0};
    CLI::Option* timeoutOpt_{nullptr};
};

} // namespace mcpcmd::cli
