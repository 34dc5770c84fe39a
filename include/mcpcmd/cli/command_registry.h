#pragma once

#include <memory>
#include <mcpcmd/cli/command.h>

namespace mcpcmd::cli {

class McpCmdCli;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(McpCmdCli* cli);
};

// Factories, one per command source file
std::unique_ptr<ICommand> createStartCommand();
std::unique_ptr<ICommand> createStopCommand();
std::unique_ptr<ICommand> createToolsCommand();
std::unique_ptr<ICommand> createCallCommand();
std::unique_ptr<ICommand> createPsCommand();
// Hidden entry point of the detached worker
std::unique_ptr<ICommand> createRunnerCommand();

} // namespace mcpcmd::cli
