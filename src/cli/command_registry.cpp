#include <mcpcmd/cli/command_registry.h>
#include <mcpcmd/cli/mcp_cmd_cli.h>

namespace mcpcmd::cli {

void CommandRegistry::registerAllCommands(McpCmdCli* cli) {
    cli->registerCommand(createStartCommand());
    cli->registerCommand(createStopCommand());
    cli->registerCommand(createToolsCommand());
    cli->registerCommand(createCallCommand());
    cli->registerCommand(createPsCommand());
    cli->registerCommand(createRunnerCommand());
}

} // namespace mcpcmd::cli
