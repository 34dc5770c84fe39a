#include <spdlog/spdlog.h>
#include <mcpcmd/cli/mcp_cmd_cli.h>

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; McpCmdCli::run() adjusts based on flags and environment
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        mcpcmd::cli::McpCmdCli cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
