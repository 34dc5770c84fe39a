#include <mcpcmd/cli/command.h>
#include <mcpcmd/cli/mcp_cmd_cli.h>
#include <mcpcmd/registry/entry.h>

#include <memory>
#include <sstream>
#include <string>

namespace mcpcmd::cli {

namespace {

// Name on its own line, then the registry record indented by two spaces.
void print_entry(std::ostream& out, const registry::Entry& entry) {
    out << entry.name << "\n";
    std::istringstream lines(registry::entry_to_json(entry).dump(2));
    for (std::string line; std::getline(lines, line);) {
        out << "  " << line << "\n";
    }
}

} // namespace

class PsCommand : public ICommand {
public:
    std::string getName() const override { return "ps"; }

    std::string getDescription() const override {
        return "List running servers or show details for a specific server";
    }

    void registerCommand(CLI::App& app, McpCmdCli* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("ps", getDescription());
        cmd->add_option("name", name_, "Only show this server");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto loaded = cli_->registryStore().load();
        if (!loaded) {
            return loaded.error();
        }
        const auto& servers = loaded.value();

        if (!name_.empty()) {
            auto it = servers.find(name_);
            if (it == servers.end()) {
                return Error{ErrorCode::NotRunning, "Server \"" + name_ + "\" is not running"};
            }
            print_entry(cli_->out(), it->second);
            return Result<void>();
        }

        if (servers.empty()) {
            cli_->out() << "No servers running\n";
            return Result<void>();
        }
        for (const auto& [name, entry] : servers) {
            print_entry(cli_->out(), entry);
            cli_->out() << "\n";
        }
        return Result<void>();
    }

private:
    McpCmdCli* cli_{nullptr};
    std::string name_;
};

std::unique_ptr<ICommand> createPsCommand() {
    return std::make_unique<PsCommand>();
}

} // namespace mcpcmd::cli
