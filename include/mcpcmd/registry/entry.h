#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include <mcpcmd/core/types.h>

namespace mcpcmd::registry {

using json = nlohmann::ordered_json;

// Spawn a local MCP server process and talk to it over stdio.
struct LocalSpawn {
    std::string command;
    std::vector<std::string> args;
};

// Connect to a remote MCP endpoint.
struct RemoteEndpoint {
    std::string url;
};

struct LaunchSpec {
    std::variant<LocalSpawn, RemoteEndpoint> target;
    std::filesystem::path cwd;
    // Overrides merged onto the default environment of a spawned server.
    std::map<std::string, std::string> env;

    bool is_remote() const noexcept { return std::holds_alternative<RemoteEndpoint>(target); }
    const LocalSpawn* local() const noexcept { return std::get_if<LocalSpawn>(&target); }
    const RemoteEndpoint* remote() const noexcept { return std::get_if<RemoteEndpoint>(&target); }
};

struct Entry {
    std::string name;
    LaunchSpec launchSpec;
    std::int64_t pid{0};
    std::filesystem::path socketAddress;
    std::string startedAt;
};

// Keyed by server name; order carries no meaning.
using Registry = std::map<std::string, Entry>;

// Decide between a URL and a command line. The words are joined with spaces and accepted as
// a URL when they form an absolute `scheme://authority...` reference; otherwise the first
// word is the command and the rest its arguments.
Result<LaunchSpec> make_launch_spec(const std::vector<std::string>& targetWords,
                                    std::filesystem::path cwd,
                                    std::map<std::string, std::string> env);

bool looks_like_url(std::string_view text);

// KEY=VALUE pairs; everything after the first '=' is the value, a missing '=' gives "".
Result<std::map<std::string, std::string>> parse_env_assignments(
    const std::vector<std::string>& assignments);

json launch_spec_to_json(const LaunchSpec& spec);
Result<LaunchSpec> launch_spec_from_json(const json& doc);

json entry_to_json(const Entry& entry);
Result<Entry> entry_from_json(const std::string& name, const json& doc);

// Current UTC time as an ISO-8601 string with millisecond precision.
std::string format_timestamp(TimePoint tp);

} // namespace mcpcmd::registry
