#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <mcpcmd/core/types.h>

namespace mcpcmd::cli {

class McpCmdCli;

/**
 * Sends one request to the worker of a live server.
 *
 * NotRunning and ProcessGone come back as produced by the liveness check; failures of the
 * request itself are prefixed with `Operation failed for "<name>": `.
 */
Result<nlohmann::ordered_json> call_live_server(McpCmdCli* cli, const std::string& name,
                                                std::string_view method,
                                                std::optional<nlohmann::ordered_json> params);

// Two-space indented JSON followed by a newline.
void print_json(std::ostream& out, const nlohmann::ordered_json& value);

} // namespace mcpcmd::cli
