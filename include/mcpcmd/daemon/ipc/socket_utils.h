#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace mcpcmd::daemon::socket_utils {

// Encode a server name into a filename-safe token. Bytes outside [A-Za-z0-9._-] become %XX,
// so distinct names always map to distinct tokens.
std::string encode_server_name(std::string_view name);

// Directory shared by worker sockets and logs: explicit override, then MCPCMD_SOCKET_DIR,
// then the system temporary directory.
std::filesystem::path resolve_runtime_dir(const std::filesystem::path& override = {});

// <runtime-dir>/mcp-cmd-<encoded-name>.sock. Stable for a given name and environment.
std::filesystem::path resolve_socket_path(std::string_view name,
                                          const std::filesystem::path& runtimeDir = {});

// <runtime-dir>/mcp-cmd-<encoded-name>.log, written by the worker.
std::filesystem::path resolve_log_path(std::string_view name,
                                       const std::filesystem::path& runtimeDir = {});

// Largest socket path accepted by AF_UNIX on this platform (excluding the terminator).
std::size_t max_socket_path_length();

} // namespace mcpcmd::daemon::socket_utils
