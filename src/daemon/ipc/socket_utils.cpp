#include <mcpcmd/daemon/ipc/socket_utils.h>

#include <cstdlib>

#include <sys/un.h>

namespace mcpcmd::daemon::socket_utils {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kFilePrefix = "mcp-cmd-";

bool is_safe_byte(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}

} // namespace

std::string encode_server_name(std::string_view name) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (is_safe_byte(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

fs::path resolve_runtime_dir(const fs::path& override) {
    if (!override.empty())
        return override;
    if (const char* env = std::getenv("MCPCMD_SOCKET_DIR")) {
        if (*env)
            return fs::path(env);
    }
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec || tmp.empty())
        return fs::path("/tmp");
    return tmp;
}

fs::path resolve_socket_path(std::string_view name, const fs::path& runtimeDir) {
    return resolve_runtime_dir(runtimeDir) /
           (std::string(kFilePrefix) + encode_server_name(name) + ".sock");
}

fs::path resolve_log_path(std::string_view name, const fs::path& runtimeDir) {
    return resolve_runtime_dir(runtimeDir) /
           (std::string(kFilePrefix) + encode_server_name(name) + ".log");
}

std::size_t max_socket_path_length() {
    return sizeof(sockaddr_un::sun_path) - 1;
}

} // namespace mcpcmd::daemon::socket_utils
