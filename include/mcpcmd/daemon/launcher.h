#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <sys/types.h>

#include <mcpcmd/core/types.h>
#include <mcpcmd/registry/entry.h>
#include <mcpcmd/registry/registry_store.h>

namespace mcpcmd::daemon {

inline constexpr const char* kWorkerSubcommand = "_internal_runner";

struct LauncherOptions {
    // Defaults to the running executable.
    std::filesystem::path workerExecutable;
    std::chrono::milliseconds startupTimeout{60'000};
    // Passed to the worker ahead of the subcommand (global flags such as --log-level).
    std::vector<std::string> workerGlobalArgs;
};

/**
 * Starts a detached worker for a named server and records it once it reports ready.
 *
 * The worker runs in its own session with stdio on /dev/null and inherits the write end of
 * a control pipe. The launcher waits for one line on it: ready gives a registry Entry,
 * an error line or EOF gives SpawnFailed, silence until the timeout gives StartupTimeout.
 * Failed launches kill and reap the worker and leave the registry untouched.
 */
class Launcher {
public:
    Launcher(registry::RegistryStore& store, LauncherOptions options)
        : store_(store), options_(std::move(options)) {}

    Result<registry::Entry> launch(const std::string& name, const registry::LaunchSpec& spec);

    // argv of the worker for `name`, without the executable itself.
    std::vector<std::string> worker_arguments(const std::string& name,
                                              const registry::LaunchSpec& spec,
                                              int controlFd) const;

private:
    struct SpawnedWorker {
        pid_t pid{-1};
        int controlFd{-1};
    };

    Result<SpawnedWorker> spawn(const std::string& name, const registry::LaunchSpec& spec);
    Result<std::filesystem::path> await_ready(const SpawnedWorker& worker);
    void kill_and_reap(pid_t pid);

    registry::RegistryStore& store_;
    LauncherOptions options_;
};

} // namespace mcpcmd::daemon
