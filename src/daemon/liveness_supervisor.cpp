#include <mcpcmd/daemon/liveness_supervisor.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>

namespace mcpcmd::daemon {

Result<void> probe_process(pid_t pid) {
    if (pid <= 0) {
        return Error{ErrorCode::InvalidArgument, "Invalid pid " + std::to_string(pid)};
    }
    if (::kill(pid, 0) == 0) {
        return {};
    }
    int err = errno;
    if (err == ESRCH) {
        return Error{ErrorCode::ProcessGone, "No such process"};
    }
    return Error{ErrorCode::OperationFailed, std::strerror(err)};
}

Result<registry::Entry> LivenessSupervisor::find_live_entry(const std::string& name) {
    auto loaded = store_.load();
    if (!loaded) {
        return loaded.error();
    }
    auto it = loaded.value().find(name);
    if (it == loaded.value().end()) {
        return Error{ErrorCode::NotRunning, "Server \"" + name + "\" is not running"};
    }
    registry::Entry entry = it->second;

    auto probe = probe_process(static_cast<pid_t>(entry.pid));
    if (probe) {
        return entry;
    }
    if (probe.error().code != ErrorCode::ProcessGone) {
        return Error{ErrorCode::OperationFailed,
                     "Operation failed for \"" + name + "\": " + probe.error().message};
    }

    spdlog::info("LivenessSupervisor: pruning '{}' (pid {} is gone)", name, entry.pid);
    if (auto forgotten = forget(name); !forgotten) {
        return forgotten.error();
    }
    return Error{ErrorCode::ProcessGone, "Server \"" + name + "\" process is no longer running"};
}

Result<void> LivenessSupervisor::forget(const std::string& name) {
    auto lock = store_.lock();
    if (!lock) {
        return lock.error();
    }
    auto latest = store_.load();
    if (!latest) {
        return latest.error();
    }
    auto registry = std::move(latest).value();
    if (registry.erase(name) == 0) {
        return {};
    }
    return store_.save(registry);
}

} // namespace mcpcmd::daemon
