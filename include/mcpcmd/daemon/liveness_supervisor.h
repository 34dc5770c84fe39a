#pragma once

#include <string>
#include <type_traits>
#include <utility>

#include <sys/types.h>

#include <mcpcmd/core/types.h>
#include <mcpcmd/registry/entry.h>
#include <mcpcmd/registry/registry_store.h>

namespace mcpcmd::daemon {

// kill(pid, 0): ESRCH gives ProcessGone, any other failure (EPERM included) OperationFailed.
Result<void> probe_process(pid_t pid);

/**
 * Gatekeeper for operations on a running server.
 *
 * Liveness is checked lazily: the registry may hold entries for workers that died without
 * being stopped. Such an entry is removed the first time an operation trips over it.
 */
class LivenessSupervisor {
public:
    explicit LivenessSupervisor(registry::RegistryStore& store) : store_(store) {}

    // NotRunning when absent; ProcessGone (after pruning the entry) when the pid has vanished.
    Result<registry::Entry> find_live_entry(const std::string& name);

    // Runs `op(entry)` against a live entry and returns its result unchanged.
    template <typename Op>
    auto with_live_entry(const std::string& name, Op&& op)
        -> std::invoke_result_t<Op, const registry::Entry&> {
        auto entry = find_live_entry(name);
        if (!entry) {
            return entry.error();
        }
        return std::forward<Op>(op)(entry.value());
    }

    // Drops `name` from the registry under the lock. Missing entries are not an error.
    Result<void> forget(const std::string& name);

private:
    registry::RegistryStore& store_;
};

} // namespace mcpcmd::daemon
