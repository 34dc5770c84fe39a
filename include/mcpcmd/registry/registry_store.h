#pragma once

#include <filesystem>
#include <utility>

#include <mcpcmd/core/types.h>
#include <mcpcmd/registry/entry.h>

namespace mcpcmd::registry {

// Scoped advisory lock on `<registry>.lock`. Released on destruction.
class RegistryLock {
public:
    RegistryLock() = default;
    explicit RegistryLock(int fd) noexcept : fd_(fd) {}
    ~RegistryLock();

    RegistryLock(const RegistryLock&) = delete;
    RegistryLock& operator=(const RegistryLock&) = delete;
    RegistryLock(RegistryLock&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    RegistryLock& operator=(RegistryLock&& other) noexcept;

    bool held() const noexcept { return fd_ >= 0; }

private:
    int fd_{-1};
};

/**
 * Persisted mapping of server name to Entry, stored as one JSON document.
 *
 * There are no transactions: callers re-load immediately before every load-mutate-save and the
 * last save wins. Mutating callers may additionally hold lock() to serialize against other
 * mcp-cmd processes using the same file.
 */
class RegistryStore {
public:
    explicit RegistryStore(std::filesystem::path path) : path_(std::move(path)) {}

    // Missing file gives an empty registry; an unreadable or invalid one gives CorruptedData.
    Result<Registry> load() const;

    // Write to a sibling temporary file and rename it over the store.
    Result<void> save(const Registry& registry) const;

    // Blocks until the advisory lock is acquired.
    Result<RegistryLock> lock() const;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace mcpcmd::registry
