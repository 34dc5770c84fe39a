#include <mcpcmd/registry/registry_store.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace mcpcmd::registry {

namespace fs = std::filesystem;

RegistryLock::~RegistryLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

RegistryLock& RegistryLock::operator=(RegistryLock&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

Result<Registry> RegistryStore::load() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Registry{};
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IOError, "Cannot open registry " + path_.string()};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string text = buffer.str();

    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Error{ErrorCode::CorruptedData,
                     "Registry " + path_.string() + " is not a JSON object"};
    }

    Registry registry;
    for (const auto& [name, value] : doc.items()) {
        auto entry = entry_from_json(name, value);
        if (!entry) {
            return Error{ErrorCode::CorruptedData,
                         "Registry " + path_.string() + ": " + entry.error().message};
        }
        registry.emplace(name, std::move(entry).value());
    }
    return registry;
}

Result<void> RegistryStore::save(const Registry& registry) const {
    json doc = json::object();
    for (const auto& [name, entry] : registry) {
        doc[name] = entry_to_json(entry);
    }

    fs::path tmp = path_;
    tmp += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IOError, "Cannot write " + tmp.string()};
        }
        out << doc.dump(2) << '\n';
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return Error{ErrorCode::IOError, "Failed writing " + tmp.string()};
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Error{ErrorCode::IOError,
                     "Cannot replace registry " + path_.string() + ": " + ec.message()};
    }
    spdlog::debug("RegistryStore: saved {} entr{} to {}", registry.size(),
                  registry.size() == 1 ? "y" : "ies", path_.string());
    return {};
}

Result<RegistryLock> RegistryStore::lock() const {
    fs::path lockPath = path_;
    lockPath += ".lock";
    int fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Error{ErrorCode::IOError,
                     "Cannot open lock file " + lockPath.string() + ": " + std::strerror(errno)};
    }
    while (::flock(fd, LOCK_EX) != 0) {
        if (errno == EINTR)
            continue;
        int err = errno;
        ::close(fd);
        return Error{ErrorCode::IOError,
                     "Cannot lock " + lockPath.string() + ": " + std::strerror(err)};
    }
    return RegistryLock{fd};
}

} // namespace mcpcmd::registry
