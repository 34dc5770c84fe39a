#pragma once

#include <cstddef>
#include <filesystem>

#include <spdlog/common.h>

#include <mcpcmd/core/types.h>

namespace mcpcmd::logging {

inline constexpr std::size_t kWorkerLogMaxBytes = 5 * 1024 * 1024;
inline constexpr std::size_t kWorkerLogMaxFiles = 3;

// Default logger on stderr; stdout stays reserved for command output.
void init_cli_logging(spdlog::level::level_enum level);

// Rotating file logger for the detached worker, flushed on every info message.
Result<void> init_worker_logging(const std::filesystem::path& logFile,
                                 spdlog::level::level_enum level);

} // namespace mcpcmd::logging
