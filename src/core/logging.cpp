#include <mcpcmd/core/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace mcpcmd::logging {

void init_cli_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::get("mcp-cmd");
    if (!logger) {
        logger = spdlog::stderr_color_mt("mcp-cmd");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(level);
}

Result<void> init_worker_logging(const std::filesystem::path& logFile,
                                 spdlog::level::level_enum level) {
    try {
        std::error_code ec;
        std::filesystem::create_directories(logFile.parent_path(), ec);

        auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile.string(), kWorkerLogMaxBytes, kWorkerLogMaxFiles);
        auto logger = std::make_shared<spdlog::logger>("mcp-cmd-worker", rotating_sink);
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%l] %v");
        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
        return Error{ErrorCode::IOError,
                     "Cannot open worker log " + logFile.string() + ": " + e.what()};
    }

    spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", logFile.string(),
                 kWorkerLogMaxBytes / (1024 * 1024), kWorkerLogMaxFiles);
    return {};
}

} // namespace mcpcmd::logging
