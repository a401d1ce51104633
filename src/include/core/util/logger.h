#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/spdlog.h>
#include <string_view>

namespace filerelay::core {

struct LoggerOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::filesystem::path log_dir;   // daily files named filerelay_YYYY-MM-DD.log
    std::size_t queue_size = 8192;   // async queue, producers block when full
    bool console = true;
};

// Process-wide async default logger writing to a daily file and the console.
// Construct once in main; destruction flushes and shuts spdlog down.
class Logger {
public:
    using Level = spdlog::level::level_enum;

    explicit Logger(const LoggerOptions& options);
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger();

    [[nodiscard]] Level level() const { return logger_->level(); }
    void set_level(Level level) { logger_->set_level(level); }

    const std::filesystem::path& log_dir() const { return log_dir_; }

    // "trace", "debug", "info", "warn", "error", "critical" or "off"
    static std::optional<Level> ParseLevel(std::string_view name);

private:
    std::filesystem::path log_dir_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::async_logger> logger_;
};

} // namespace filerelay::core
