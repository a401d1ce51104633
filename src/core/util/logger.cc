#include <chrono>
#include <core/util/logger.h>
#include <cstdio>
#include <ctime>
#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <system_error>
#include <vector>

namespace filerelay::core {

namespace {

void StampFile(std::FILE* file, const char* what) {
    if (file == nullptr) {
        return;
    }
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::fprintf(file, "==== %s %s", what, std::ctime(&now));
}

spdlog::sink_ptr MakeFileSink(const std::filesystem::path& log_dir) {
    spdlog::file_event_handlers handlers;
    handlers.after_open = [](const spdlog::filename_t&, std::FILE* file) {
        StampFile(file, "log opened");
    };
    handlers.before_close = [](const spdlog::filename_t&, std::FILE* file) {
        StampFile(file, "log closed");
    };
    // Rotates at midnight, keeps the last two weeks
    return std::make_shared<spdlog::sinks::daily_file_sink_mt>((log_dir / "filerelay.log").string(),
                                                               0,
                                                               0,
                                                               false,
                                                               14,
                                                               handlers);
}

} // namespace

Logger::Logger(const LoggerOptions& options)
    : log_dir_(options.log_dir) {
    std::vector<spdlog::sink_ptr> sinks;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::fprintf(stderr,
                     "Cannot create log directory %s: %s\n",
                     log_dir_.string().c_str(),
                     ec.message().c_str());
    } else {
        sinks.push_back(MakeFileSink(log_dir_));
    }

    if (options.console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("\033[36m[%H:%M:%S.%e] \033[0m%^[%l]%$ %v");
        sinks.push_back(std::move(console));
    }

    thread_pool_ = std::make_shared<spdlog::details::thread_pool>(options.queue_size, 1);
    logger_ = std::make_shared<spdlog::async_logger>("filerelay",
                                                     sinks.begin(),
                                                     sinks.end(),
                                                     thread_pool_,
                                                     spdlog::async_overflow_policy::block);
    logger_->set_level(options.level);
    logger_->flush_on(Level::warn);
    logger_->set_error_handler([](const std::string& msg) {
        std::fprintf(stderr, "filerelay logger error: %s\n", msg.c_str());
    });
    spdlog::set_default_logger(logger_);
}

Logger::~Logger() {
    logger_->flush();
    spdlog::shutdown();
}

std::optional<Logger::Level> Logger::ParseLevel(std::string_view name) {
    auto level = spdlog::level::from_str(std::string(name));
    if (level == Level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

} // namespace filerelay::core
