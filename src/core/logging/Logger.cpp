#include "objcache/core/logging/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>

namespace objcache {
namespace core {
namespace logging {

namespace {

std::mutex& loggerMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger> createLogger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    try {
        std::filesystem::path path(config.logPath);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logPath, config.maxLogSize, config.maxLogFiles);
        rotating_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(rotating_sink);
    } catch (const std::exception& e) {
        // Без файла продолжаем только с консолью
        std::cerr << "objcache: cannot open log file " << config.logPath << ": " << e.what() << std::endl;
    }
    if (config.console || sinks.empty()) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);
    }
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

void initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(loggerMutex());
    spdlog::drop(LOGGER_NAME);
    auto logger = createLogger(config);
    spdlog::register_logger(logger);
    logger->debug("Logger initialized: path={}, maxSize={}, maxFiles={}",
                  config.logPath, config.maxLogSize, config.maxLogFiles);
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (auto logger = spdlog::get(LOGGER_NAME)) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(loggerMutex());
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = createLogger(LogConfig{});
        spdlog::register_logger(logger);
    }
    return logger;
}

} // namespace logging
} // namespace core
} // namespace objcache
