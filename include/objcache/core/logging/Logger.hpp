#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace objcache {
namespace core {
namespace logging {

// LogConfig — параметры логгера (файл, ротация, уровень)
struct LogConfig {
    std::string logPath = "logs/objcache.log";
    size_t maxLogSize = 1024 * 1024 * 5; // 5MB
    size_t maxLogFiles = 2;
    bool console = true;
    spdlog::level::level_enum level = spdlog::level::info;
};

constexpr const char* LOGGER_NAME = "objcache";

// Пересоздать логгер "objcache" с новой конфигурацией
void initialize(const LogConfig& config);

// Логгер "objcache"; создаётся с LogConfig{} при первом обращении
std::shared_ptr<spdlog::logger> getLogger();

} // namespace logging
} // namespace core
} // namespace objcache
