#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace agrocache {
namespace core {
namespace logging {

constexpr const char* kLoggerName = "agrocache";

struct LoggerConfig {
    std::string logPath = "logs/agrocache.log"; // Пусто = только консоль
    std::string level = "info";
    size_t maxSize = 1024 * 1024 * 5;
    size_t maxFiles = 2;
};

// Создаёт и регистрирует логгер "agrocache".
// Повторный вызов возвращает существующий логгер и применяет к нему config.level;
// logPath действует только при первом вызове.
std::shared_ptr<spdlog::logger> initialize(const LoggerConfig& config);

// Логгер "agrocache" или spdlog default, если он ещё не создан
std::shared_ptr<spdlog::logger> get();

} // namespace logging
} // namespace core
} // namespace agrocache
