#include "agrocache/core/logging/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>

namespace agrocache {
namespace core {
namespace logging {

namespace {
std::mutex initMutex;
std::string activeLogPath;
}

std::shared_ptr<spdlog::logger> initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(initMutex);
    if (auto existing = spdlog::get(kLoggerName)) {
        // Логгер общий для процесса: уровень берётся из последней конфигурации, sinks остаются
        existing->set_level(spdlog::level::from_str(config.level));
        if (config.logPath != activeLogPath) {
            existing->warn("Логгер {} уже пишет в '{}', logPath='{}' не применён",
                           kLoggerName, activeLogPath, config.logPath);
        }
        return existing;
    }

    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);

    if (!config.logPath.empty()) {
        try {
            auto parent = std::filesystem::path(config.logPath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logPath, config.maxSize, config.maxFiles);
            rotating_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(rotating_sink);
            activeLogPath = config.logPath;
        } catch (const std::exception& e) {
            std::cerr << "Не удалось открыть лог-файл " << config.logPath << ": " << e.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    logger->info("Логгер {} инициализирован: file='{}', level={}", kLoggerName, config.logPath, config.level);
    return logger;
}

std::shared_ptr<spdlog::logger> get() {
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    return spdlog::default_logger();
}

} // namespace logging
} // namespace core
} // namespace agrocache
