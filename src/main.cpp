#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "agrocache/core/cache/CacheConfig.hpp"
#include "agrocache/core/cache/CacheErrors.hpp"
#include "agrocache/core/cache/manager/CacheManager.hpp"
#include "agrocache/core/logging/Logger.hpp"

using namespace agrocache::core;

namespace {

constexpr int kAreaCount = 4;
constexpr int kSensorsPerArea = 5;

// Конфигурация: файл из argv[1] или значения по умолчанию
cache::CacheConfig loadConfiguration(int argc, char* argv[]) {
    if (argc > 1) {
        return cache::CacheConfig::loadFromFile(argv[1]);
    }
    cache::CacheConfig config;
    config.storagePath = "./cache/agrocache_demo.db";
    config.cleanupInterval = std::chrono::milliseconds(1000);
    return config;
}

std::string sensorKey(int area, int sensor) {
    return "sensor:" + std::to_string(area) + ":" + std::to_string(sensor);
}

// Заполнить кэш показаниями датчиков по участкам
void populateReadings(cache::JsonCacheManager& manager) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> moisture(18.0, 42.0);
    std::uniform_real_distribution<double> temperature(9.0, 31.0);

    for (int area = 0; area < kAreaCount; ++area) {
        cache::EntryOptions options;
        options.category = "sensors";
        options.tags = {"area:" + std::to_string(area)};
        options.ttl = std::chrono::seconds(600);

        for (int sensor = 0; sensor < kSensorsPerArea; ++sensor) {
            nlohmann::json reading = {
                {"area", area},
                {"sensor", sensor},
                {"soilMoisture", moisture(rng)},
                {"temperature", temperature(rng)}
            };
            if (!manager.set(sensorKey(area, sensor), reading, options)) {
                spdlog::warn("[demo] Показание {} не сохранено", sensorKey(area, sensor));
            }
        }
    }

    cache::EntryOptions forecastOptions;
    forecastOptions.category = "forecast";
    forecastOptions.ttl = std::chrono::seconds(3600);
    manager.set("forecast:today", nlohmann::json{{"rainProbability", 0.35}, {"windSpeed", 4.2}}, forecastOptions);
}

void runDemo(cache::JsonCacheManager& manager) {
    populateReadings(manager);

    for (int area = 0; area < kAreaCount; ++area) {
        auto reading = manager.get(sensorKey(area, 0));
        if (reading) {
            spdlog::info("[demo] {} -> {}", sensorKey(area, 0), reading->dump());
        }
    }
    manager.get("sensor:missing");

    // Участок 1 перепахан: показания больше не актуальны
    size_t invalidated = manager.invalidateByTags({"area:1"});
    spdlog::info("[demo] Инвалидировано по тегу area:1: {}", invalidated);

    auto batch = manager.getMany({sensorKey(0, 1), sensorKey(1, 1), sensorKey(2, 1)});
    spdlog::info("[demo] getMany вернул {} из 3", batch.size());

    size_t cleared = manager.clear(std::string("forecast"));
    spdlog::info("[demo] Очищено в категории forecast: {}", cleared);

    std::cout << manager.getStats().toJson().dump(2) << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = loadConfiguration(argc, argv);

        logging::LoggerConfig loggerConfig;
        loggerConfig.logPath = config.logPath;
        loggerConfig.level = config.logLevel;
        loggerConfig.maxSize = config.maxLogSize;
        loggerConfig.maxFiles = config.maxLogFiles;
        auto logger = logging::initialize(loggerConfig);
        spdlog::set_default_logger(logger);

        spdlog::info("=== AgroCache demo starting ===");
        spdlog::info("Конфигурация: {}", config.toJson().dump());

        cache::JsonCacheManager manager(config);
        if (!manager.initialize()) {
            spdlog::critical("Не удалось инициализировать CacheManager");
            return 1;
        }
        spdlog::info("CacheManager готов (durable={})", manager.isDurable());

        runDemo(manager);

        manager.shutdown();
        spdlog::info("=== AgroCache demo shutdown complete ===");
        spdlog::shutdown();
        return 0;
    } catch (const cache::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (spdlog::get(logging::kLoggerName)) {
            spdlog::critical("Fatal error: {}", e.what());
        }
        return 1;
    }
}
