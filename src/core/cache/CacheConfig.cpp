#include "agrocache/core/cache/CacheConfig.hpp"
#include "agrocache/core/cache/CacheErrors.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace agrocache {
namespace core {
namespace cache {

nlohmann::json CacheConfig::toJson() const {
    return {
        {"maxMemoryBytes", maxMemoryBytes},
        {"maxItems", maxItems},
        {"defaultTtlSeconds", defaultTtl.count()},
        {"cleanupIntervalMs", cleanupInterval.count()},
        {"defaultStrategy", toString(defaultStrategy)},
        {"enableCompression", enableCompression},
        {"storagePath", storagePath},
        {"logPath", logPath},
        {"logLevel", logLevel},
        {"maxLogSize", maxLogSize},
        {"maxLogFiles", maxLogFiles}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Конфигурация кэша должна быть JSON-объектом");
    }

    CacheConfig config;
    try {
        config.maxMemoryBytes = j.value("maxMemoryBytes", config.maxMemoryBytes);
        config.maxItems = j.value("maxItems", config.maxItems);
        config.defaultTtl = std::chrono::seconds(
            j.value("defaultTtlSeconds", static_cast<int64_t>(config.defaultTtl.count())));
        config.cleanupInterval = std::chrono::milliseconds(
            j.value("cleanupIntervalMs", static_cast<int64_t>(config.cleanupInterval.count())));
        if (j.contains("defaultStrategy")) {
            config.defaultStrategy = strategyFromString(j["defaultStrategy"].get<std::string>());
        }
        config.enableCompression = j.value("enableCompression", config.enableCompression);
        config.storagePath = j.value("storagePath", config.storagePath);
        config.logPath = j.value("logPath", config.logPath);
        config.logLevel = j.value("logLevel", config.logLevel);
        config.maxLogSize = j.value("maxLogSize", config.maxLogSize);
        config.maxLogFiles = j.value("maxLogFiles", config.maxLogFiles);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Некорректное поле конфигурации: ") + e.what());
    }

    if (!config.validate()) {
        throw ConfigError("Некорректная конфигурация кэша");
    }
    return config;
}

CacheConfig CacheConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Не удалось открыть файл конфигурации: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Ошибка разбора " + path + ": " + e.what());
    }

    auto config = fromJson(j);
    spdlog::info("CacheConfig загружен из {}: maxMemoryBytes={}, maxItems={}",
                 path, config.maxMemoryBytes, config.maxItems);
    return config;
}

} // namespace cache
} // namespace core
} // namespace agrocache
