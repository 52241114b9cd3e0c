#pragma once
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>
#include "agrocache/core/cache/eviction/EvictionStrategy.hpp"

namespace agrocache {
namespace core {
namespace cache {

// CacheConfig: параметры кэша (бюджет памяти, lifetime, storage, логирование)
struct CacheConfig {
    size_t maxMemoryBytes = 1024 * 1024 * 100; // Макс. размер в памяти (100 MB)
    size_t maxItems = 10000;                   // Макс. записей в памяти (0 = без лимита)
    std::chrono::seconds defaultTtl = std::chrono::seconds(3600); // TTL по умолчанию (1 час)
    std::chrono::milliseconds cleanupInterval = std::chrono::milliseconds(300000); // Интервал очистки (0 = выкл.)
    EvictionStrategy defaultStrategy = EvictionStrategy::LRU; // Для продвижения из хранилища
    bool enableCompression = false;            // Сжатие zlib в хранилище
    std::string storagePath = "./cache/agrocache.db"; // Путь к БД (пусто = только память)
    std::string logPath = "logs/agrocache.log"; // Лог-файл (пусто = только консоль)
    std::string logLevel = "info";
    size_t maxLogSize = 1024 * 1024 * 5;
    size_t maxLogFiles = 2;

    bool validate() const {
        return maxMemoryBytes > 0 && defaultTtl.count() > 0 && cleanupInterval.count() >= 0;
    }

    nlohmann::json toJson() const;
    static CacheConfig fromJson(const nlohmann::json& j); // Бросает ConfigError
    static CacheConfig loadFromFile(const std::string& path); // Бросает ConfigError
};

} // namespace cache
} // namespace core
} // namespace agrocache
