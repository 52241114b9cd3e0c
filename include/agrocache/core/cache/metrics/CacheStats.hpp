#pragma once
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace agrocache {
namespace core {
namespace cache {

// CacheStats: снимок статистики кэша (только чтение)
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t sets = 0;
    uint64_t deletes = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    double hitRate = 0.0;          // hits / (hits + misses), 0 без запросов
    size_t itemsInMemory = 0;
    size_t memoryUsageBytes = 0;
    size_t maxMemoryBytes = 0;

    nlohmann::json toJson() const {
        return {
            {"hits", hits},
            {"misses", misses},
            {"sets", sets},
            {"deletes", deletes},
            {"evictions", evictions},
            {"expirations", expirations},
            {"hitRate", hitRate},
            {"itemsInMemory", itemsInMemory},
            {"memoryUsageBytes", memoryUsageBytes},
            {"maxMemoryBytes", maxMemoryBytes}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace agrocache
