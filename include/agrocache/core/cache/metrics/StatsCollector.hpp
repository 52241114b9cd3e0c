#pragma once
#include <cstddef>
#include <cstdint>
#include "agrocache/core/cache/metrics/CacheStats.hpp"

namespace agrocache {
namespace core {
namespace cache {

// StatsCollector: счётчики операций. Синхронизация на стороне владельца (CacheManager).
class StatsCollector {
public:
    void recordHit() { ++hits_; }
    void recordMiss() { ++misses_; }
    void recordSet() { ++sets_; }
    void recordDelete() { ++deletes_; }
    void recordEviction() { ++evictions_; }
    void recordExpiration() { ++expirations_; }

    double hitRate() const;
    CacheStats snapshot(size_t itemsInMemory, size_t memoryUsageBytes, size_t maxMemoryBytes) const;
    void reset();

private:
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t sets_ = 0;
    uint64_t deletes_ = 0;
    uint64_t evictions_ = 0;
    uint64_t expirations_ = 0;
};

} // namespace cache
} // namespace core
} // namespace agrocache
