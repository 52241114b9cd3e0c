#include "agrocache/core/cache/metrics/StatsCollector.hpp"

namespace agrocache {
namespace core {
namespace cache {

double StatsCollector::hitRate() const {
    auto total = hits_ + misses_;
    return total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
}

CacheStats StatsCollector::snapshot(size_t itemsInMemory, size_t memoryUsageBytes, size_t maxMemoryBytes) const {
    CacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.sets = sets_;
    stats.deletes = deletes_;
    stats.evictions = evictions_;
    stats.expirations = expirations_;
    stats.hitRate = hitRate();
    stats.itemsInMemory = itemsInMemory;
    stats.memoryUsageBytes = memoryUsageBytes;
    stats.maxMemoryBytes = maxMemoryBytes;
    return stats;
}

void StatsCollector::reset() {
    hits_ = misses_ = sets_ = deletes_ = evictions_ = expirations_ = 0;
}

} // namespace cache
} // namespace core
} // namespace agrocache
