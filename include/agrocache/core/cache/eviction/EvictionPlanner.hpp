#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "agrocache/core/cache/CacheEntry.hpp"
#include "agrocache/core/cache/eviction/EvictionStrategy.hpp"

namespace agrocache {
namespace core {
namespace cache {

// EvictionCandidate: учётные данные записи, находящейся в памяти
struct EvictionCandidate {
    std::string keyHash;
    size_t sizeBytes = 0;
    TimePoint createdAt;
    TimePoint accessedAt;
    TimePoint expiresAt;
    uint64_t accessCount = 0;
    uint64_t insertSeq = 0;
    uint64_t accessSeq = 0;
};

// EvictionPlan: префикс упорядоченного списка жертв
struct EvictionPlan {
    std::vector<std::string> victims;
    size_t bytesFreed = 0;
    bool satisfiable = false; // false: освободить нужное невозможно
};

// EvictionPlanner: порядок вытеснения по стратегии (LRU, LFU, FIFO, TTL)
class EvictionPlanner {
public:
    // Полный порядок: первый элемент вытесняется первым
    std::vector<EvictionCandidate> order(std::vector<EvictionCandidate> candidates,
                                         EvictionStrategy strategy) const;

    // Кратчайший префикс, освобождающий bytesToFree байт и itemsToFree записей
    EvictionPlan plan(std::vector<EvictionCandidate> candidates,
                      EvictionStrategy strategy,
                      size_t bytesToFree,
                      size_t itemsToFree) const;
};

} // namespace cache
} // namespace core
} // namespace agrocache
