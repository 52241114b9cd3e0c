#include "agrocache/core/cache/eviction/EvictionPlanner.hpp"
#include <algorithm>
#include <tuple>

namespace agrocache {
namespace core {
namespace cache {

std::vector<EvictionCandidate> EvictionPlanner::order(std::vector<EvictionCandidate> candidates,
                                                      EvictionStrategy strategy) const {
    // LRU/LFU по монотонному порядку доступа; accessedAt только для хранилища
    auto lru = [](const EvictionCandidate& a, const EvictionCandidate& b) {
        return a.accessSeq < b.accessSeq;
    };
    auto lfu = [](const EvictionCandidate& a, const EvictionCandidate& b) {
        return std::tie(a.accessCount, a.accessSeq) < std::tie(b.accessCount, b.accessSeq);
    };
    // FIFO: строго по времени вставки, не по доступу
    auto fifo = [](const EvictionCandidate& a, const EvictionCandidate& b) {
        return std::tie(a.createdAt, a.insertSeq) < std::tie(b.createdAt, b.insertSeq);
    };
    auto ttl = [](const EvictionCandidate& a, const EvictionCandidate& b) {
        return std::tie(a.expiresAt, a.insertSeq) < std::tie(b.expiresAt, b.insertSeq);
    };

    switch (strategy) {
        case EvictionStrategy::LRU:
            std::sort(candidates.begin(), candidates.end(), lru);
            break;
        case EvictionStrategy::LFU:
            std::sort(candidates.begin(), candidates.end(), lfu);
            break;
        case EvictionStrategy::FIFO:
            std::sort(candidates.begin(), candidates.end(), fifo);
            break;
        case EvictionStrategy::TTL:
            std::sort(candidates.begin(), candidates.end(), ttl);
            break;
    }
    return candidates;
}

EvictionPlan EvictionPlanner::plan(std::vector<EvictionCandidate> candidates,
                                   EvictionStrategy strategy,
                                   size_t bytesToFree,
                                   size_t itemsToFree) const {
    EvictionPlan result;
    size_t itemsFreed = 0;
    if (bytesToFree == 0 && itemsToFree == 0) {
        result.satisfiable = true;
        return result;
    }

    for (const auto& candidate : order(std::move(candidates), strategy)) {
        result.victims.push_back(candidate.keyHash);
        result.bytesFreed += candidate.sizeBytes;
        ++itemsFreed;
        if (result.bytesFreed >= bytesToFree && itemsFreed >= itemsToFree) {
            result.satisfiable = true;
            return result;
        }
    }
    // Даже все кандидаты не освобождают нужного: ничего не вытесняем
    result.victims.clear();
    return result;
}

} // namespace cache
} // namespace core
} // namespace agrocache
