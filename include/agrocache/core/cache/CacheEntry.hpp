#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include "agrocache/core/cache/eviction/EvictionStrategy.hpp"

namespace agrocache {
namespace core {
namespace cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Момент истечения с насыщением: now + ttl не выходит за TimePoint::max()
inline TimePoint expiryFor(TimePoint now, std::chrono::seconds ttl) {
    auto headroom = std::chrono::duration_cast<std::chrono::seconds>(TimePoint::max() - now);
    if (ttl >= headroom) {
        return TimePoint::max();
    }
    return now + ttl;
}

// EntryOptions: параметры записи для set/setMany
struct EntryOptions {
    std::optional<std::chrono::seconds> ttl;   // TTL (по умолчанию из конфига)
    std::optional<std::string> category;       // Категория для clear(category)
    std::set<std::string> tags;                // Теги для инвалидации
    EvictionStrategy strategy = EvictionStrategy::LRU;
};

// EntryMeta: учёт записи в памяти (доступ, размер, срок жизни)
struct EntryMeta {
    std::string key;            // Исходный ключ (для диагностики)
    size_t sizeBytes = 0;       // Размер сериализованного значения
    TimePoint createdAt;
    TimePoint accessedAt;
    uint64_t accessCount = 0;
    std::chrono::seconds ttl{0};
    TimePoint expiresAt;
    std::optional<std::string> category;
    std::set<std::string> tags;
    uint64_t insertSeq = 0;     // Порядок вставки
    uint64_t accessSeq = 0;     // Порядок последнего доступа

    bool isExpired(TimePoint now) const {
        return expiresAt <= now;
    }
};

} // namespace cache
} // namespace core
} // namespace agrocache
